//
// Created by fieldrel on 10/17/26.
//

#include <algorithm>
#include <future>
#include <map>
#include <memory>
#include <thread>
#include <tuple>

#include "CooccurrenceAggregator.hpp"

#include "base/TaskExecutor.hpp"

namespace fieldrel {
    namespace {
        bool refLess(const CandidateField &lhs, const CandidateField &rhs) {
            return std::tie(lhs.sourceName(), lhs.fieldName()) < std::tie(rhs.sourceName(), rhs.fieldName());
        }
    }
    
    CooccurrenceAggregator::CooccurrenceAggregator():
        CooccurrenceAggregator(Options {})
    {
    }
    
    CooccurrenceAggregator::CooccurrenceAggregator(Options options):
        _logger(createLogger("CooccurrenceAggregator")),
        _options(options)
    {
    }
    
    CooccurrenceAggregator::PairKey CooccurrenceAggregator::makePairKey(uint32_t a, uint32_t b) {
        if (a > b) {
            std::swap(a, b);
        }
        
        return (static_cast<PairKey>(a) << 32) | static_cast<PairKey>(b);
    }
    
    void CooccurrenceAggregator::offerSample(std::vector<std::string_view> &samples, std::string_view value, size_t limit) {
        if (limit == 0) {
            return;
        }
        
        if (samples.size() >= limit && !(value < samples.back())) {
            return;
        }
        
        samples.insert(std::upper_bound(samples.begin(), samples.end(), value), value);
        
        if (samples.size() > limit) {
            samples.pop_back();
        }
    }
    
    CooccurrenceAggregator::InvertedIndex CooccurrenceAggregator::buildInvertedIndex(const CandidateFieldList &fields) const {
        InvertedIndex invertedIndex;
        
        for (uint32_t fieldId = 0; fieldId < fields.size(); fieldId++) {
            for (const auto &pair: fields[fieldId]->index().values()) {
                invertedIndex[std::string_view(pair.first)].push_back(fieldId);
            }
        }
        
        return invertedIndex;
    }
    
    CooccurrenceAggregator::PairMap CooccurrenceAggregator::pairBuckets(const std::vector<const Bucket *> &buckets,
                                                                        size_t shardIndex, size_t shardCount,
                                                                        const std::vector<uint32_t> &sourceIds) const {
        PairMap pairMap;
        
        for (size_t i = shardIndex; i < buckets.size(); i += shardCount) {
            const auto &value = buckets[i]->first;
            const auto &fieldIds = buckets[i]->second;
            
            for (size_t a = 0; a < fieldIds.size(); a++) {
                for (size_t b = a + 1; b < fieldIds.size(); b++) {
                    if (sourceIds[fieldIds[a]] == sourceIds[fieldIds[b]]) {
                        continue;
                    }
                    
                    auto &accumulator = pairMap[makePairKey(fieldIds[a], fieldIds[b])];
                    accumulator.matchCount++;
                    offerSample(accumulator.samples, value, _options.sampleSize);
                }
            }
        }
        
        return pairMap;
    }
    
    void CooccurrenceAggregator::mergeInto(PairMap &target, PairMap &&partial) const {
        if (target.empty()) {
            target = std::move(partial);
            return;
        }
        
        for (auto &pair: partial) {
            auto &accumulator = target[pair.first];
            accumulator.matchCount += pair.second.matchCount;
            
            for (const auto &sample: pair.second.samples) {
                offerSample(accumulator.samples, sample, _options.sampleSize);
            }
        }
    }
    
    int CooccurrenceAggregator::resolveThreadCount() const {
        if (_options.threadCount > 0) {
            return _options.threadCount;
        }
        
        return std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
    }
    
    std::vector<PairMatch> CooccurrenceAggregator::aggregate(const CandidateFieldList &fields) const {
        std::vector<PairMatch> matches;
        
        if (fields.size() < 2) {
            return matches;
        }
        
        std::vector<uint32_t> sourceIds(fields.size());
        {
            std::map<std::string, uint32_t> sourceIdMap;
            for (size_t i = 0; i < fields.size(); i++) {
                auto it = sourceIdMap.emplace(fields[i]->sourceName(), static_cast<uint32_t>(sourceIdMap.size())).first;
                sourceIds[i] = it->second;
            }
        }
        
        auto invertedIndex = buildInvertedIndex(fields);
        
        std::vector<const Bucket *> buckets;
        for (const auto &bucket: invertedIndex) {
            if (bucket.second.size() >= 2) {
                buckets.push_back(&bucket);
            }
        }
        
        _logger->debug("inverted index: {} distinct value(s), {} shared bucket(s)", invertedIndex.size(), buckets.size());
        
        PairMap pairMap;
        const auto threadCount = std::min(static_cast<size_t>(resolveThreadCount()), std::max<size_t>(buckets.size(), 1));
        
        if (threadCount <= 1) {
            pairMap = pairBuckets(buckets, 0, 1, sourceIds);
        } else {
            TaskExecutor executor(static_cast<int>(threadCount));
            std::vector<std::future<PairMap>> futures;
            futures.reserve(threadCount);
            
            for (size_t shard = 0; shard < threadCount; shard++) {
                auto promise = executor.post<PairMap>([this, &buckets, &sourceIds, shard, threadCount]() {
                    return pairBuckets(buckets, shard, threadCount, sourceIds);
                });
                futures.push_back(promise->get_future());
            }
            
            for (size_t shard = 0; shard < futures.size(); shard++) {
                auto partial = futures[shard].get();
                _logger->trace("shard #{} produced {} pair(s)", shard, partial.size());
                mergeInto(pairMap, std::move(partial));
            }
        }
        
        matches.reserve(pairMap.size());
        
        for (auto &pair: pairMap) {
            auto a = static_cast<uint32_t>(pair.first >> 32);
            auto b = static_cast<uint32_t>(pair.first & 0xffffffffULL);
            
            PairMatch match;
            match.first = fields[a];
            match.second = fields[b];
            if (refLess(*match.second, *match.first)) {
                std::swap(match.first, match.second);
            }
            
            match.matchCount = pair.second.matchCount;
            match.samples.assign(pair.second.samples.begin(), pair.second.samples.end());
            
            matches.push_back(std::move(match));
        }
        
        std::sort(matches.begin(), matches.end(), [](const PairMatch &lhs, const PairMatch &rhs) {
            if (refLess(*lhs.first, *rhs.first)) {
                return true;
            }
            if (refLess(*rhs.first, *lhs.first)) {
                return false;
            }
            return refLess(*lhs.second, *rhs.second);
        });
        
        return matches;
    }
}
