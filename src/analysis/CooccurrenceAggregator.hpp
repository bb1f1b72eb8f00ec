//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_COOCCURRENCEAGGREGATOR_HPP
#define FIELDREL_COOCCURRENCEAGGREGATOR_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "CandidateField.hpp"

#include "utils/log.hpp"

namespace fieldrel {
    /**
     * @brief two candidate fields of different sources sharing at least one normalized value.
     */
    struct PairMatch {
        /**
         * first->ref() < second->ref()
         */
        CandidateFieldPtr first;
        CandidateFieldPtr second;
        
        /**
         * exact size of the intersection of both distinct value sets
         */
        uint32_t matchCount = 0;
        
        /**
         * lexicographically smallest shared values, ascending, at most Options::sampleSize entries
         */
        std::vector<std::string> samples;
    };
    
    /**
     * @brief derives exact pairwise intersection sizes through a single inverted-index pass.
     *
     * @details
     * <pre>
     *   item.name      = { "shield", "sword of fire" }
     *   drop.item_name = { "potion", "shield", "sword of fire" }
     *
     *   inverted index:
     *     "potion"        -> [ drop.item_name ]
     *     "shield"        -> [ item.name, drop.item_name ]
     *     "sword of fire" -> [ item.name, drop.item_name ]
     *
     *   => (drop.item_name, item.name) matchCount = 2
     * </pre>
     * every bucket holding k >= 2 fields contributes to its k * (k - 1) / 2 pairs;
     * pairs of fields from the same source are never recorded.
     *
     * the pairing step is sharded over Options::threadCount workers, each accumulating
     * into its own partial map which is merged on the calling thread.
     */
    class CooccurrenceAggregator {
    public:
        struct Options {
            size_t sampleSize = 5;
            
            /**
             * 0 = std::thread::hardware_concurrency()
             */
            int threadCount = 1;
        };
        
        CooccurrenceAggregator();
        explicit CooccurrenceAggregator(Options options);
        
        /**
         * @return one PairMatch per qualifying pair, ordered by (first->ref(), second->ref())
         */
        std::vector<PairMatch> aggregate(const CandidateFieldList &fields) const;
        
    private:
        using PairKey = uint64_t;
        using InvertedIndex = std::unordered_map<std::string_view, std::vector<uint32_t>>;
        using Bucket = InvertedIndex::value_type;
        
        struct PairAccumulator {
            uint32_t matchCount = 0;
            std::vector<std::string_view> samples;
        };
        
        using PairMap = std::unordered_map<PairKey, PairAccumulator>;
        
        static PairKey makePairKey(uint32_t a, uint32_t b);
        static void offerSample(std::vector<std::string_view> &samples, std::string_view value, size_t limit);
        
        InvertedIndex buildInvertedIndex(const CandidateFieldList &fields) const;
        
        PairMap pairBuckets(const std::vector<const Bucket *> &buckets, size_t shardIndex, size_t shardCount,
                            const std::vector<uint32_t> &sourceIds) const;
        
        void mergeInto(PairMap &target, PairMap &&partial) const;
        
        int resolveThreadCount() const;
        
        LoggerPtr _logger;
        Options _options;
    };
}

#endif //FIELDREL_COOCCURRENCEAGGREGATOR_HPP
