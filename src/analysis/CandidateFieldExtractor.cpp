//
// Created by fieldrel on 10/17/26.
//

#include <map>

#include "CandidateFieldExtractor.hpp"

#include "AnalysisErrors.hpp"

namespace fieldrel {
    namespace {
        using BuilderMap = std::map<FieldRef, ValueIndexBuilder>;
        
        void collectFields(const std::string &sourceName, const FieldMap &fieldMap,
                           const FieldNameFilter &filter, const ValueIndexBuilder::Limits &limits,
                           BuilderMap &builders) {
            for (const auto &pair: fieldMap) {
                const auto &fieldName = pair.first;
                if (!filter(fieldName)) {
                    continue;
                }
                
                auto it = builders.find(FieldRef { sourceName, fieldName });
                if (it == builders.end()) {
                    it = builders.emplace(FieldRef { sourceName, fieldName }, ValueIndexBuilder(limits)).first;
                }
                
                it->second.addAll(pair.second);
            }
        }
    }
    
    CandidateFieldExtractor::CandidateFieldExtractor():
        CandidateFieldExtractor(Options {})
    {
    }
    
    CandidateFieldExtractor::CandidateFieldExtractor(Options options):
        _logger(createLogger("CandidateFieldExtractor")),
        _options(std::move(options))
    {
    }
    
    ExtractionResult CandidateFieldExtractor::extract(DataSourceProvider &provider, const SourceHook &beforeSource) const {
        return extract(provider.listSources(), beforeSource);
    }
    
    ExtractionResult CandidateFieldExtractor::extract(const std::vector<std::shared_ptr<DataSource>> &sources,
                                                      const SourceHook &beforeSource) const {
        ExtractionResult result;
        BuilderMap builders;
        
        for (size_t position = 0; position < sources.size(); position++) {
            const auto &source = sources[position];
            if (source == nullptr) {
                continue;
            }
            
            result.sourcesScanned++;
            
            std::string sourceName;
            try {
                sourceName = source->name();
            } catch (const std::exception &e) {
                sourceName = "#" + std::to_string(position);
                _logger->warn("skipping source {}: cannot resolve name: {}", sourceName, e.what());
                result.skippedSources.push_back(SkippedSource { sourceName, e.what() });
                continue;
            }
            
            if (beforeSource) {
                beforeSource(sourceName);
            }
            
            FieldMap fieldMap;
            try {
                fieldMap = source->fields();
            } catch (const SourceReadError &e) {
                _logger->warn("skipping source {}: {}", sourceName, e.reason());
                result.skippedSources.push_back(SkippedSource { sourceName, e.reason() });
                continue;
            } catch (const std::exception &e) {
                _logger->warn("skipping source {}: {}", sourceName, e.what());
                result.skippedSources.push_back(SkippedSource { sourceName, e.what() });
                continue;
            }
            
            _logger->trace("source {} has {} field(s)", sourceName, fieldMap.size());
            collectFields(sourceName, fieldMap, _options.filter, _options.limits, builders);
        }
        
        for (auto &pair: builders) {
            const auto &ref = pair.first;
            auto &builder = pair.second;
            
            if (builder.isOverflow()) {
                _logger->warn("dropping {}: more than {} distinct values",
                              ref.toString(), _options.limits.maxDistinctValues);
                result.overflowedFields++;
                continue;
            }
            
            if (builder.ignoredCount() > 0) {
                _logger->debug("{}: ignored {} value(s) longer than {} characters",
                               ref.toString(), builder.ignoredCount(), _options.limits.maxValueLength);
            }
            
            auto index = std::move(builder).build();
            if (index.empty()) {
                continue;
            }
            
            result.fields.push_back(std::make_shared<CandidateField>(ref.source, ref.field, std::move(index)));
        }
        
        return result;
    }
    
    CandidateFieldList CandidateFieldExtractor::extractSource(const DataSource &source) const {
        BuilderMap builders;
        CandidateFieldList fields;
        
        const auto sourceName = source.name();
        collectFields(sourceName, source.fields(), _options.filter, _options.limits, builders);
        
        for (auto &pair: builders) {
            if (pair.second.isOverflow()) {
                continue;
            }
            
            auto index = std::move(pair.second).build();
            if (index.empty()) {
                continue;
            }
            
            fields.push_back(std::make_shared<CandidateField>(pair.first.source, pair.first.field, std::move(index)));
        }
        
        return fields;
    }
}
