//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_CANDIDATEFIELDEXTRACTOR_HPP
#define FIELDREL_CANDIDATEFIELDEXTRACTOR_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "source/DataSource.hpp"

#include "CandidateField.hpp"
#include "FieldNameFilter.hpp"
#include "SkippedSource.hpp"
#include "ValueIndex.hpp"

#include "utils/log.hpp"

namespace fieldrel {
    struct ExtractionResult {
        /**
         * sorted by (source, field)
         */
        CandidateFieldList fields;
        std::vector<SkippedSource> skippedSources;
        
        size_t sourcesScanned = 0;
        size_t overflowedFields = 0;
    };
    
    /**
     * @brief enumerates name-like fields of every data source and builds a ValueIndex for each.
     *
     * @details a source whose name() or fields() throws is skipped and reported in ExtractionResult::skippedSources;
     *          the remaining sources are still extracted.
     *          sources sharing the same name are merged, so each (source, field) yields at most one CandidateField.
     */
    class CandidateFieldExtractor {
    public:
        /**
         * invoked with the source name before each source is read. exceptions thrown from here are propagated as-is.
         */
        using SourceHook = std::function<void(const std::string &)>;
        
        struct Options {
            FieldNameFilter filter;
            ValueIndexBuilder::Limits limits;
        };
        
        CandidateFieldExtractor();
        explicit CandidateFieldExtractor(Options options);
        
        /**
         * @throws ProviderUnavailable if provider.listSources() fails
         */
        ExtractionResult extract(DataSourceProvider &provider, const SourceHook &beforeSource = nullptr) const;
        ExtractionResult extract(const std::vector<std::shared_ptr<DataSource>> &sources,
                                 const SourceHook &beforeSource = nullptr) const;
        
        /**
         * @throws SourceReadError (or whatever the source throws) if the source cannot be read
         */
        CandidateFieldList extractSource(const DataSource &source) const;
        
    private:
        LoggerPtr _logger;
        Options _options;
    };
}

#endif //FIELDREL_CANDIDATEFIELDEXTRACTOR_HPP
