//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_ANALYSISOPTIONS_HPP
#define FIELDREL_ANALYSISOPTIONS_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "FieldNameFilter.hpp"

namespace fieldrel {
    struct AnalysisOptions {
        /**
         * called synchronously on the analysis thread with the name of the source about to be scanned
         */
        std::function<void(const std::string &)> progressCallback;
        
        /**
         * polled before each source, before aggregation and before scoring
         */
        std::function<bool()> cancellationPredicate;
        
        uint32_t minMatchCount = 2;
        double minConfidence = 0.3;
        
        size_t sampleSize = 5;
        
        /**
         * a snapshot is kept while it ranks within the first N for either of its two fields. 0 = unlimited
         */
        size_t maxRelationshipsPerField = 0;
        
        size_t maxValueLength = 256;
        size_t maxDistinctValuesPerField = 120000;
        
        /**
         * 0 = std::thread::hardware_concurrency()
         */
        int threadCount = 1;
        
        std::vector<std::string> fieldPatterns = FieldNameFilter::defaultPatterns();
    };
}

#endif //FIELDREL_ANALYSISOPTIONS_HPP
