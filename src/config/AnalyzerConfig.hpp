//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_CONFIG_ANALYZERCONFIG_HPP
#define FIELDREL_CONFIG_ANALYZERCONFIG_HPP

#include <optional>
#include <string>
#include <vector>

#include "analysis/AnalysisOptions.hpp"

namespace fieldrel::config {

    struct SourceConfig {
        std::string directory;  // falls back to FIELDREL_SOURCE_DIR
        bool recursive = true;
    };

    struct ThresholdConfig {
        int minMatchCount = 2;
        double minConfidence = 0.3;
    };

    struct FieldFilterConfig {
        std::vector<std::string> patterns = FieldNameFilter::defaultPatterns();
    };

    struct LimitConfig {
        int sampleSize = 5;
        int maxRelationshipsPerField = 0;  // 0 = unlimited
        int maxValueLength = 256;
        int maxDistinctValuesPerField = 120000;
    };

    struct AggregationConfig {
        int threadCount = 0;  // 0 = auto
    };

    struct AnalyzerConfig {
        SourceConfig source;
        ThresholdConfig thresholds;
        FieldFilterConfig fieldFilter;
        LimitConfig limits;
        AggregationConfig aggregation;

        /**
         * @note progressCallback / cancellationPredicate are left empty; the caller wires them
         */
        AnalysisOptions makeAnalysisOptions() const;

        static std::optional<AnalyzerConfig> loadFromFile(const std::string &path);
        static std::optional<AnalyzerConfig> loadFromString(const std::string &jsonStr);
    };

} // namespace fieldrel::config

#endif // FIELDREL_CONFIG_ANALYZERCONFIG_HPP
