//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_RELATIONSHIPREPORT_HPP
#define FIELDREL_RELATIONSHIPREPORT_HPP

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "CandidateField.hpp"
#include "RelationshipSnapshot.hpp"
#include "SkippedSource.hpp"

namespace fieldrel {
    struct ReportMetadata {
        size_t sourcesScanned = 0;
        size_t candidateFields = 0;
        size_t overflowedFields = 0;
        size_t pairsEvaluated = 0;
        
        std::chrono::milliseconds elapsed { 0 };
        std::chrono::system_clock::time_point generatedAt;
        
        std::vector<SkippedSource> skippedSources;
    };
    
    /**
     * @brief immutable result of a single successful analysis run.
     */
    class RelationshipReport {
    public:
        /**
         * @brief report ordering: confidence desc, matchCount desc, then (sourceFile, sourceField, targetFile, targetField) asc
         */
        static bool snapshotOrder(const RelationshipSnapshot &lhs, const RelationshipSnapshot &rhs);
        
        RelationshipReport(std::vector<RelationshipSnapshot> snapshots,
                           ReportMetadata metadata,
                           std::vector<std::vector<FieldRef>> entityGroups);
        
        const std::vector<RelationshipSnapshot> &snapshots() const;
        const ReportMetadata &metadata() const;
        const std::vector<std::vector<FieldRef>> &entityGroups() const;
        
        size_t sourcesScanned() const;
        size_t candidateFieldsFound() const;
        std::chrono::milliseconds elapsed() const;
        const std::vector<SkippedSource> &skippedSources() const;
        
        bool empty() const;
        
        nlohmann::json toJson() const;
        
    private:
        std::vector<RelationshipSnapshot> _snapshots;
        ReportMetadata _metadata;
        std::vector<std::vector<FieldRef>> _entityGroups;
    };
}

#endif //FIELDREL_RELATIONSHIPREPORT_HPP
