//
// Created by fieldrel on 10/17/26.
//

#include <ctime>
#include <tuple>

#include "RelationshipReport.hpp"

namespace fieldrel {
    namespace {
        std::string formatTimestamp(std::chrono::system_clock::time_point timePoint) {
            auto time = std::chrono::system_clock::to_time_t(timePoint);
            std::tm tm {};
            gmtime_r(&time, &tm);
            
            char buffer[32];
            if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
                return {};
            }
            
            return std::string(buffer);
        }
    }
    
    bool RelationshipReport::snapshotOrder(const RelationshipSnapshot &lhs, const RelationshipSnapshot &rhs) {
        if (lhs.confidence != rhs.confidence) {
            return lhs.confidence > rhs.confidence;
        }
        
        if (lhs.matchCount != rhs.matchCount) {
            return lhs.matchCount > rhs.matchCount;
        }
        
        return std::tie(lhs.sourceFile, lhs.sourceField, lhs.targetFile, lhs.targetField) <
               std::tie(rhs.sourceFile, rhs.sourceField, rhs.targetFile, rhs.targetField);
    }
    
    RelationshipReport::RelationshipReport(std::vector<RelationshipSnapshot> snapshots,
                                           ReportMetadata metadata,
                                           std::vector<std::vector<FieldRef>> entityGroups):
        _snapshots(std::move(snapshots)),
        _metadata(std::move(metadata)),
        _entityGroups(std::move(entityGroups))
    {
    }
    
    const std::vector<RelationshipSnapshot> &RelationshipReport::snapshots() const {
        return _snapshots;
    }
    
    const ReportMetadata &RelationshipReport::metadata() const {
        return _metadata;
    }
    
    const std::vector<std::vector<FieldRef>> &RelationshipReport::entityGroups() const {
        return _entityGroups;
    }
    
    size_t RelationshipReport::sourcesScanned() const {
        return _metadata.sourcesScanned;
    }
    
    size_t RelationshipReport::candidateFieldsFound() const {
        return _metadata.candidateFields;
    }
    
    std::chrono::milliseconds RelationshipReport::elapsed() const {
        return _metadata.elapsed;
    }
    
    const std::vector<SkippedSource> &RelationshipReport::skippedSources() const {
        return _metadata.skippedSources;
    }
    
    bool RelationshipReport::empty() const {
        return _snapshots.empty();
    }
    
    nlohmann::json RelationshipReport::toJson() const {
        using nlohmann::json;
        
        json root = json::object();
        root["generated_at"] = formatTimestamp(_metadata.generatedAt);
        root["elapsed_ms"] = _metadata.elapsed.count();
        root["sources_scanned"] = _metadata.sourcesScanned;
        root["candidate_fields"] = _metadata.candidateFields;
        root["overflowed_fields"] = _metadata.overflowedFields;
        root["pairs_evaluated"] = _metadata.pairsEvaluated;
        root["relationship_count"] = _snapshots.size();
        
        json skipped = json::array();
        for (const auto &entry: _metadata.skippedSources) {
            skipped.push_back({
                { "source", entry.source },
                { "reason", entry.reason }
            });
        }
        root["skipped_sources"] = std::move(skipped);
        
        json relationships = json::array();
        for (const auto &snapshot: _snapshots) {
            relationships.push_back({
                { "source_file", snapshot.sourceFile },
                { "source_field", snapshot.sourceField },
                { "target_file", snapshot.targetFile },
                { "target_field", snapshot.targetField },
                { "match_count", snapshot.matchCount },
                { "source_coverage", snapshot.sourceCoverage },
                { "target_coverage", snapshot.targetCoverage },
                { "confidence", snapshot.confidence },
                { "name_similarity", snapshot.nameSimilarity },
                { "sample_values", snapshot.samples }
            });
        }
        root["relationships"] = std::move(relationships);
        
        json groups = json::array();
        for (const auto &group: _entityGroups) {
            json members = json::array();
            for (const auto &member: group) {
                members.push_back(member.toString());
            }
            groups.push_back(std::move(members));
        }
        root["entity_groups"] = std::move(groups);
        
        return root;
    }
}
