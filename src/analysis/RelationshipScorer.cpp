//
// Created by fieldrel on 10/17/26.
//

#include <algorithm>
#include <set>

#include "RelationshipScorer.hpp"

#include "utils/StringUtil.hpp"

namespace fieldrel {
    double RelationshipScorer::nameSimilarity(const std::string &lhs, const std::string &rhs) {
        auto lhsTokens = utility::tokenizeIdentifier(lhs);
        auto rhsTokens = utility::tokenizeIdentifier(rhs);
        
        std::set<std::string> left(lhsTokens.begin(), lhsTokens.end());
        std::set<std::string> right(rhsTokens.begin(), rhsTokens.end());
        
        if (left.empty() || right.empty()) {
            return 0.0;
        }
        
        size_t intersection = 0;
        for (const auto &token: left) {
            if (right.find(token) != right.end()) {
                intersection++;
            }
        }
        
        size_t unionSize = left.size() + right.size() - intersection;
        
        return static_cast<double>(intersection) / static_cast<double>(unionSize);
    }
    
    double RelationshipScorer::confidence(double sourceCoverage, double targetCoverage, double nameSimilarity) {
        double value = std::min(sourceCoverage, targetCoverage) *
                       (COVERAGE_WEIGHT + NAME_SIMILARITY_WEIGHT * nameSimilarity);
        
        return std::clamp(value, 0.0, 1.0);
    }
    
    RelationshipScorer::RelationshipScorer():
        RelationshipScorer(Options {})
    {
    }
    
    RelationshipScorer::RelationshipScorer(Options options):
        _options(options)
    {
    }
    
    std::optional<RelationshipSnapshot> RelationshipScorer::score(const PairMatch &pairMatch) const {
        if (pairMatch.first == nullptr || pairMatch.second == nullptr) {
            return std::nullopt;
        }
        
        if (pairMatch.matchCount == 0 || pairMatch.matchCount < _options.minMatchCount) {
            return std::nullopt;
        }
        
        const CandidateField *source = pairMatch.first.get();
        const CandidateField *target = pairMatch.second.get();
        
        if (target->distinctCount() > source->distinctCount() ||
            (target->distinctCount() == source->distinctCount() && target->ref() < source->ref())) {
            std::swap(source, target);
        }
        
        if (source->distinctCount() == 0 || target->distinctCount() == 0) {
            return std::nullopt;
        }
        
        RelationshipSnapshot snapshot;
        snapshot.sourceFile = source->sourceName();
        snapshot.sourceField = source->fieldName();
        snapshot.targetFile = target->sourceName();
        snapshot.targetField = target->fieldName();
        snapshot.matchCount = pairMatch.matchCount;
        
        snapshot.sourceCoverage = std::min(1.0, static_cast<double>(pairMatch.matchCount) / source->distinctCount());
        snapshot.targetCoverage = std::min(1.0, static_cast<double>(pairMatch.matchCount) / target->distinctCount());
        snapshot.nameSimilarity = nameSimilarity(source->fieldName(), target->fieldName());
        snapshot.confidence = confidence(snapshot.sourceCoverage, snapshot.targetCoverage, snapshot.nameSimilarity);
        
        if (snapshot.confidence < _options.minConfidence) {
            return std::nullopt;
        }
        
        snapshot.samples = pairMatch.samples;
        
        return snapshot;
    }
}
