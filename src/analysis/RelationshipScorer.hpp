//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_RELATIONSHIPSCORER_HPP
#define FIELDREL_RELATIONSHIPSCORER_HPP

#include <optional>
#include <string>

#include "CooccurrenceAggregator.hpp"
#include "RelationshipSnapshot.hpp"

namespace fieldrel {
    /**
     * @brief turns a PairMatch into a scored RelationshipSnapshot.
     *
     * @details
     *   coverage(X)    = matchCount / X.distinctCount
     *   nameSimilarity = Jaccard(tokens(A.field), tokens(B.field))
     *   confidence     = min(coverage(A), coverage(B)) * (0.7 + 0.3 * nameSimilarity)
     */
    class RelationshipScorer {
    public:
        static constexpr double COVERAGE_WEIGHT = 0.7;
        static constexpr double NAME_SIMILARITY_WEIGHT = 0.3;
        
        struct Options {
            uint32_t minMatchCount = 2;
            double minConfidence = 0.3;
        };
        
        static double nameSimilarity(const std::string &lhs, const std::string &rhs);
        static double confidence(double sourceCoverage, double targetCoverage, double nameSimilarity);
        
        RelationshipScorer();
        explicit RelationshipScorer(Options options);
        
        /**
         * @return std::nullopt if the pair falls below minMatchCount or minConfidence
         */
        std::optional<RelationshipSnapshot> score(const PairMatch &pairMatch) const;
        
    private:
        Options _options;
    };
}

#endif //FIELDREL_RELATIONSHIPSCORER_HPP
