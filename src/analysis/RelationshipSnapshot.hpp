//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_RELATIONSHIPSNAPSHOT_HPP
#define FIELDREL_RELATIONSHIPSNAPSHOT_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "CandidateField.hpp"

namespace fieldrel {
    /**
     * @brief a discovered relationship between two name-like fields of different sources.
     *
     * @note the underlying relationship is symmetric; "source" is the side with the larger
     *       distinct-value count (ties: the lexicographically smaller (file, field)).
     */
    struct RelationshipSnapshot {
        std::string sourceFile;
        std::string sourceField;
        std::string targetFile;
        std::string targetField;
        
        uint32_t matchCount = 0;
        
        double sourceCoverage = 0.0;
        double targetCoverage = 0.0;
        double confidence = 0.0;
        double nameSimilarity = 0.0;
        
        std::vector<std::string> samples;
        
        FieldRef sourceRef() const {
            return FieldRef { sourceFile, sourceField };
        }
        
        FieldRef targetRef() const {
            return FieldRef { targetFile, targetField };
        }
    };
}

#endif //FIELDREL_RELATIONSHIPSNAPSHOT_HPP
