//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_CANDIDATEFIELD_HPP
#define FIELDREL_CANDIDATEFIELD_HPP

#include <memory>
#include <string>
#include <vector>

#include "ValueIndex.hpp"

namespace fieldrel {
    struct FieldRef {
        std::string source;
        std::string field;
        
        std::string toString() const;
        
        bool operator==(const FieldRef &other) const;
        bool operator!=(const FieldRef &other) const;
        bool operator<(const FieldRef &other) const;
    };
    
    /**
     * @brief a (source, field) pair accepted by the name filter, together with its value index.
     */
    class CandidateField {
    public:
        CandidateField(std::string sourceName, std::string fieldName, ValueIndex index);
        
        const std::string &sourceName() const;
        const std::string &fieldName() const;
        FieldRef ref() const;
        
        const ValueIndex &index() const;
        size_t distinctCount() const;
        
        bool sameSource(const CandidateField &other) const;
        
    private:
        std::string _sourceName;
        std::string _fieldName;
        ValueIndex _index;
    };
    
    using CandidateFieldPtr = std::shared_ptr<const CandidateField>;
    using CandidateFieldList = std::vector<CandidateFieldPtr>;
}

#endif //FIELDREL_CANDIDATEFIELD_HPP
