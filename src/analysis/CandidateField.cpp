//
// Created by fieldrel on 10/17/26.
//

#include <tuple>

#include "CandidateField.hpp"

namespace fieldrel {
    std::string FieldRef::toString() const {
        return source + "::" + field;
    }
    
    bool FieldRef::operator==(const FieldRef &other) const {
        return source == other.source && field == other.field;
    }
    
    bool FieldRef::operator!=(const FieldRef &other) const {
        return !(*this == other);
    }
    
    bool FieldRef::operator<(const FieldRef &other) const {
        return std::tie(source, field) < std::tie(other.source, other.field);
    }
    
    CandidateField::CandidateField(std::string sourceName, std::string fieldName, ValueIndex index):
        _sourceName(std::move(sourceName)),
        _fieldName(std::move(fieldName)),
        _index(std::move(index))
    {
    }
    
    const std::string &CandidateField::sourceName() const {
        return _sourceName;
    }
    
    const std::string &CandidateField::fieldName() const {
        return _fieldName;
    }
    
    FieldRef CandidateField::ref() const {
        return FieldRef { _sourceName, _fieldName };
    }
    
    const ValueIndex &CandidateField::index() const {
        return _index;
    }
    
    size_t CandidateField::distinctCount() const {
        return _index.distinctCount();
    }
    
    bool CandidateField::sameSource(const CandidateField &other) const {
        return _sourceName == other._sourceName;
    }
}
