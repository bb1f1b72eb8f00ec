//
// Created by fieldrel on 10/17/26.
//

#include "ValueIndex.hpp"

#include "utils/StringUtil.hpp"

namespace fieldrel {
    size_t ValueIndex::distinctCount() const {
        return _counts.size();
    }
    
    uint64_t ValueIndex::totalCount() const {
        return _totalCount;
    }
    
    bool ValueIndex::empty() const {
        return _counts.empty();
    }
    
    bool ValueIndex::contains(const std::string &normalizedValue) const {
        return _counts.find(normalizedValue) != _counts.end();
    }
    
    uint32_t ValueIndex::count(const std::string &normalizedValue) const {
        auto it = _counts.find(normalizedValue);
        if (it == _counts.end()) {
            return 0;
        }
        
        return it->second;
    }
    
    const ValueIndex::CountMap &ValueIndex::values() const {
        return _counts;
    }
    
    ValueIndexBuilder::ValueIndexBuilder():
        ValueIndexBuilder(Limits {})
    {
    }
    
    ValueIndexBuilder::ValueIndexBuilder(Limits limits):
        _limits(limits)
    {
    }
    
    void ValueIndexBuilder::add(const RawValue &rawValue) {
        if (!rawValue.has_value()) {
            _blankCount++;
            return;
        }
        
        auto value = utility::normalizeValue(*rawValue);
        if (value.empty()) {
            _blankCount++;
            return;
        }
        
        if (_limits.maxValueLength > 0 && value.size() > _limits.maxValueLength) {
            _ignoredCount++;
            return;
        }
        
        if (_overflow) {
            return;
        }
        
        auto it = _index._counts.find(value);
        if (it == _index._counts.end()) {
            if (_limits.maxDistinctValues > 0 && _index._counts.size() >= _limits.maxDistinctValues) {
                _overflow = true;
                return;
            }
            
            _index._counts.emplace(std::move(value), 1);
        } else {
            it->second++;
        }
        
        _index._totalCount++;
    }
    
    void ValueIndexBuilder::addAll(const RawValueList &rawValues) {
        for (const auto &rawValue: rawValues) {
            add(rawValue);
        }
    }
    
    uint64_t ValueIndexBuilder::blankCount() const {
        return _blankCount;
    }
    
    uint64_t ValueIndexBuilder::ignoredCount() const {
        return _ignoredCount;
    }
    
    bool ValueIndexBuilder::isOverflow() const {
        return _overflow;
    }
    
    ValueIndex ValueIndexBuilder::build() && {
        return std::move(_index);
    }
}
