//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_VALUEINDEX_HPP
#define FIELDREL_VALUEINDEX_HPP

#include <cstdint>
#include <string>
#include <unordered_map>

#include "source/DataSource.hpp"

namespace fieldrel {
    class ValueIndexBuilder;
    
    /**
     * @brief normalized value => occurrence count, for a single candidate field.
     *        immutable once built.
     */
    class ValueIndex {
    public:
        using CountMap = std::unordered_map<std::string, uint32_t>;
        
        ValueIndex() = default;
        
        size_t distinctCount() const;
        
        /**
         * @return number of non-blank occurrences that were indexed
         */
        uint64_t totalCount() const;
        
        bool empty() const;
        bool contains(const std::string &normalizedValue) const;
        uint32_t count(const std::string &normalizedValue) const;
        
        const CountMap &values() const;
        
    private:
        friend class ValueIndexBuilder;
        
        CountMap _counts;
        uint64_t _totalCount = 0;
    };
    
    class ValueIndexBuilder {
    public:
        struct Limits {
            size_t maxValueLength = 256;
            size_t maxDistinctValues = 120000;
        };
        
        ValueIndexBuilder();
        explicit ValueIndexBuilder(Limits limits);
        
        /**
         * @brief normalizes (trim + lower-case) and records the value.
         *        null / blank values are counted as blank and otherwise discarded.
         */
        void add(const RawValue &rawValue);
        void addAll(const RawValueList &rawValues);
        
        uint64_t blankCount() const;
        
        /**
         * @return number of values dropped for exceeding Limits::maxValueLength
         */
        uint64_t ignoredCount() const;
        
        /**
         * @return true once the distinct-value limit has been exceeded. an overflowed index must not be used.
         */
        bool isOverflow() const;
        
        ValueIndex build() &&;
        
    private:
        Limits _limits;
        ValueIndex _index;
        
        uint64_t _blankCount = 0;
        uint64_t _ignoredCount = 0;
        bool _overflow = false;
    };
}

#endif //FIELDREL_VALUEINDEX_HPP
