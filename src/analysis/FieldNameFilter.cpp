//
// Created by fieldrel on 10/17/26.
//

#include <algorithm>

#include "FieldNameFilter.hpp"

#include "utils/StringUtil.hpp"

namespace fieldrel {
    const std::vector<std::string> &FieldNameFilter::defaultPatterns() {
        static const std::vector<std::string> patterns { "name", "*_name" };
        return patterns;
    }
    
    FieldNameFilter::FieldNameFilter():
        _patterns(defaultPatterns())
    {
    }
    
    FieldNameFilter::FieldNameFilter(std::vector<std::string> patterns):
        _patterns(std::move(patterns))
    {
    }
    
    bool FieldNameFilter::operator()(const std::string &fieldName) const {
        return std::any_of(_patterns.begin(), _patterns.end(), [&fieldName](const std::string &pattern) {
            return utility::globMatch(pattern, fieldName);
        });
    }
    
    const std::vector<std::string> &FieldNameFilter::patterns() const {
        return _patterns;
    }
}
