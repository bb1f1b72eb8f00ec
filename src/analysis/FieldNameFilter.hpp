//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_FIELDNAMEFILTER_HPP
#define FIELDREL_FIELDNAMEFILTER_HPP

#include <string>
#include <vector>

namespace fieldrel {
    /**
     * @brief decides which fields are "name-like" and therefore eligible for relationship analysis.
     *        a field qualifies when any glob pattern matches its name, ignoring case.
     */
    class FieldNameFilter {
    public:
        static const std::vector<std::string> &defaultPatterns();
        
        FieldNameFilter();
        explicit FieldNameFilter(std::vector<std::string> patterns);
        
        bool operator()(const std::string &fieldName) const;
        
        const std::vector<std::string> &patterns() const;
        
    private:
        std::vector<std::string> _patterns;
    };
}

#endif //FIELDREL_FIELDNAMEFILTER_HPP
