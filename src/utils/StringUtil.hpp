//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_STRINGUTIL_HPP
#define FIELDREL_STRINGUTIL_HPP

#include <string>
#include <vector>

namespace fieldrel::utility {
    /**
     * @brief strips leading / trailing ASCII whitespace
     */
    std::string trim(const std::string &source);
    
    /**
     * @brief ASCII-only lower-casing. does not consult the global locale.
     */
    std::string toLower(const std::string &source);
    
    /**
     * @brief trims and lower-cases a raw cell value.
     */
    std::string normalizeValue(const std::string &rawValue);
    
    /**
     * @brief splits an identifier on '_', other non-alphanumeric characters and camel-case boundaries.
     *
     * @example "item_name" => { "item", "name" }
     *          "itemName"  => { "item", "name" }
     *          "XMLName"   => { "xml", "name" }
     */
    std::vector<std::string> tokenizeIdentifier(const std::string &identifier);
    
    /**
     * @brief case-insensitive glob match supporting '*' and '?'
     */
    bool globMatch(const std::string &pattern, const std::string &input);
}


#endif //FIELDREL_STRINGUTIL_HPP
