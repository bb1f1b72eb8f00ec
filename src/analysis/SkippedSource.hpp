//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_SKIPPEDSOURCE_HPP
#define FIELDREL_SKIPPEDSOURCE_HPP

#include <string>

namespace fieldrel {
    /**
     * @brief a data source left out of the run because it could not be read
     */
    struct SkippedSource {
        std::string source;
        std::string reason;
    };
}

#endif //FIELDREL_SKIPPEDSOURCE_HPP
