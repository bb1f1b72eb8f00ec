//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_ANALYSISERRORS_HPP
#define FIELDREL_ANALYSISERRORS_HPP

#include <stdexcept>
#include <string>

namespace fieldrel {
    /**
     * @brief a single data source could not be read or parsed.
     *        absorbed by the extractor and recorded as a skipped source; never crosses analyze().
     */
    class SourceReadError: public std::runtime_error {
    public:
        SourceReadError(const std::string &sourceName, const std::string &reason):
            std::runtime_error("cannot read source '" + sourceName + "': " + reason),
            _sourceName(sourceName),
            _reason(reason)
        {
        }
        
        const std::string &sourceName() const {
            return _sourceName;
        }
        
        const std::string &reason() const {
            return _reason;
        }
        
    private:
        std::string _sourceName;
        std::string _reason;
    };
    
    /**
     * @brief the provider itself cannot enumerate its sources. fatal for the whole run.
     */
    class ProviderUnavailable: public std::runtime_error {
    public:
        explicit ProviderUnavailable(const std::string &reason):
            std::runtime_error("data source provider unavailable: " + reason)
        {
        }
    };
    
    /**
     * @brief thrown by analyze() when the cancellation predicate fires.
     */
    class AnalysisCancelled: public std::runtime_error {
    public:
        AnalysisCancelled():
            std::runtime_error("analysis cancelled")
        {
        }
    };
}

#endif //FIELDREL_ANALYSISERRORS_HPP
