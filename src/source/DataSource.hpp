//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_DATASOURCE_HPP
#define FIELDREL_DATASOURCE_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fieldrel {
    /**
     * std::nullopt represents a null cell.
     */
    using RawValue = std::optional<std::string>;
    using RawValueList = std::vector<RawValue>;
    
    /**
     * field name => raw values, in the order the origin declares them
     */
    using FieldMap = std::vector<std::pair<std::string, RawValueList>>;
    
    /**
     * @brief a named origin of configuration rows (a table, an XML / JSON file, ...)
     */
    class DataSource {
    public:
        virtual ~DataSource() = default;
        
        virtual std::string name() const = 0;
        
        /**
         * @throws SourceReadError (or any std::exception) if the source cannot be read
         */
        virtual FieldMap fields() const = 0;
    };
    
    class DataSourceProvider {
    public:
        virtual ~DataSourceProvider() = default;
        
        /**
         * @note enumeration order is not guaranteed
         * @throws ProviderUnavailable if the sources cannot be enumerated at all
         */
        virtual std::vector<std::shared_ptr<DataSource>> listSources() = 0;
    };
}

#endif //FIELDREL_DATASOURCE_HPP
