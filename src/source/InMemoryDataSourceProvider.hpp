//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_INMEMORYDATASOURCEPROVIDER_HPP
#define FIELDREL_INMEMORYDATASOURCEPROVIDER_HPP

#include <optional>
#include <string>
#include <vector>

#include "DataSource.hpp"

namespace fieldrel {
    class InMemoryDataSource: public DataSource {
    public:
        InMemoryDataSource(std::string name, FieldMap fields);
        
        /**
         * @brief creates a source whose fields() always throws SourceReadError with the given reason
         */
        static std::shared_ptr<InMemoryDataSource> failing(std::string name, std::string reason);
        
        std::string name() const override;
        FieldMap fields() const override;
        
    private:
        std::string _name;
        FieldMap _fields;
        std::optional<std::string> _failureReason;
    };
    
    /**
     * @brief provider over sources assembled in code (embedding callers, tests)
     */
    class InMemoryDataSourceProvider: public DataSourceProvider {
    public:
        InMemoryDataSourceProvider() = default;
        explicit InMemoryDataSourceProvider(std::vector<std::shared_ptr<DataSource>> sources);
        
        void addSource(std::shared_ptr<DataSource> source);
        void addSource(const std::string &name, FieldMap fields);
        void addFailingSource(const std::string &name, const std::string &reason);
        
        /**
         * @brief makes listSources() throw ProviderUnavailable with the given reason
         */
        void setUnavailable(const std::string &reason);
        
        std::vector<std::shared_ptr<DataSource>> listSources() override;
        
    private:
        std::vector<std::shared_ptr<DataSource>> _sources;
        std::optional<std::string> _unavailableReason;
    };
}

#endif //FIELDREL_INMEMORYDATASOURCEPROVIDER_HPP
