//
// Created by fieldrel on 10/17/26.
//

#include "InMemoryDataSourceProvider.hpp"

#include "analysis/AnalysisErrors.hpp"

namespace fieldrel {
    InMemoryDataSource::InMemoryDataSource(std::string name, FieldMap fields):
        _name(std::move(name)),
        _fields(std::move(fields))
    {
    }
    
    std::shared_ptr<InMemoryDataSource> InMemoryDataSource::failing(std::string name, std::string reason) {
        auto source = std::make_shared<InMemoryDataSource>(std::move(name), FieldMap {});
        source->_failureReason = std::move(reason);
        
        return source;
    }
    
    std::string InMemoryDataSource::name() const {
        return _name;
    }
    
    FieldMap InMemoryDataSource::fields() const {
        if (_failureReason.has_value()) {
            throw SourceReadError(_name, *_failureReason);
        }
        
        return _fields;
    }
    
    InMemoryDataSourceProvider::InMemoryDataSourceProvider(std::vector<std::shared_ptr<DataSource>> sources):
        _sources(std::move(sources))
    {
    }
    
    void InMemoryDataSourceProvider::addSource(std::shared_ptr<DataSource> source) {
        _sources.push_back(std::move(source));
    }
    
    void InMemoryDataSourceProvider::addSource(const std::string &name, FieldMap fields) {
        _sources.push_back(std::make_shared<InMemoryDataSource>(name, std::move(fields)));
    }
    
    void InMemoryDataSourceProvider::addFailingSource(const std::string &name, const std::string &reason) {
        _sources.push_back(InMemoryDataSource::failing(name, reason));
    }
    
    void InMemoryDataSourceProvider::setUnavailable(const std::string &reason) {
        _unavailableReason = reason;
    }
    
    std::vector<std::shared_ptr<DataSource>> InMemoryDataSourceProvider::listSources() {
        if (_unavailableReason.has_value()) {
            throw ProviderUnavailable(*_unavailableReason);
        }
        
        return _sources;
    }
}
