//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_JSONDIRECTORYPROVIDER_HPP
#define FIELDREL_JSONDIRECTORYPROVIDER_HPP

#include <string>
#include <vector>

#include "DataSource.hpp"

#include "utils/log.hpp"

namespace fieldrel {
    /**
     * @brief a single *.json file holding an array of row objects.
     *
     * <pre>
     *   [
     *     { "id": 1, "name": "Sword of Fire", "grade": "rare" },
     *     { "id": 2, "name": "Shield", "grade": null }
     *   ]
     * </pre>
     *
     * every scalar member becomes a field; nested objects / arrays are skipped.
     * the file is parsed on every fields() call, never cached.
     */
    class JsonFileDataSource: public DataSource {
    public:
        JsonFileDataSource(std::string name, std::string path);
        
        std::string name() const override;
        FieldMap fields() const override;
        
        const std::string &path() const;
        
    private:
        std::string _name;
        std::string _path;
    };
    
    /**
     * @brief exposes every *.json file under a directory as a DataSource.
     *        source names are the relative path without extension, using '/' separators.
     */
    class JsonDirectoryProvider: public DataSourceProvider {
    public:
        explicit JsonDirectoryProvider(std::string directory, bool recursive = true);
        
        std::vector<std::shared_ptr<DataSource>> listSources() override;
        
    private:
        LoggerPtr _logger;
        
        std::string _directory;
        bool _recursive;
    };
}

#endif //FIELDREL_JSONDIRECTORYPROVIDER_HPP
