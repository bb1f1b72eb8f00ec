//
// Created by fieldrel on 10/17/26.
//

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <system_error>

#include <nlohmann/json.hpp>

#include "JsonDirectoryProvider.hpp"

#include "analysis/AnalysisErrors.hpp"
#include "utils/StringUtil.hpp"

namespace fs = std::filesystem;

namespace fieldrel {
    namespace {
        RawValue toRawValue(const nlohmann::json &value) {
            if (value.is_null()) {
                return std::nullopt;
            }
            
            if (value.is_string()) {
                return value.get<std::string>();
            }
            
            return value.dump();
        }
        
        bool isJsonFile(const fs::path &path) {
            return utility::toLower(path.extension().string()) == ".json";
        }
        
        std::string buildSourceName(const fs::path &baseDir, const fs::path &file) {
            auto relative = file.lexically_relative(baseDir);
            if (relative.empty()) {
                relative = file.filename();
            }
            
            relative.replace_extension();
            return relative.generic_string();
        }
    }
    
    JsonFileDataSource::JsonFileDataSource(std::string name, std::string path):
        _name(std::move(name)),
        _path(std::move(path))
    {
    }
    
    std::string JsonFileDataSource::name() const {
        return _name;
    }
    
    const std::string &JsonFileDataSource::path() const {
        return _path;
    }
    
    FieldMap JsonFileDataSource::fields() const {
        std::ifstream inputStream(_path);
        if (!inputStream.is_open()) {
            throw SourceReadError(_name, "failed to open " + _path);
        }
        
        auto document = nlohmann::json::parse(inputStream, nullptr, false);
        if (document.is_discarded()) {
            throw SourceReadError(_name, "malformed JSON");
        }
        
        if (!document.is_array()) {
            throw SourceReadError(_name, "top-level value must be an array of rows");
        }
        
        FieldMap fieldMap;
        std::map<std::string, size_t> fieldIndex;
        size_t rowIndex = 0;
        
        for (const auto &row: document) {
            if (!row.is_object()) {
                throw SourceReadError(_name, "row #" + std::to_string(rowIndex) + " is not an object");
            }
            
            for (auto it = row.begin(); it != row.end(); ++it) {
                const auto &value = it.value();
                if (value.is_object() || value.is_array()) {
                    continue;
                }
                
                auto indexIt = fieldIndex.find(it.key());
                if (indexIt == fieldIndex.end()) {
                    indexIt = fieldIndex.emplace(it.key(), fieldMap.size()).first;
                    fieldMap.emplace_back(it.key(), RawValueList {});
                }
                
                fieldMap[indexIt->second].second.push_back(toRawValue(value));
            }
            
            rowIndex++;
        }
        
        return fieldMap;
    }
    
    JsonDirectoryProvider::JsonDirectoryProvider(std::string directory, bool recursive):
        _logger(createLogger("JsonDirectoryProvider")),
        _directory(std::move(directory)),
        _recursive(recursive)
    {
    }
    
    std::vector<std::shared_ptr<DataSource>> JsonDirectoryProvider::listSources() {
        std::error_code ec;
        fs::path baseDir(_directory);
        
        if (!fs::is_directory(baseDir, ec)) {
            throw ProviderUnavailable("not a directory: " + _directory);
        }
        
        std::vector<fs::path> files;
        
        auto collect = [&files](const fs::directory_entry &entry) {
            std::error_code statError;
            if (entry.is_regular_file(statError) && isJsonFile(entry.path())) {
                files.push_back(entry.path());
            }
        };
        
        if (_recursive) {
            fs::recursive_directory_iterator it(baseDir, fs::directory_options::skip_permission_denied, ec);
            if (ec) {
                throw ProviderUnavailable("cannot enumerate " + _directory + ": " + ec.message());
            }
            
            for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
                if (ec) {
                    throw ProviderUnavailable("cannot enumerate " + _directory + ": " + ec.message());
                }
                collect(*it);
            }
        } else {
            fs::directory_iterator it(baseDir, fs::directory_options::skip_permission_denied, ec);
            if (ec) {
                throw ProviderUnavailable("cannot enumerate " + _directory + ": " + ec.message());
            }
            
            for (; it != fs::directory_iterator(); it.increment(ec)) {
                if (ec) {
                    throw ProviderUnavailable("cannot enumerate " + _directory + ": " + ec.message());
                }
                collect(*it);
            }
        }
        
        std::sort(files.begin(), files.end());
        
        std::vector<std::shared_ptr<DataSource>> sources;
        sources.reserve(files.size());
        
        for (const auto &file: files) {
            sources.push_back(std::make_shared<JsonFileDataSource>(buildSourceName(baseDir, file), file.string()));
        }
        
        _logger->debug("found {} JSON source(s) under {}", sources.size(), _directory);
        
        return sources;
    }
}
