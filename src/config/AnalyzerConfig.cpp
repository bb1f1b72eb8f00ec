//
// Created by fieldrel on 10/17/26.
//

#include "config/AnalyzerConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

#include "utils/log.hpp"

namespace fieldrel::config {

    namespace {
        const LoggerPtr &logger() {
            static LoggerPtr instance = createLogger("AnalyzerConfig");
            return instance;
        }

        std::string getEnvString(const char *name) {
            const char *value = std::getenv(name);
            if (value == nullptr) {
                return {};
            }
            return std::string(value);
        }

        bool parseIntString(const std::string &value, int &out) {
            try {
                size_t idx = 0;
                long long parsed = std::stoll(value, &idx);
                if (idx != value.size()) {
                    return false;
                }
                if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
                    return false;
                }
                out = static_cast<int>(parsed);
                return true;
            } catch (const std::exception &) {
                return false;
            }
        }

        /**
         * @return the member if present and non-null, nullptr otherwise (or on error)
         */
        const nlohmann::json *findField(const nlohmann::json &obj, const char *key, const std::string &path,
                                        bool required, bool &ok) {
            ok = true;

            if (!obj.contains(key) || obj.at(key).is_null()) {
                if (required) {
                    logger()->error("missing required field: {}", path);
                    ok = false;
                }
                return nullptr;
            }

            return &obj.at(key);
        }

        bool readStringField(const nlohmann::json &obj, const char *key, std::string &out,
                             const std::string &path, bool required) {
            bool ok = false;
            const auto *value = findField(obj, key, path, required, ok);
            if (value == nullptr) {
                return ok;
            }

            if (!value->is_string()) {
                logger()->error("field must be a string: {}", path);
                return false;
            }

            out = value->get<std::string>();
            return true;
        }

        bool readBoolField(const nlohmann::json &obj, const char *key, bool &out,
                           const std::string &path, bool required) {
            bool ok = false;
            const auto *value = findField(obj, key, path, required, ok);
            if (value == nullptr) {
                return ok;
            }

            if (!value->is_boolean()) {
                logger()->error("field must be a boolean: {}", path);
                return false;
            }

            out = value->get<bool>();
            return true;
        }

        bool readIntField(const nlohmann::json &obj, const char *key, int &out,
                          const std::string &path, bool required, int minValue) {
            bool ok = false;
            const auto *value = findField(obj, key, path, required, ok);
            if (value == nullptr) {
                return ok;
            }

            int parsed = 0;

            if (value->is_number_integer()) {
                auto raw = value->get<long long>();
                if (raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
                    logger()->error("field out of range: {}", path);
                    return false;
                }
                parsed = static_cast<int>(raw);
            } else if (value->is_string()) {
                if (!parseIntString(value->get<std::string>(), parsed)) {
                    logger()->error("field must be an integer: {}", path);
                    return false;
                }
            } else {
                logger()->error("field must be an integer: {}", path);
                return false;
            }

            if (parsed < minValue) {
                logger()->error("field must be >= {}: {}", minValue, path);
                return false;
            }

            out = parsed;
            return true;
        }

        bool readFractionField(const nlohmann::json &obj, const char *key, double &out,
                               const std::string &path, bool required) {
            bool ok = false;
            const auto *value = findField(obj, key, path, required, ok);
            if (value == nullptr) {
                return ok;
            }

            if (!value->is_number()) {
                logger()->error("field must be a number: {}", path);
                return false;
            }

            auto parsed = value->get<double>();
            if (parsed < 0.0 || parsed > 1.0) {
                logger()->error("field must be within [0, 1]: {}", path);
                return false;
            }

            out = parsed;
            return true;
        }

        bool readStringArray(const nlohmann::json &obj, const char *key,
                             std::vector<std::string> &out,
                             const std::string &path, bool required, bool requireNonEmpty) {
            bool ok = false;
            const auto *value = findField(obj, key, path, required, ok);
            if (value == nullptr) {
                return ok;
            }

            if (!value->is_array()) {
                logger()->error("field must be an array: {}", path);
                return false;
            }

            std::vector<std::string> entries;
            for (const auto &item: *value) {
                if (!item.is_string()) {
                    logger()->error("array elements must be strings: {}", path);
                    return false;
                }
                entries.emplace_back(item.get<std::string>());
            }

            if (requireNonEmpty && entries.empty()) {
                logger()->error("field must contain at least one entry: {}", path);
                return false;
            }

            out = std::move(entries);
            return true;
        }

        const nlohmann::json *readSection(const nlohmann::json &document, const char *key, bool &ok) {
            ok = true;
            if (!document.contains(key)) {
                return nullptr;
            }

            const auto &section = document.at(key);
            if (!section.is_object()) {
                logger()->error("field must be an object: {}", key);
                ok = false;
                return nullptr;
            }

            return &section;
        }
    } // namespace

    AnalysisOptions AnalyzerConfig::makeAnalysisOptions() const {
        AnalysisOptions options;

        options.minMatchCount = static_cast<uint32_t>(thresholds.minMatchCount);
        options.minConfidence = thresholds.minConfidence;
        options.sampleSize = static_cast<size_t>(limits.sampleSize);
        options.maxRelationshipsPerField = static_cast<size_t>(limits.maxRelationshipsPerField);
        options.maxValueLength = static_cast<size_t>(limits.maxValueLength);
        options.maxDistinctValuesPerField = static_cast<size_t>(limits.maxDistinctValuesPerField);
        options.threadCount = aggregation.threadCount;
        options.fieldPatterns = fieldFilter.patterns;

        return options;
    }

    std::optional<AnalyzerConfig> AnalyzerConfig::loadFromFile(const std::string &path) {
        std::ifstream inputStream(path);
        if (!inputStream.is_open()) {
            logger()->error("failed to open config file: {}", path);
            return std::nullopt;
        }

        std::stringstream buffer;
        buffer << inputStream.rdbuf();
        inputStream.close();

        return loadFromString(buffer.str());
    }

    std::optional<AnalyzerConfig> AnalyzerConfig::loadFromString(const std::string &jsonStr) {
        using nlohmann::json;

        auto document = json::parse(jsonStr, nullptr, false);
        if (document.is_discarded()) {
            logger()->error("failed to parse config JSON");
            return std::nullopt;
        }

        if (!document.is_object()) {
            logger()->error("config JSON must be an object");
            return std::nullopt;
        }

        AnalyzerConfig config;
        bool ok = true;

        bool sourceDirProvided = false;
        bool threadCountProvided = false;

        if (const auto *sourceObj = readSection(document, "source", ok)) {
            sourceDirProvided = sourceObj->contains("directory");

            if (!readStringField(*sourceObj, "directory", config.source.directory, "source.directory", false)) {
                return std::nullopt;
            }
            if (!readBoolField(*sourceObj, "recursive", config.source.recursive, "source.recursive", false)) {
                return std::nullopt;
            }
        } else if (!ok) {
            return std::nullopt;
        }

        if (const auto *thresholdObj = readSection(document, "thresholds", ok)) {
            if (!readIntField(*thresholdObj, "minMatchCount", config.thresholds.minMatchCount,
                              "thresholds.minMatchCount", false, 1)) {
                return std::nullopt;
            }
            if (!readFractionField(*thresholdObj, "minConfidence", config.thresholds.minConfidence,
                                   "thresholds.minConfidence", false)) {
                return std::nullopt;
            }
        } else if (!ok) {
            return std::nullopt;
        }

        if (const auto *filterObj = readSection(document, "fieldFilter", ok)) {
            if (!readStringArray(*filterObj, "patterns", config.fieldFilter.patterns,
                                 "fieldFilter.patterns", false, true)) {
                return std::nullopt;
            }
        } else if (!ok) {
            return std::nullopt;
        }

        if (const auto *limitObj = readSection(document, "limits", ok)) {
            if (!readIntField(*limitObj, "sampleSize", config.limits.sampleSize,
                              "limits.sampleSize", false, 1)) {
                return std::nullopt;
            }
            if (!readIntField(*limitObj, "maxRelationshipsPerField", config.limits.maxRelationshipsPerField,
                              "limits.maxRelationshipsPerField", false, 0)) {
                return std::nullopt;
            }
            if (!readIntField(*limitObj, "maxValueLength", config.limits.maxValueLength,
                              "limits.maxValueLength", false, 0)) {
                return std::nullopt;
            }
            if (!readIntField(*limitObj, "maxDistinctValuesPerField", config.limits.maxDistinctValuesPerField,
                              "limits.maxDistinctValuesPerField", false, 0)) {
                return std::nullopt;
            }
        } else if (!ok) {
            return std::nullopt;
        }

        if (const auto *aggregationObj = readSection(document, "aggregation", ok)) {
            threadCountProvided = aggregationObj->contains("threadCount");

            if (!readIntField(*aggregationObj, "threadCount", config.aggregation.threadCount,
                              "aggregation.threadCount", false, 0)) {
                return std::nullopt;
            }
        } else if (!ok) {
            return std::nullopt;
        }

        if (!sourceDirProvided) {
            auto envDir = getEnvString("FIELDREL_SOURCE_DIR");
            if (!envDir.empty()) {
                config.source.directory = envDir;
            }
        }

        if (!threadCountProvided) {
            auto envThreads = getEnvString("FIELDREL_THREAD_COUNT");
            if (!envThreads.empty()) {
                int parsedThreads = 0;
                if (!parseIntString(envThreads, parsedThreads) || parsedThreads < 0) {
                    logger()->error("FIELDREL_THREAD_COUNT must be a non-negative integer");
                    return std::nullopt;
                }
                config.aggregation.threadCount = parsedThreads;
            }
        }

        return config;
    }

} // namespace fieldrel::config
