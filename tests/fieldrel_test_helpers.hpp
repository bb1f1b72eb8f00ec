//
// Created by fieldrel on 10/17/26.
//

#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "analysis/CandidateField.hpp"
#include "analysis/RelationshipSnapshot.hpp"
#include "analysis/ValueIndex.hpp"
#include "source/DataSource.hpp"
#include "source/InMemoryDataSourceProvider.hpp"

namespace fieldrel::test_helpers {
    inline RawValueList rawValues(std::initializer_list<const char *> values) {
        RawValueList result;
        for (const auto *value : values) {
            if (value == nullptr) {
                result.emplace_back(std::nullopt);
            } else {
                result.emplace_back(std::string(value));
            }
        }
        return result;
    }

    inline CandidateFieldPtr makeField(const std::string &source, const std::string &field,
                                       std::initializer_list<const char *> values) {
        ValueIndexBuilder builder;
        builder.addAll(rawValues(values));
        return std::make_shared<CandidateField>(source, field, std::move(builder).build());
    }

    inline CandidateFieldPtr makeFieldWithValues(const std::string &source, const std::string &field,
                                                 const std::vector<std::string> &values) {
        ValueIndexBuilder builder;
        for (const auto &value : values) {
            builder.add(value);
        }
        return std::make_shared<CandidateField>(source, field, std::move(builder).build());
    }

    inline std::vector<std::string> sequence(const std::string &prefix, int begin, int end) {
        std::vector<std::string> values;
        for (int i = begin; i < end; i++) {
            values.push_back(prefix + std::to_string(i));
        }
        return values;
    }

    inline RawValueList toRawValues(const std::vector<std::string> &values) {
        return RawValueList(values.begin(), values.end());
    }

    /**
     * Scenario A:
     *   item.name      = ["Sword of Fire", "sword of fire", "Shield", ""]
     *   drop.item_name = ["Sword of Fire", "Shield", "Potion"]
     */
    inline void addScenarioA(InMemoryDataSourceProvider &provider) {
        provider.addSource("item", FieldMap {
            { "id", rawValues({ "1", "2", "3", "4" }) },
            { "name", rawValues({ "Sword of Fire", "sword of fire", "Shield", "" }) }
        });
        provider.addSource("drop", FieldMap {
            { "item_name", rawValues({ "Sword of Fire", "Shield", "Potion" }) },
            { "rate", rawValues({ "0.5", "0.2", "0.9" }) }
        });
    }

    inline const RelationshipSnapshot *findSnapshot(const std::vector<RelationshipSnapshot> &snapshots,
                                                    const FieldRef &lhs, const FieldRef &rhs) {
        for (const auto &snapshot : snapshots) {
            if ((snapshot.sourceRef() == lhs && snapshot.targetRef() == rhs) ||
                (snapshot.sourceRef() == rhs && snapshot.targetRef() == lhs)) {
                return &snapshot;
            }
        }
        return nullptr;
    }

    class ScopedTempDir {
    public:
        ScopedTempDir() {
            std::random_device rd;
            auto base = std::filesystem::temp_directory_path();
            for (int attempt = 0; attempt < 16; attempt++) {
                auto candidate = base / ("fieldrel-test-" + std::to_string(rd()));
                std::error_code ec;
                if (std::filesystem::create_directory(candidate, ec)) {
                    _path = candidate;
                    return;
                }
            }
        }

        ~ScopedTempDir() {
            if (!_path.empty()) {
                std::error_code ec;
                std::filesystem::remove_all(_path, ec);
            }
        }

        ScopedTempDir(const ScopedTempDir &) = delete;
        ScopedTempDir &operator=(const ScopedTempDir &) = delete;

        bool ok() const { return !_path.empty(); }
        const std::filesystem::path &path() const { return _path; }

        std::filesystem::path write(const std::string &relativePath, const std::string &contents) const {
            auto target = _path / relativePath;
            std::filesystem::create_directories(target.parent_path());
            std::ofstream out(target);
            out << contents;
            return target;
        }

    private:
        std::filesystem::path _path;
    };

    class ScopedEnvVar {
    public:
        ScopedEnvVar(const std::string &name, std::optional<std::string> value)
            : name_(name) {
            const char *prev = std::getenv(name_.c_str());
            if (prev != nullptr) {
                hadPrev_ = true;
                prevValue_ = std::string(prev);
            }

            if (value.has_value()) {
                ok_ = (setenv(name_.c_str(), value->c_str(), 1) == 0);
            } else {
                ok_ = (unsetenv(name_.c_str()) == 0);
            }
        }

        ~ScopedEnvVar() {
            if (hadPrev_) {
                setenv(name_.c_str(), prevValue_.c_str(), 1);
            } else {
                unsetenv(name_.c_str());
            }
        }

        bool ok() const { return ok_; }

    private:
        std::string name_;
        bool hadPrev_ = false;
        std::string prevValue_;
        bool ok_ = false;
    };
}
