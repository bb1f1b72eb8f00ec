//
// Created by fieldrel on 10/17/26.
//

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "analysis/AnalysisErrors.hpp"
#include "analysis/CandidateFieldExtractor.hpp"
#include "source/InMemoryDataSourceProvider.hpp"

#include "fieldrel_test_helpers.hpp"

using namespace fieldrel;
using fieldrel::test_helpers::rawValues;

namespace {
    class ThrowingSource: public DataSource {
    public:
        std::string name() const override {
            return "broken";
        }

        FieldMap fields() const override {
            throw std::runtime_error("disk on fire");
        }
    };

    class NamelessSource: public DataSource {
    public:
        std::string name() const override {
            throw std::runtime_error("name attribute missing");
        }

        FieldMap fields() const override {
            return FieldMap { { "name", rawValues({ "Sword" }) } };
        }
    };
}

TEST_CASE("extractor keeps only name-like fields", "[extractor]") {
    InMemoryDataSourceProvider provider;
    provider.addSource("item", FieldMap {
        { "id", rawValues({ "1", "2" }) },
        { "name", rawValues({ "Sword", "Shield" }) },
        { "item_name", rawValues({ "Sword" }) },
        { "itemName", rawValues({ "Sword" }) }
    });

    CandidateFieldExtractor extractor;
    auto result = extractor.extract(provider);

    REQUIRE(result.sourcesScanned == 1);
    REQUIRE(result.skippedSources.empty());
    REQUIRE(result.fields.size() == 2);

    // sorted by (source, field)
    REQUIRE(result.fields[0]->fieldName() == "item_name");
    REQUIRE(result.fields[1]->fieldName() == "name");
    REQUIRE(result.fields[1]->distinctCount() == 2);
}

TEST_CASE("extractor drops fields without any non-blank value", "[extractor]") {
    InMemoryDataSourceProvider provider;
    provider.addSource("item", FieldMap {
        { "name", rawValues({ nullptr, "", "  " }) },
        { "alias_name", rawValues({ "Sword" }) }
    });

    auto result = CandidateFieldExtractor().extract(provider);

    REQUIRE(result.fields.size() == 1);
    REQUIRE(result.fields[0]->fieldName() == "alias_name");
}

TEST_CASE("extractor skips unreadable sources and continues", "[extractor]") {
    InMemoryDataSourceProvider provider;
    provider.addSource("item", FieldMap { { "name", rawValues({ "Sword" }) } });
    provider.addFailingSource("corrupt", "malformed row 3");
    provider.addSource(std::make_shared<ThrowingSource>());
    provider.addSource("drop", FieldMap { { "item_name", rawValues({ "Sword" }) } });

    auto result = CandidateFieldExtractor().extract(provider);

    REQUIRE(result.sourcesScanned == 4);
    REQUIRE(result.fields.size() == 2);
    REQUIRE(result.skippedSources.size() == 2);

    REQUIRE(result.skippedSources[0].source == "corrupt");
    REQUIRE(result.skippedSources[0].reason == "malformed row 3");
    REQUIRE(result.skippedSources[1].source == "broken");
    REQUIRE(result.skippedSources[1].reason == "disk on fire");
}

TEST_CASE("extractor skips a source whose name cannot be resolved", "[extractor]") {
    InMemoryDataSourceProvider provider;
    provider.addSource("item", FieldMap { { "name", rawValues({ "Sword" }) } });
    provider.addSource(std::make_shared<NamelessSource>());
    provider.addSource("drop", FieldMap { { "item_name", rawValues({ "Sword" }) } });

    std::vector<std::string> visited;
    auto result = CandidateFieldExtractor().extract(provider, [&visited](const std::string &sourceName) {
        visited.push_back(sourceName);
    });

    REQUIRE(result.sourcesScanned == 3);
    REQUIRE(result.fields.size() == 2);
    REQUIRE(result.skippedSources.size() == 1);
    REQUIRE(result.skippedSources[0].source == "#1");
    REQUIRE(result.skippedSources[0].reason == "name attribute missing");
    REQUIRE(visited == std::vector<std::string> { "item", "drop" });
}

TEST_CASE("extractor merges sources sharing the same name", "[extractor]") {
    InMemoryDataSourceProvider provider;
    provider.addSource("item", FieldMap { { "name", rawValues({ "Sword", "Shield" }) } });
    provider.addSource("item", FieldMap { { "name", rawValues({ "shield", "Potion" }) } });

    auto result = CandidateFieldExtractor().extract(provider);

    REQUIRE(result.fields.size() == 1);
    REQUIRE(result.fields[0]->distinctCount() == 3);
    REQUIRE(result.fields[0]->index().count("shield") == 2);
}

TEST_CASE("extractor drops overflowed fields", "[extractor]") {
    InMemoryDataSourceProvider provider;
    provider.addSource("item", FieldMap {
        { "name", rawValues({ "a", "b", "c", "d" }) },
        { "short_name", rawValues({ "a", "b" }) }
    });

    CandidateFieldExtractor extractor(CandidateFieldExtractor::Options {
        FieldNameFilter(),
        ValueIndexBuilder::Limits { 256, 3 }
    });
    auto result = extractor.extract(provider);

    REQUIRE(result.overflowedFields == 1);
    REQUIRE(result.fields.size() == 1);
    REQUIRE(result.fields[0]->fieldName() == "short_name");
}

TEST_CASE("extractor invokes the hook before every source and propagates its exceptions", "[extractor]") {
    InMemoryDataSourceProvider provider;
    provider.addSource("a", FieldMap { { "name", rawValues({ "x" }) } });
    provider.addSource("b", FieldMap { { "name", rawValues({ "x" }) } });
    provider.addSource("c", FieldMap { { "name", rawValues({ "x" }) } });

    CandidateFieldExtractor extractor;

    std::vector<std::string> visited;
    auto result = extractor.extract(provider, [&visited](const std::string &sourceName) {
        visited.push_back(sourceName);
    });
    REQUIRE(visited == std::vector<std::string> { "a", "b", "c" });
    REQUIRE(result.fields.size() == 3);

    visited.clear();
    REQUIRE_THROWS_AS(
        extractor.extract(provider, [&visited](const std::string &sourceName) {
            visited.push_back(sourceName);
            if (sourceName == "b") {
                throw AnalysisCancelled();
            }
        }),
        AnalysisCancelled
    );
    REQUIRE(visited == std::vector<std::string> { "a", "b" });
}

TEST_CASE("extractor propagates provider failures", "[extractor]") {
    InMemoryDataSourceProvider provider;
    provider.setUnavailable("directory vanished");

    REQUIRE_THROWS_AS(CandidateFieldExtractor().extract(provider), ProviderUnavailable);
}

TEST_CASE("extractSource throws SourceReadError for unreadable sources", "[extractor]") {
    auto source = InMemoryDataSource::failing("corrupt", "truncated file");

    try {
        CandidateFieldExtractor().extractSource(*source);
        FAIL("expected SourceReadError");
    } catch (const SourceReadError &e) {
        REQUIRE(e.sourceName() == "corrupt");
        REQUIRE(e.reason() == "truncated file");
    }
}
