//
// Created by fieldrel on 10/17/26.
//

#include <algorithm>
#include <chrono>
#include <map>

#include "RelationshipAnalyzer.hpp"

#include "CandidateFieldExtractor.hpp"
#include "CooccurrenceAggregator.hpp"
#include "EntityGroupGraph.hpp"
#include "RelationshipScorer.hpp"

namespace fieldrel {
    namespace {
        /**
         * keeps a snapshot while it ranks within the first `limit` relationships of its source field
         * or of its target field. input must already be in report order.
         */
        std::vector<RelationshipSnapshot> limitPerField(std::vector<RelationshipSnapshot> snapshots, size_t limit) {
            if (limit == 0) {
                return snapshots;
            }

            std::map<FieldRef, size_t> ranks;
            std::vector<RelationshipSnapshot> result;
            result.reserve(snapshots.size());

            for (auto &snapshot: snapshots) {
                auto &sourceRank = ranks[snapshot.sourceRef()];
                auto &targetRank = ranks[snapshot.targetRef()];

                const bool keep = sourceRank < limit || targetRank < limit;
                sourceRank++;
                targetRank++;

                if (keep) {
                    result.push_back(std::move(snapshot));
                }
            }

            return result;
        }
    }

    std::string RelationshipAnalyzer::stateName(State state) {
        switch (state) {
            case State::IDLE:
                return "IDLE";
            case State::SCANNING:
                return "SCANNING";
            case State::AGGREGATING:
                return "AGGREGATING";
            case State::SCORING:
                return "SCORING";
            case State::COMPLETED:
                return "COMPLETED";
            case State::CANCELLED:
                return "CANCELLED";
            case State::FAILED:
                return "FAILED";
        }

        return "UNKNOWN";
    }

    RelationshipAnalyzer::RelationshipAnalyzer():
        _logger(createLogger("RelationshipAnalyzer")),
        _state(State::IDLE)
    {
    }

    RelationshipAnalyzer::State RelationshipAnalyzer::state() const {
        return _state.load(std::memory_order_acquire);
    }

    void RelationshipAnalyzer::transition(State next) {
        auto previous = _state.exchange(next, std::memory_order_acq_rel);
        _logger->debug("state: {} -> {}", stateName(previous), stateName(next));
    }

    void RelationshipAnalyzer::checkCancellation(const AnalysisOptions &options, const char *phase) {
        if (options.cancellationPredicate && options.cancellationPredicate()) {
            _logger->info("cancellation requested before {}", phase);
            throw AnalysisCancelled();
        }
    }

    void RelationshipAnalyzer::notifyProgress(const AnalysisOptions &options, const std::string &sourceName) {
        if (!options.progressCallback) {
            return;
        }

        try {
            options.progressCallback(sourceName);
        } catch (const std::exception &e) {
            _logger->warn("progress callback failed for {}: {}", sourceName, e.what());
        }
    }

    RelationshipReport RelationshipAnalyzer::analyze(DataSourceProvider &provider, const AnalysisOptions &options) {
        try {
            return runPipeline(provider, options);
        } catch (const AnalysisCancelled &) {
            transition(State::CANCELLED);
            throw;
        } catch (const ProviderUnavailable &e) {
            _logger->error("{}", e.what());
            transition(State::FAILED);
            throw;
        } catch (const std::exception &e) {
            _logger->error("analysis failed: {}", e.what());
            transition(State::FAILED);
            throw;
        }
    }

    RelationshipReport RelationshipAnalyzer::runPipeline(DataSourceProvider &provider, const AnalysisOptions &options) {
        const auto startedAt = std::chrono::steady_clock::now();

        transition(State::SCANNING);

        std::vector<std::shared_ptr<DataSource>> sources;
        try {
            sources = provider.listSources();
        } catch (const ProviderUnavailable &) {
            throw;
        } catch (const std::exception &e) {
            throw ProviderUnavailable(e.what());
        }

        _logger->info("scanning {} source(s)", sources.size());

        CandidateFieldExtractor extractor(CandidateFieldExtractor::Options {
            FieldNameFilter(options.fieldPatterns),
            ValueIndexBuilder::Limits { options.maxValueLength, options.maxDistinctValuesPerField }
        });

        auto extraction = extractor.extract(sources, [this, &options](const std::string &sourceName) {
            checkCancellation(options, "scanning source");
            notifyProgress(options, sourceName);
        });

        _logger->info("found {} candidate field(s) in {} source(s) ({} skipped, {} overflowed)",
                      extraction.fields.size(), extraction.sourcesScanned,
                      extraction.skippedSources.size(), extraction.overflowedFields);

        checkCancellation(options, "aggregation");
        transition(State::AGGREGATING);

        CooccurrenceAggregator aggregator(CooccurrenceAggregator::Options {
            options.sampleSize,
            options.threadCount
        });
        auto pairMatches = aggregator.aggregate(extraction.fields);

        _logger->info("{} field pair(s) share at least one value", pairMatches.size());

        checkCancellation(options, "scoring");
        transition(State::SCORING);

        RelationshipScorer scorer(RelationshipScorer::Options {
            options.minMatchCount,
            options.minConfidence
        });

        std::vector<RelationshipSnapshot> snapshots;
        for (const auto &pairMatch: pairMatches) {
            auto snapshot = scorer.score(pairMatch);
            if (snapshot.has_value()) {
                snapshots.push_back(std::move(*snapshot));
            }
        }

        std::sort(snapshots.begin(), snapshots.end(), RelationshipReport::snapshotOrder);
        snapshots = limitPerField(std::move(snapshots), options.maxRelationshipsPerField);

        EntityGroupGraph groupGraph;
        for (const auto &snapshot: snapshots) {
            groupGraph.addRelationship(snapshot);
        }

        ReportMetadata metadata;
        metadata.sourcesScanned = extraction.sourcesScanned;
        metadata.candidateFields = extraction.fields.size();
        metadata.overflowedFields = extraction.overflowedFields;
        metadata.pairsEvaluated = pairMatches.size();
        metadata.skippedSources = std::move(extraction.skippedSources);
        metadata.generatedAt = std::chrono::system_clock::now();
        metadata.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startedAt
        );

        RelationshipReport report(std::move(snapshots), std::move(metadata), groupGraph.groups());

        transition(State::COMPLETED);
        _logger->info("discovered {} relationship(s) in {} ms", report.snapshots().size(), report.elapsed().count());

        return report;
    }
}
