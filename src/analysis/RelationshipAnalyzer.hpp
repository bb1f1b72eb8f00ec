//
// Created by fieldrel on 10/17/26.
//

#ifndef FIELDREL_RELATIONSHIPANALYZER_HPP
#define FIELDREL_RELATIONSHIPANALYZER_HPP

#include <atomic>
#include <string>

#include "source/DataSource.hpp"

#include "AnalysisErrors.hpp"
#include "AnalysisOptions.hpp"
#include "RelationshipReport.hpp"

#include "utils/log.hpp"

namespace fieldrel {
    /**
     * @brief drives a single relationship discovery run.
     *
     * @details
     * <pre>
     *   IDLE -> SCANNING -> AGGREGATING -> SCORING -> COMPLETED
     *              \______________\____________\______> CANCELLED
     *              \______________\____________\______> FAILED
     * </pre>
     * one analyzer must not run two analyze() calls at the same time;
     * independent analyzers may run in parallel.
     */
    class RelationshipAnalyzer {
    public:
        enum class State {
            IDLE,
            SCANNING,
            AGGREGATING,
            SCORING,
            COMPLETED,
            CANCELLED,
            FAILED
        };
        
        static std::string stateName(State state);
        
        RelationshipAnalyzer();
        
        /**
         * @throws AnalysisCancelled when options.cancellationPredicate returns true
         * @throws ProviderUnavailable when the provider cannot enumerate its sources
         */
        RelationshipReport analyze(DataSourceProvider &provider, const AnalysisOptions &options);
        
        /**
         * @note safe to call from any thread
         */
        State state() const;
        
    private:
        void transition(State next);
        void checkCancellation(const AnalysisOptions &options, const char *phase);
        void notifyProgress(const AnalysisOptions &options, const std::string &sourceName);
        
        RelationshipReport runPipeline(DataSourceProvider &provider, const AnalysisOptions &options);
        
        LoggerPtr _logger;
        std::atomic<State> _state;
    };
}

#endif //FIELDREL_RELATIONSHIPANALYZER_HPP
