//
// Created by fieldrel on 10/17/26.
//

#include <atomic>
#include <fstream>
#include <iostream>
#include <thread>

#include <pthread.h>
#include <signal.h>

#include "analysis/RelationshipAnalyzer.hpp"
#include "config/AnalyzerConfig.hpp"
#include "source/JsonDirectoryProvider.hpp"

#include "utils/log.hpp"

#include "Application.hpp"

using namespace fieldrel;

class FieldRelScanApp: public fieldrel::Application {
public:
    FieldRelScanApp():
        Application(),
        _logger(createLogger("fieldrel_scan"))
    {
    }

    std::string optString() override {
        return "c:d:o:j:vVh";
    }

    void requestCancelFromSignal() {
        _cancelRequested.store(true, std::memory_order_release);
    }

    int main() override {
        if (isArgSet('h')) {
            std::cout <<
            "fieldrel_scan - discovers name-based relationships between configuration tables\n"
            "\n"
            "Usage: fieldrel_scan [-c CONFIG_FILE] [-d DIRECTORY] [-o OUTPUT] [-j THREADS] [-v|-V] [-h]\n"
            "\n"
            "Options:\n"
            "    -c file        JSON config file path\n"
            "    -d directory   directory of *.json tables (overrides source.directory)\n"
            "    -o file        write the JSON report to file instead of stdout\n"
            "    -j threads     aggregation worker count, 0 = auto (overrides aggregation.threadCount)\n"
            "    -v             set logger level to DEBUG\n"
            "    -V             set logger level to TRACE\n"
            "    -h             print this help and exit\n";

            return 0;
        }

        if (isArgSet('v')) {
            setLogLevel(spdlog::level::debug);
        }

        if (isArgSet('V')) {
            setLogLevel(spdlog::level::trace);
        }

        auto configOpt = isArgSet('c') ?
            config::AnalyzerConfig::loadFromFile(getArg('c')) :
            config::AnalyzerConfig::loadFromString("{}");

        if (!configOpt) {
            _logger->error("failed to load config");
            return 1;
        }
        auto config = *configOpt;

        if (isArgSet('d')) {
            config.source.directory = getArg('d');
        }

        if (isArgSet('j')) {
            try {
                config.aggregation.threadCount = std::stoi(getArg('j'));
            } catch (const std::exception &) {
                _logger->error("-j must be an integer: {}", getArg('j'));
                return 1;
            }

            if (config.aggregation.threadCount < 0) {
                _logger->error("-j must be >= 0");
                return 1;
            }
        }

        if (config.source.directory.empty()) {
            _logger->error("source directory must be specified (-d, source.directory or FIELDREL_SOURCE_DIR)");
            return 1;
        }

        size_t scannedCount = 0;

        auto options = config.makeAnalysisOptions();
        options.cancellationPredicate = [this]() {
            return _cancelRequested.load(std::memory_order_acquire);
        };
        options.progressCallback = [this, &scannedCount](const std::string &sourceName) {
            _logger->debug("[{}] scanning {}", ++scannedCount, sourceName);
        };

        JsonDirectoryProvider provider(config.source.directory, config.source.recursive);
        RelationshipAnalyzer analyzer;

        try {
            auto report = analyzer.analyze(provider, options);

            if (report.empty()) {
                _logger->info("no relationships found");
            }

            for (const auto &skipped: report.skippedSources()) {
                _logger->warn("skipped {}: {}", skipped.source, skipped.reason);
            }

            return writeReport(report);
        } catch (const AnalysisCancelled &) {
            _logger->info("analysis cancelled by user");
            return 2;
        } catch (const ProviderUnavailable &e) {
            _logger->error("{}", e.what());
            return 1;
        } catch (const std::exception &e) {
            _logger->error("analysis failed: {}", e.what());
            return 1;
        }
    }

private:
    int writeReport(const RelationshipReport &report) {
        const auto document = report.toJson().dump(2);

        if (!isArgSet('o')) {
            std::cout << document << std::endl;
            return 0;
        }

        std::ofstream outputStream(getArg('o'));
        if (!outputStream.is_open()) {
            _logger->error("cannot open output file: {}", getArg('o'));
            return 1;
        }

        outputStream << document << std::endl;
        if (!outputStream) {
            _logger->error("failed to write report to {}", getArg('o'));
            return 1;
        }

        _logger->info("report written to {}", getArg('o'));
        return 0;
    }

    LoggerPtr _logger;
    std::atomic<bool> _cancelRequested { false };
};

int main(int argc, char **argv) {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    FieldRelScanApp application;
    std::thread signalThread([&application, signals]() mutable {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0) {
            application.requestCancelFromSignal();
        }
    });
    signalThread.detach();

    return application.exec(argc, argv);
}
