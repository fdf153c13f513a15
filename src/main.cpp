#include "config.hpp"
#include "document_store.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "orchestrator.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr int kExitOk          = 0;
constexpr int kExitRunFailed   = 1;
constexpr int kExitConfigError = 2;
constexpr int kExitInterrupted = 130;

std::atomic<bool> gInterrupted{false};

void onSignal(int) {
    gInterrupted.store(true);
}

struct CliOptions {
    std::string                configPath = "shop_harvest.json";
    std::vector<std::string>   sources;
    bool                       all        = false;
    bool                       parallel   = false;
    std::optional<std::string> logLevel;
    std::optional<int>         batchSize;
};

void printUsage() {
    std::cout
        << "Usage: shop_harvest [options]\n\n"
        << "Options:\n"
        << "  --config PATH      JSON configuration     (default: shop_harvest.json)\n"
        << "  --source ID        Run one source (repeatable)\n"
        << "  --all              Run every configured source, ignoring target_sources\n"
        << "  --parallel         Run sources concurrently, one thread each\n"
        << "  --log-level L      error | warn | info | debug (default: info)\n"
        << "  --batch-size N     Records per persisted batch (default: 50)\n"
        << "  --help, -h         Show this message\n";
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions cli;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--config") && i + 1 < argc) {
            cli.configPath = argv[++i];
        } else if ((arg == "--source") && i + 1 < argc) {
            cli.sources.push_back(argv[++i]);
        } else if (arg == "--all") {
            cli.all = true;
        } else if (arg == "--parallel") {
            cli.parallel = true;
        } else if ((arg == "--log-level") && i + 1 < argc) {
            cli.logLevel = argv[++i];
        } else if ((arg == "--batch-size") && i + 1 < argc) {
            try {
                cli.batchSize = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                throw shop_harvest::ConfigError(std::string("--batch-size expects a number, got ") +
                                                argv[i]);
            }
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(kExitOk);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(kExitConfigError);
        }
    }
    return cli;
}

void printSummary(const std::vector<shop_harvest::CrawlRunResult>& results) {
    std::cout << "\n=== Summary Report ===\n";
    for (const auto& r : results) {
        std::cout
            << std::left << std::setw(8) << r.sourceId << "  "
            << std::setw(24) << r.sourceName << "  "
            << std::setw(8) << shop_harvest::toString(r.status)
            << "  total=" << r.totalRecords
            << " new=" << r.newRecords
            << " updated=" << r.updatedRecords
            << " geocoded=" << r.geocodedRecords
            << " pages=" << r.pagesCompleted
            << " time=" << std::fixed << std::setprecision(1)
            << r.durationSeconds.value_or(0.0) << "s\n";
        for (const auto& error : r.errors) {
            std::cout << "          ! " << error << "\n";
        }
    }
    std::cout << "======================\n";
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace shop_harvest;

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    try {
        CliOptions cli = parseArgs(argc, argv);

        if (cli.logLevel) {
            auto level = Logger::parseLevel(*cli.logLevel);
            if (!level) {
                throw ConfigError("Unknown log level: " + *cli.logLevel);
            }
            Logger::setLevel(*level);
        }

        AppConfig config = loadConfig(cli.configPath);
        if (cli.batchSize) {
            if (*cli.batchSize < 1) {
                throw ConfigError("--batch-size must be >= 1");
            }
            config.batchSize = static_cast<std::size_t>(*cli.batchSize);
        }
        if (cli.all) {
            config.targetSources.clear();
        } else if (!cli.sources.empty()) {
            config.targetSources = cli.sources;
        }
        const auto selected = config.selectedSources();

        std::cout
            << "=== shop_harvest ===\n"
            << "Environment: " << config.environment      << "\n"
            << "Data dir:    " << config.dataDir.string() << "\n"
            << "Batch size:  " << config.batchSize        << "\n"
            << "Sources:     " << selected.size() << "\n"
            << "Geocoding:   " << (config.geocoding.enabled ? "on" : "off") << "\n"
            << "Slack:       " << (config.slack.enabled ? "on" : "off") << "\n"
            << "====================\n";

        JsonFileDocumentStore store(config.dataDir);
        Orchestrator orchestrator(std::move(config), store);
        orchestrator.setCancelFlag(&gInterrupted);

        const auto results = orchestrator.runAll(cli.parallel);
        printSummary(results);

        if (gInterrupted.load()) {
            return kExitInterrupted;
        }
        for (const auto& r : results) {
            if (r.status == RunStatus::Failed) {
                return kExitRunFailed;
            }
        }
        return kExitOk;

    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return kExitConfigError;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitRunFailed;
    }
}
