// EN: Entry point of the concat tool. Parses `concat combine ...`, layers the configuration and runs the job.
// FR: Point d'entrée de l'outil concat. Analyse `concat combine ...`, superpose la configuration et lance le job.

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "csv/combine_errors.hpp"
#include "infrastructure/cli/config_override.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "orchestrator/combine_job.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void setupParser(ConCat::CLI::ConfigOverrideParser& parser) {
    parser.setProgramName("concat");
    parser.setUsage("concat combine (-d DIR | --glob PATTERN... | -i FILE...) -o FILE [options]");
    parser.setHelpHeader("Merge CSV/TSV files with heterogeneous delimiters and column sets into one output.");
    parser.setHelpFooter("Configuration precedence: defaults < --config FILE < CONCAT_COMBINE_<KEY> < command line.");
    parser.setVersionInfo(CONCAT_VERSION);
    parser.addOptions(ConCat::CombineOptions::optionDefinitions());
    parser.addExclusiveGroup("input", false);
}

std::optional<std::string> parsedValue(const ConCat::CLI::CliParseResult& result, const std::string& option) {
    for (const auto& parsed : result.parsed_options) {
        if (parsed.option_name == option && !parsed.raw_values.empty()) {
            return parsed.raw_values.front();
        }
    }
    return std::nullopt;
}

// EN: Logging settings come from the merged "logging" section
// FR: Les réglages de journalisation viennent de la section "logging" fusionnée
void configureLogging(const ConCat::ConfigManager& config) {
    auto& logger = ConCat::Logger::getInstance();
    logger.setCorrelationId(logger.generateCorrelationId());

    std::string level = config.get("logging", "level").asOrDefault<std::string>("");
    if (!level.empty()) {
        logger.setLogLevel(ConCat::Logger::parseLevel(level));
    }
    if (config.get("logging", "verbose").asOrDefault<bool>(false)) {
        logger.setLogLevel(ConCat::LogLevel::DEBUG);
    }

    std::string file = config.get("logging", "file").asOrDefault<std::string>("");
    if (!file.empty() && !logger.setOutputFile(file)) {
        throw ConCat::CSV::IoError("Cannot open log file " + file);
    }
}

// EN: Installs the SIGINT/SIGTERM handlers for the duration of the run
// FR: Installe les handlers SIGINT/SIGTERM pendant la durée de l'exécution
class SignalScope {
public:
    SignalScope() { ConCat::SignalHandler::getInstance().initialize(); }
    ~SignalScope() { ConCat::SignalHandler::getInstance().restore(); }

    SignalScope(const SignalScope&) = delete;
    SignalScope& operator=(const SignalScope&) = delete;
};

} // namespace

int main(int argc, char* argv[]) {
    ConCat::CLI::ConfigOverrideParser parser;
    setupParser(parser);

    ConCat::CLI::CliParseResult result = parser.parse(argc, argv);
    switch (result.status) {
        case ConCat::CLI::CliParseStatus::HELP_REQUESTED:
            std::cout << result.help_text;
            return kExitOk;
        case ConCat::CLI::CliParseStatus::VERSION_REQUESTED:
            std::cout << result.version_text;
            return kExitOk;
        default:
            break;
    }

    if (result.ok() && (result.positionals.size() != 1 || result.positionals.front() != "combine")) {
        result.errors.push_back(result.positionals.empty()
            ? "Missing command (expected 'combine')"
            : "Unknown command or extra argument: '" + result.positionals.front() + "'");
    }
    if (!result.ok() || !result.errors.empty()) {
        LOG_DEBUG("main", "Command line rejected: " +
                  ConCat::CLI::ConfigOverrideUtils::cliParseStatusToString(result.status));
        for (const auto& error : result.errors) {
            std::cerr << "concat: error: " << error << "\n";
        }
        std::cerr << "Try 'concat --help' for more information.\n";
        return kExitUsage;
    }

    auto& config = ConCat::ConfigManager::getInstance();
    try {
        SignalScope signals;
        parser.applyDefaults(config);
        if (auto config_file = parsedValue(result, "config")) {
            config.loadFromFile(*config_file);
        }
        config.loadEnvironmentOverrides("CONCAT_");
        ConCat::CLI::ConfigOverrideParser::applyOverrides(result, config);

        configureLogging(config);
        LOG_DEBUG("main", "Effective configuration:\n" + config.dump());

        ConCat::CombineOptions options = ConCat::CombineOptions::fromConfig(config, "combine");
        ConCat::CombineJob job(std::move(options));
        ConCat::CombineOutcome outcome = job.run(std::cerr);

        if (!outcome.dry_run) {
            std::cerr << "[DONE] Combined successfully. " << outcome.rows_written << " rows written to "
                      << job.getOptions().merge.output_path.string() << "\n";
        }
        ConCat::Logger::getInstance().flush();
        return kExitOk;
    } catch (const ConCat::CSV::CombineError& e) {
        if (e.code() == ConCat::CSV::CombineErrorCode::INTERRUPTED) {
            const auto& handler = ConCat::SignalHandler::getInstance();
            LOG_WARN("main", "Stopped after signal " + std::to_string(handler.lastSignal()) + " (" +
                     std::to_string(handler.signalCount()) + " received)");
            std::cerr << "Interrupted.\n";
        } else {
            LOG_ERROR("main", std::string(ConCat::CSV::combineErrorCodeToString(e.code())) + ": " + e.what());
            std::cerr << "ERROR: " << e.what() << "\n";
        }
        ConCat::Logger::getInstance().flush();
        return e.exitCode();
    } catch (const std::exception& e) {
        LOG_ERROR("main", e.what());
        std::cerr << "ERROR: " << e.what() << "\n";
        ConCat::Logger::getInstance().flush();
        return kExitFailure;
    }
}
