// EN: Combine job implementation
// FR: Implémentation du job de combinaison

#include "orchestrator/combine_job.hpp"
#include "csv/combine_errors.hpp"
#include "csv/delimiter_sniffer.hpp"
#include "csv/header_reader.hpp"
#include "csv/normalizer.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/scoped_workspace.hpp"
#include "infrastructure/system/signal_handler.hpp"

#include <algorithm>
#include <chrono>
#include <ostream>
#include <set>
#include <stdexcept>

namespace ConCat {

namespace {

const std::string kInputGroup = "input";

std::optional<std::string> readString(const ConfigManager& config, const std::string& section, const std::string& key) {
    ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return std::nullopt;
    }
    if (auto text = value.tryAs<std::string>()) {
        return *text;
    }
    return value.toString();
}

long readInteger(const ConfigManager& config, const std::string& section, const std::string& key, long fallback) {
    ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return fallback;
    }
    if (auto number = value.tryAs<int>()) {
        return *number;
    }
    if (auto text = value.tryAs<std::string>()) {
        try {
            return ConfigManager::coerce(*text, ConfigValue(0)).as<int>();
        } catch (const std::invalid_argument& e) {
            throw CSV::ConfigurationError("Invalid value for " + section + "." + key + ": " + e.what());
        }
    }
    throw CSV::ConfigurationError("Invalid value for " + section + "." + key + ": expected an integer, got " +
                                  value.typeName());
}

bool readBool(const ConfigManager& config, const std::string& section, const std::string& key, bool fallback) {
    ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return fallback;
    }
    if (auto flag = value.tryAs<bool>()) {
        return *flag;
    }
    if (auto text = value.tryAs<std::string>()) {
        try {
            return ConfigManager::coerce(*text, ConfigValue(false)).as<bool>();
        } catch (const std::invalid_argument& e) {
            throw CSV::ConfigurationError("Invalid value for " + section + "." + key + ": " + e.what());
        }
    }
    throw CSV::ConfigurationError("Invalid value for " + section + "." + key + ": expected a boolean, got " +
                                  value.typeName());
}

// EN: Accepts a YAML sequence or a comma-separated string
// FR: Accepte une séquence YAML ou une chaîne séparée par des virgules
std::vector<std::string> readList(const ConfigManager& config, const std::string& section, const std::string& key) {
    ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return {};
    }
    if (auto items = value.tryAs<std::vector<std::string>>()) {
        return *items;
    }
    if (auto text = value.tryAs<std::string>()) {
        return ConfigManager::coerce(*text, ConfigValue(std::vector<std::string>{})).as<std::vector<std::string>>();
    }
    return {value.toString()};
}

size_t positive(long value, const std::string& option) {
    if (value <= 0) {
        throw CSV::ConfigurationError(option + " must be a positive integer, got " + std::to_string(value));
    }
    return static_cast<size_t>(value);
}

std::string formatDelimiterSet(std::vector<char> delimiters) {
    std::sort(delimiters.begin(), delimiters.end());
    std::vector<std::string> shown;
    for (char d : delimiters) {
        shown.push_back(CSV::delimiterDisplay(d));
    }
    return CSV::formatNameList(shown);
}

std::vector<std::string> supportedDelimiterNames() {
    std::vector<std::string> names;
    for (const auto& [name, delimiter] : CSV::supportedDelimiters()) {
        names.push_back(name);
    }
    return names;
}

std::string joinNames(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ",";
        out += names[i];
    }
    return out;
}

} // namespace

// EN: CombineOptions
// FR: CombineOptions

CombineOptions CombineOptions::fromConfig(const ConfigManager& config, const std::string& section) {
    CombineOptions options;

    std::string directory = readString(config, section, "directory").value_or("");
    std::vector<std::string> patterns = readList(config, section, "glob");
    std::vector<std::string> input_files = readList(config, section, "input_files");

    int designations = (directory.empty() ? 0 : 1) + (patterns.empty() ? 0 : 1) + (input_files.empty() ? 0 : 1);
    if (designations != 1) {
        throw CSV::ConfigurationError(designations == 0
            ? "One of --directory, --glob, --input-files is required"
            : "Options --directory, --glob, --input-files are mutually exclusive");
    }
    if (!directory.empty()) {
        options.discovery.mode = CSV::InputMode::DIRECTORY;
        options.discovery.directory = directory;
    } else if (!patterns.empty()) {
        options.discovery.mode = CSV::InputMode::GLOB;
        options.discovery.patterns = patterns;
    } else {
        options.discovery.mode = CSV::InputMode::FILES;
        for (const auto& file : input_files) {
            options.discovery.files.emplace_back(file);
        }
    }

    std::string extension = readString(config, section, "extension").value_or("");
    if (!extension.empty()) {
        options.discovery.extension = extension;
    }

    options.sample_rows = positive(readInteger(config, section, "sample_rows", 50), "--sample-rows");

    std::string normalize = readString(config, section, "normalize").value_or("");
    if (!normalize.empty()) {
        options.normalize_to = CSV::delimiterFromName(normalize);
    }

    options.schema_policy = CSV::schemaPolicyFromString(readString(config, section, "schema").value_or("strict"));
    options.columns = readList(config, section, "columns");
    options.missing_policy = CSV::missingPolicyFromString(readString(config, section, "missing_policy").value_or("error"));
    options.case_insensitive = readBool(config, section, "case_insensitive", false);

    options.merge.source_column.enabled = !readBool(config, section, "no_source_col", false);
    options.merge.source_column.name = readString(config, section, "source_col_name").value_or("source_file");
    options.merge.source_column.mode =
        CSV::sourceColumnModeFromString(readString(config, section, "source_col_mode").value_or("name"));

    options.merge.chunk_size = positive(readInteger(config, section, "chunksize", 200000), "--chunksize");
    options.threads = positive(readInteger(config, section, "threads", 4), "--threads");

    options.merge.output_path = readString(config, section, "out").value_or("");
    options.merge.output_delimiter = CSV::delimiterFromName(readString(config, section, "out_delim").value_or("comma"));
    options.merge.write_header = !readBool(config, section, "no_header", false);

    options.dry_run = readBool(config, section, "dry_run", false);
    std::string report = readString(config, section, "report_json").value_or("");
    if (!report.empty()) {
        options.report_json = report;
    }
    options.scratch_dir = readString(config, section, "scratch_dir").value_or("");

    options.validate();
    return options;
}

void CombineOptions::validate() const {
    merge.validate();
    if (sample_rows == 0) {
        throw CSV::ConfigurationError("--sample-rows must be a positive integer");
    }
    if (threads == 0) {
        throw CSV::ConfigurationError("--threads must be a positive integer");
    }
    for (const auto& column : columns) {
        if (column.empty()) {
            throw CSV::ConfigurationError("--columns contains an empty column name");
        }
    }
}

std::vector<CLI::CliOptionDefinition> CombineOptions::optionDefinitions() {
    using CLI::CliOptionConstraint;
    using CLI::CliOptionDefinition;
    using CLI::CliOptionType;

    const std::vector<std::string> delimiter_names = supportedDelimiterNames();
    const std::set<std::string> delimiter_set(delimiter_names.begin(), delimiter_names.end());
    const std::string delimiter_metavar = "{" + joinNames(delimiter_names) + "}";

    std::vector<CliOptionDefinition> defs;

    // EN: Inputs, exactly one per run
    // FR: Entrées, exactement une par exécution
    defs.push_back({"directory", 'd', CliOptionType::STRING, "Directory whose regular files are merged",
                    "combine.directory", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, kInputGroup, "DIR", "Input"});
    defs.push_back({"glob", std::nullopt, CliOptionType::STRING_LIST, "One or more glob patterns",
                    "combine.glob", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, kInputGroup, "PATTERN", "Input"});
    defs.push_back({"input-files", 'i', CliOptionType::STRING_LIST, "Explicit list of input files",
                    "combine.input_files", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, kInputGroup, "FILE", "Input"});
    defs.push_back({"extension", 'e', CliOptionType::STRING, "Required file extension (csv, tsv, txt...)",
                    "combine.extension", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, "", "EXT", "Input"});
    defs.push_back({"sample-rows", std::nullopt, CliOptionType::INTEGER, "Lines sampled per file for delimiter detection",
                    "combine.sample_rows", "50", false, false, false,
                    CliOptionConstraint::POSITIVE, {}, "", "N", "Input"});
    defs.push_back({"normalize", std::nullopt, CliOptionType::STRING, "Rewrite mixed-delimiter inputs to one delimiter",
                    "combine.normalize", std::nullopt, false, false, false,
                    CliOptionConstraint::ENUM_VALUES, delimiter_set, "", delimiter_metavar, "Input"});

    // EN: Schema
    // FR: Schéma
    defs.push_back({"schema", std::nullopt, CliOptionType::STRING, "Column reconciliation policy",
                    "combine.schema", "strict", false, false, false,
                    CliOptionConstraint::ENUM_VALUES,
                    {"strict", "union", "intersection"}, "", "{strict,union,intersection}", "Schema"});
    defs.push_back({"columns", std::nullopt, CliOptionType::STRING_LIST, "Explicit output columns (overrides --schema)",
                    "combine.columns", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, "", "COL", "Schema"});
    defs.push_back({"missing-policy", std::nullopt, CliOptionType::STRING, "Files lacking requested columns",
                    "combine.missing_policy", "error", false, false, false,
                    CliOptionConstraint::ENUM_VALUES,
                    {"error", "skip", "fillna"}, "", "{error,skip,fillna}", "Schema"});
    defs.push_back({"case-insensitive", std::nullopt, CliOptionType::BOOLEAN, "Match requested columns ignoring case",
                    "combine.case_insensitive", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, "", "", "Schema"});

    // EN: Source column
    // FR: Colonne source
    defs.push_back({"no-source-col", std::nullopt, CliOptionType::BOOLEAN, "Do not add the source column",
                    "combine.no_source_col", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, "", "", "Source column"});
    defs.push_back({"source-col-name", std::nullopt, CliOptionType::STRING, "Name of the source column",
                    "combine.source_col_name", "source_file", false, false, false,
                    CliOptionConstraint::NONE, {}, "", "NAME", "Source column"});
    defs.push_back({"source-col-mode", std::nullopt, CliOptionType::STRING, "Value written in the source column",
                    "combine.source_col_mode", "name", false, false, false,
                    CliOptionConstraint::ENUM_VALUES,
                    {"name", "stem", "path"}, "", "{name,stem,path}", "Source column"});

    // EN: Output
    // FR: Sortie
    defs.push_back({"out", 'o', CliOptionType::STRING, "Output file (.gz for gzip)",
                    "combine.out", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, "", "FILE", "Output"});
    defs.push_back({"out-delim", std::nullopt, CliOptionType::STRING, "Output delimiter",
                    "combine.out_delim", "comma", false, false, false,
                    CliOptionConstraint::ENUM_VALUES, delimiter_set, "", delimiter_metavar, "Output"});
    defs.push_back({"no-header", std::nullopt, CliOptionType::BOOLEAN, "Do not write the header row",
                    "combine.no_header", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, "", "", "Output"});
    defs.push_back({"chunksize", std::nullopt, CliOptionType::INTEGER, "Rows held in memory per read",
                    "combine.chunksize", "200000", false, false, false,
                    CliOptionConstraint::POSITIVE, {}, "", "N", "Output"});

    // EN: Execution
    // FR: Exécution
    defs.push_back({"threads", 'T', CliOptionType::INTEGER, "Worker threads for normalization",
                    "combine.threads", "4", false, false, false,
                    CliOptionConstraint::POSITIVE, {}, "", "N", "Execution"});
    defs.push_back({"dry-run", std::nullopt, CliOptionType::BOOLEAN, "Validate and print a summary without writing",
                    "combine.dry_run", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, "", "", "Execution"});
    defs.push_back({"report-json", std::nullopt, CliOptionType::STRING, "Also write the run summary as JSON",
                    "combine.report_json", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, "", "FILE", "Execution"});
    defs.push_back({"config", std::nullopt, CliOptionType::STRING, "YAML configuration file (section 'combine')",
                    "", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, "", "FILE", "Execution"});

    // EN: Logging
    // FR: Journalisation
    defs.push_back({"log-file", std::nullopt, CliOptionType::STRING, "Append NDJSON logs to this file instead of stderr",
                    "logging.file", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, "", "FILE", "Logging"});
    defs.push_back({"verbose", 'V', CliOptionType::BOOLEAN, "Debug-level logging",
                    "logging.verbose", std::nullopt, false, false, false,
                    CliOptionConstraint::NONE, {}, "", "", "Logging"});

    return defs;
}

// EN: CombineJob
// FR: CombineJob

CombineJob::CombineJob(CombineOptions options) : options_(std::move(options)) {
    options_.validate();
}

CombineOutcome CombineJob::run(std::ostream& out) {
    auto start_time = std::chrono::steady_clock::now();

    CSV::PathResolver resolver;
    CSV::DiscoveryResult discovery = resolver.resolve(options_.discovery);
    LOG_INFO("combine", "[INPUT] " + std::to_string(discovery.files.size()) + " file(s) with extension ." +
             discovery.extension);
    for (const auto& path : discovery.files) {
        LOG_DEBUG("combine", " - " + path.string());
    }
    ensureOutputIsNotAnInput(discovery.files);

    std::vector<CSV::SourceFile> files = sniffAll(discovery.files);

    // EN: Scratch files live until run() returns or throws
    // FR: Les fichiers temporaires vivent jusqu'au retour ou à l'exception de run()
    ScopedWorkspace workspace("concat_norm_", options_.scratch_dir);
    bool normalized = false;

    std::vector<char> delimiters = CSV::Normalizer::distinctDelimiters(files);
    if (delimiters.size() > 1) {
        if (!options_.normalize_to.has_value()) {
            throw CSV::DelimiterConflictError(
                "Inconsistent delimiters detected: " + formatDelimiterSet(delimiters) +
                ". Use --normalize {" + joinNames(supportedDelimiterNames()) + "} to convert.",
                delimiters);
        }
        validateHeaders(files);

        LOG_INFO("combine", "[NORMALIZE] Mixed delimiters " + formatDelimiterSet(delimiters) +
                 " -> normalizing to '" + CSV::delimiterName(*options_.normalize_to) + "'");
        CSV::NormalizerConfig normalizer_config;
        normalizer_config.target_delimiter = *options_.normalize_to;
        normalizer_config.chunk_size = options_.merge.chunk_size;
        normalizer_config.thread_count = options_.threads;
        CSV::Normalizer normalizer(normalizer_config);
        files = normalizer.normalize(files, workspace);
        normalized = true;
    }

    validateHeaders(files);
    checkInterrupted();

    CSV::SchemaPlan plan = options_.columns.empty()
        ? CSV::SchemaReconciler::planReconciled(files, options_.schema_policy)
        : CSV::SchemaReconciler::planRequested(files, options_.columns, options_.case_insensitive,
                                               options_.missing_policy);
    if (plan.mode == CSV::SchemaMode::REQUESTED) {
        LOG_INFO("combine", "[COLUMNS] requested=" + CSV::formatNameList(plan.columns));
        if (!plan.skipped.empty()) {
            LOG_INFO("combine", "[COLUMNS] skipped " + std::to_string(plan.skipped.size()) +
                     " file(s) due to missing columns");
        }
    } else {
        LOG_INFO("combine", "[SCHEMA] policy=" + CSV::schemaPolicyToString(plan.policy) + " -> " +
                 std::to_string(plan.columns.size()) + " columns");
        LOG_DEBUG("combine", "[SCHEMA] columns=" + CSV::formatNameList(plan.columns));
    }

    CSV::MergerEngine engine(options_.merge);
    engine.outputColumns(plan);

    CombineOutcome outcome;
    outcome.dry_run = options_.dry_run;
    outcome.files_merged = plan.files.size();
    outcome.summary = buildSummary(discovery, plan, normalized);

    if (options_.dry_run) {
        DryRunConfig dry_config;
        dry_config.report_json_path = options_.report_json;
        DryRunSystem dry_run(dry_config);
        dry_run.present(outcome.summary, out);
        return outcome;
    }

    checkInterrupted();
    outcome.rows_written = engine.merge(plan);
    outcome.merge_report = engine.getStatistics().generateReport();
    LOG_DEBUG("combine", outcome.merge_report);

    outcome.summary.dry_run = false;
    outcome.summary.rows_written = outcome.rows_written;
    if (options_.report_json.has_value()) {
        DryRunSystem reporter;
        if (!reporter.exportReport(outcome.summary, *options_.report_json, "json")) {
            throw CSV::IoError("Cannot write JSON report to " + *options_.report_json);
        }
        LOG_INFO("combine", "JSON report written to " + *options_.report_json);
    }

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time);
    LOG_INFO_META("combine", "Combined successfully", (std::unordered_map<std::string, std::string>{
        {"files", std::to_string(outcome.files_merged)},
        {"rows", std::to_string(outcome.rows_written)},
        {"output", options_.merge.output_path.string()},
        {"seconds", std::to_string(elapsed.count())}
    }));
    return outcome;
}

void CombineJob::validateHeaders(const std::vector<CSV::SourceFile>& files) {
    std::vector<std::string> empties;
    for (const auto& file : files) {
        if (file.header().empty()) {
            empties.push_back(file.origin().filename().string());
        }
    }
    if (!empties.empty()) {
        throw CSV::HeaderReadError("Could not read header row from: " + CSV::formatNameList(empties) +
                                   ". Are these empty or malformed?", empties);
    }
}

std::vector<CSV::SourceFile> CombineJob::sniffAll(const std::vector<std::filesystem::path>& paths) const {
    CSV::DelimiterSniffer sniffer(options_.sample_rows);
    std::vector<CSV::SourceFile> files;
    files.reserve(paths.size());

    for (const auto& path : paths) {
        checkInterrupted();
        CSV::SniffResult sniffed = sniffer.sniffFile(path);
        std::vector<std::string> header = CSV::HeaderReader::readHeader(path, sniffed.delimiter);
        LOG_DEBUG("sniffer", "[SNIFF] " + path.filename().string() + ": delim='" +
                  CSV::delimiterDisplay(sniffed.delimiter) + "'" + (sniffed.used_fallback ? " (fallback)" : "") +
                  " | header=" + CSV::formatNameList(header));
        files.emplace_back(path, path, sniffed.delimiter, std::move(header));
    }
    return files;
}

void CombineJob::ensureOutputIsNotAnInput(const std::vector<std::filesystem::path>& paths) const {
    std::error_code ec;
    std::filesystem::path output = std::filesystem::weakly_canonical(
        std::filesystem::absolute(options_.merge.output_path), ec);
    if (ec) {
        return;
    }
    if (std::find(paths.begin(), paths.end(), output) != paths.end()) {
        throw CSV::ConfigurationError("Output file " + output.string() + " is also an input file");
    }
}

DryRunSummary CombineJob::buildSummary(const CSV::DiscoveryResult& discovery, const CSV::SchemaPlan& plan,
                                       bool normalized) const {
    DryRunSummary summary;
    for (const auto& file : plan.files) {
        summary.files.push_back(file.origin().string());
    }
    summary.extension = discovery.extension;
    summary.delimiters = CSV::Normalizer::distinctDelimiters(plan.files);
    if (normalized) {
        summary.normalized_to = options_.normalize_to;
    }
    summary.mode = plan.mode;
    summary.policy = plan.policy;
    summary.missing_policy = plan.missing_policy;
    summary.case_insensitive = plan.case_insensitive;
    summary.columns = plan.columns;
    summary.skipped = plan.skipped;
    summary.source_column = options_.merge.source_column;
    summary.output_path = options_.merge.output_path.string();
    summary.output_delimiter = options_.merge.output_delimiter;
    summary.write_header = options_.merge.write_header;
    summary.dry_run = options_.dry_run;
    return summary;
}

void CombineJob::checkInterrupted() {
    if (SignalHandler::getInstance().isShutdownRequested()) {
        throw CSV::InterruptedError();
    }
}

} // namespace ConCat
