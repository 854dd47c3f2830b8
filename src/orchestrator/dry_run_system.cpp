// EN: Dry run reporting implementation
// FR: Implémentation du rapport de simulation

#include "orchestrator/dry_run_system.hpp"
#include "csv/combine_errors.hpp"
#include "infrastructure/logging/logger.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace ConCat {

namespace {

std::string isoTimestamp(const std::chrono::system_clock::time_point& tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace

namespace detail {

bool IReportGenerator::exportToFile(const std::string& report, const std::string& file_path) {
    std::filesystem::path target(file_path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return false;
        }
    }
    std::ofstream file(target, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << report;
    file.close();
    return !file.fail();
}

std::string TextReportGenerator::generateReport(const DryRunSummary& summary) {
    std::ostringstream oss;
    oss << "[DRY-RUN] Summary:\n";
    oss << "  Files: " << summary.files.size() << "\n";
    oss << "  Extension: ." << summary.extension << "\n";
    if (summary.delimiters.size() == 1) {
        oss << "  Unified delimiter: '" << CSV::delimiterDisplay(summary.delimiters.front()) << "'";
    } else {
        std::vector<std::string> shown;
        for (char d : summary.delimiters) {
            shown.push_back(CSV::delimiterDisplay(d));
        }
        oss << "  Delimiters: " << CSV::formatNameList(shown);
    }
    if (summary.normalized_to.has_value()) {
        oss << " (normalized to " << CSV::delimiterName(*summary.normalized_to) << ")";
    }
    oss << "\n";

    if (summary.mode == CSV::SchemaMode::REQUESTED) {
        oss << "  Columns mode: " << CSV::formatNameList(summary.columns) << "\n";
        oss << "  Missing-policy: " << CSV::missingPolicyToString(summary.missing_policy) << "\n";
        oss << "  Case-insensitive: " << DryRunUtils::boolToString(summary.case_insensitive) << "\n";
        if (!summary.skipped.empty()) {
            oss << "  Skipped files: " << summary.skipped.size() << "\n";
            for (const auto& skipped : summary.skipped) {
                oss << "    - " << skipped.file << ": missing " << CSV::formatNameList(skipped.missing) << "\n";
            }
        }
    } else {
        oss << "  Schema policy: " << CSV::schemaPolicyToString(summary.policy) << "\n";
        oss << "  Columns: " << CSV::formatNameList(summary.columns) << "\n";
    }

    oss << "  Source column: " << (summary.source_column.enabled ? "ON" : "OFF")
        << " | name='" << summary.source_column.name << "'"
        << " | mode=" << CSV::sourceColumnModeToString(summary.source_column.mode) << "\n";
    oss << "  Output: " << summary.output_path
        << " (delim=" << CSV::delimiterName(summary.output_delimiter)
        << ", header=" << DryRunUtils::boolToString(summary.write_header) << ")\n";
    return oss.str();
}

std::string JsonReportGenerator::generateReport(const DryRunSummary& summary) {
    return convertSummaryToJson(summary).dump(2) + "\n";
}

nlohmann::json JsonReportGenerator::convertSummaryToJson(const DryRunSummary& summary) {
    nlohmann::json report;
    report["generated_at"] = isoTimestamp(summary.generated_at);
    report["dry_run"] = summary.dry_run;
    report["files"] = summary.files;
    report["file_count"] = summary.files.size();
    report["extension"] = summary.extension;

    nlohmann::json delimiters = nlohmann::json::array();
    for (char d : summary.delimiters) {
        delimiters.push_back(CSV::delimiterName(d));
    }
    report["delimiters"] = delimiters;
    report["normalized_to"] = summary.normalized_to.has_value()
        ? nlohmann::json(CSV::delimiterName(*summary.normalized_to))
        : nlohmann::json(nullptr);

    nlohmann::json schema;
    schema["mode"] = CSV::schemaModeToString(summary.mode);
    schema["columns"] = summary.columns;
    if (summary.mode == CSV::SchemaMode::REQUESTED) {
        schema["missing_policy"] = CSV::missingPolicyToString(summary.missing_policy);
        schema["case_insensitive"] = summary.case_insensitive;
        nlohmann::json skipped = nlohmann::json::array();
        for (const auto& file : summary.skipped) {
            skipped.push_back(nlohmann::json{{"file", file.file}, {"missing", file.missing}});
        }
        schema["skipped"] = skipped;
    } else {
        schema["policy"] = CSV::schemaPolicyToString(summary.policy);
    }
    report["schema"] = schema;

    report["source_column"] = {
        {"enabled", summary.source_column.enabled},
        {"name", summary.source_column.name},
        {"mode", CSV::sourceColumnModeToString(summary.source_column.mode)}
    };
    report["output"] = {
        {"path", summary.output_path},
        {"delimiter", CSV::delimiterName(summary.output_delimiter)},
        {"header", summary.write_header}
    };
    if (summary.rows_written.has_value()) {
        report["rows_written"] = *summary.rows_written;
    }
    return report;
}

} // namespace detail

DryRunSystem::DryRunSystem(const DryRunConfig& config) : config_(config) {
    generators_["text"] = std::make_unique<detail::TextReportGenerator>();
    generators_["json"] = std::make_unique<detail::JsonReportGenerator>();
}

DryRunSystem::~DryRunSystem() = default;

void DryRunSystem::registerReportGenerator(const std::string& format, std::unique_ptr<detail::IReportGenerator> generator) {
    if (!generator) {
        throw std::invalid_argument("Report generator for '" + format + "' is null");
    }
    generators_[format] = std::move(generator);
}

std::string DryRunSystem::generateReport(const DryRunSummary& summary, const std::string& format) {
    auto it = generators_.find(format);
    if (it == generators_.end()) {
        throw std::invalid_argument("Unknown report format: " + format);
    }
    return it->second->generateReport(summary);
}

bool DryRunSystem::exportReport(const DryRunSummary& summary, const std::string& file_path, const std::string& format) {
    auto it = generators_.find(format);
    if (it == generators_.end()) {
        throw std::invalid_argument("Unknown report format: " + format);
    }
    return it->second->exportToFile(it->second->generateReport(summary), file_path);
}

void DryRunSystem::present(const DryRunSummary& summary, std::ostream& out) {
    std::string text = generateReport(summary, "text");
    out << text;
    out.flush();

    if (config_.log_summary) {
        LOG_INFO_META("dry_run", "Dry run summary", (std::unordered_map<std::string, std::string>{
            {"files", std::to_string(summary.files.size())},
            {"columns", std::to_string(summary.columns.size())},
            {"output", summary.output_path}
        }));
    }

    if (config_.report_json_path.has_value() && !config_.report_json_path->empty()) {
        if (!exportReport(summary, *config_.report_json_path, "json")) {
            throw CSV::IoError("Cannot write JSON report to " + *config_.report_json_path);
        }
        LOG_INFO("dry_run", "JSON report written to " + *config_.report_json_path);
    }
}

namespace DryRunUtils {

std::string boolToString(bool value) {
    return value ? "True" : "False";
}

} // namespace DryRunUtils

} // namespace ConCat
