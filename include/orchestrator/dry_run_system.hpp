// EN: Dry run reporting for ConCat - describes a validated combine job without writing its output
// FR: Rapport de simulation pour ConCat - décrit un job de combinaison validé sans écrire sa sortie

#pragma once

#include <chrono>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "csv/dialect.hpp"
#include "csv/merger_engine.hpp"
#include "csv/schema_reconciler.hpp"

namespace ConCat {

// EN: Everything the job resolved before the merge step
// FR: Tout ce que le job a résolu avant l'étape de fusion
struct DryRunSummary {
    std::vector<std::string> files;                 // EN: Origins of the files that would be merged / FR: Origines des fichiers qui seraient fusionnés
    std::string extension;
    std::vector<char> delimiters;                   // EN: Distinct input delimiters after normalization / FR: Délimiteurs distincts après normalisation
    std::optional<char> normalized_to;              // EN: Target when normalization ran / FR: Cible si la normalisation a eu lieu
    CSV::SchemaMode mode{CSV::SchemaMode::RECONCILED};
    CSV::SchemaPolicy policy{CSV::SchemaPolicy::STRICT};
    CSV::MissingPolicy missing_policy{CSV::MissingPolicy::ERROR};
    bool case_insensitive{false};
    std::vector<std::string> columns;
    std::vector<CSV::SkippedFile> skipped;
    CSV::SourceColumnConfig source_column;
    std::string output_path;
    char output_delimiter{','};
    bool write_header{true};
    bool dry_run{true};
    std::optional<size_t> rows_written;             // EN: Set after a real merge / FR: Renseigné après une vraie fusion
    std::chrono::system_clock::time_point generated_at{std::chrono::system_clock::now()};
};

struct DryRunConfig {
    std::optional<std::string> report_json_path;    // EN: --report-json target / FR: Cible de --report-json
    bool log_summary{true};                         // EN: Also emit the summary through the logger / FR: Émet aussi le résumé via le logger
};

namespace detail {
    // EN: Report generator interface
    // FR: Interface de générateur de rapport
    class IReportGenerator {
    public:
        virtual ~IReportGenerator() = default;

        virtual std::string generateReport(const DryRunSummary& summary) = 0;

        // EN: Writes `report` to `file_path`, creating parent directories.
        // FR: Écrit `report` dans `file_path`, en créant les répertoires parents.
        virtual bool exportToFile(const std::string& report, const std::string& file_path);
    };

    // EN: Human-readable "[DRY-RUN] Summary:" block
    // FR: Bloc lisible "[DRY-RUN] Summary:"
    class TextReportGenerator : public IReportGenerator {
    public:
        std::string generateReport(const DryRunSummary& summary) override;
    };

    // EN: JSON report generator
    // FR: Générateur de rapport JSON
    class JsonReportGenerator : public IReportGenerator {
    public:
        std::string generateReport(const DryRunSummary& summary) override;

        nlohmann::json convertSummaryToJson(const DryRunSummary& summary);
    };
}

// EN: Presents a dry run: text summary on the given stream, optional JSON report on disk.
// FR: Présente une simulation : résumé texte sur le flux donné, rapport JSON optionnel sur disque.
class DryRunSystem {
public:
    explicit DryRunSystem(const DryRunConfig& config = DryRunConfig{});
    ~DryRunSystem();

    DryRunSystem(const DryRunSystem&) = delete;
    DryRunSystem& operator=(const DryRunSystem&) = delete;

    // EN: Replace or add a generator under a format name ("text" and "json" are built in).
    // FR: Remplace ou ajoute un générateur sous un nom de format ("text" et "json" sont fournis).
    void registerReportGenerator(const std::string& format, std::unique_ptr<detail::IReportGenerator> generator);

    // EN: Throws std::invalid_argument for an unknown format.
    // FR: Lance std::invalid_argument pour un format inconnu.
    std::string generateReport(const DryRunSummary& summary, const std::string& format = "text");
    bool exportReport(const DryRunSummary& summary, const std::string& file_path, const std::string& format = "json");

    // EN: Prints the text summary to `out` and writes the JSON report when configured.
    //     Throws IoError when the JSON report cannot be written.
    // FR: Affiche le résumé texte sur `out` et écrit le rapport JSON si configuré.
    //     Lance IoError si le rapport JSON ne peut être écrit.
    void present(const DryRunSummary& summary, std::ostream& out);

    const DryRunConfig& getConfig() const { return config_; }

private:
    DryRunConfig config_;
    std::map<std::string, std::unique_ptr<detail::IReportGenerator>> generators_;
};

namespace DryRunUtils {
    std::string boolToString(bool value);
}

} // namespace ConCat
