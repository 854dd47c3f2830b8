// EN: Combine job orchestration - discovery, sniffing, validation, optional normalization, merge or dry run
// FR: Orchestration du job de combinaison - découverte, détection, validation, normalisation, fusion ou simulation

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "csv/dialect.hpp"
#include "csv/merger_engine.hpp"
#include "csv/path_resolver.hpp"
#include "csv/schema_reconciler.hpp"
#include "infrastructure/cli/config_override.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "orchestrator/dry_run_system.hpp"

namespace ConCat {

// EN: Validated run configuration, immutable once built
// FR: Configuration d'exécution validée, immuable une fois construite
struct CombineOptions {
    CSV::DiscoveryRequest discovery;
    size_t sample_rows{50};
    std::optional<char> normalize_to;
    CSV::SchemaPolicy schema_policy{CSV::SchemaPolicy::STRICT};
    std::vector<std::string> columns;           // EN: Non-empty selects requested mode / FR: Non vide active le mode demandé
    CSV::MissingPolicy missing_policy{CSV::MissingPolicy::ERROR};
    bool case_insensitive{false};
    CSV::MergeConfig merge;
    size_t threads{4};
    bool dry_run{false};
    std::optional<std::string> report_json;
    std::filesystem::path scratch_dir;         // EN: Parent of the normalization workspace, system temp dir if empty / FR: Parent de l'espace de normalisation, répertoire temporaire système si vide

    // EN: Reads the "combine" section of `config`. Throws ConfigurationError on invalid or
    //     conflicting values (input designation must be exactly one of directory/glob/input_files).
    // FR: Lit la section "combine" de `config`. Lance ConfigurationError sur valeurs invalides ou
    //     conflictuelles (exactement une désignation parmi directory/glob/input_files).
    static CombineOptions fromConfig(const ConfigManager& config, const std::string& section = "combine");

    // EN: Option table of `concat combine`, mapped onto "combine.*" and "logging.*".
    // FR: Table d'options de `concat combine`, projetée sur "combine.*" et "logging.*".
    static std::vector<CLI::CliOptionDefinition> optionDefinitions();

    void validate() const;
};

// EN: Result of one run
// FR: Résultat d'une exécution
struct CombineOutcome {
    bool dry_run{false};
    size_t files_merged{0};
    size_t rows_written{0};
    DryRunSummary summary;
    std::string merge_report;   // EN: MergeStatistics report, empty for dry runs / FR: Rapport MergeStatistics, vide en simulation
};

// EN: Runs the whole pipeline for one set of options. Any scratch workspace lives only for the
//     duration of run() and is removed on every exit path.
// FR: Exécute tout le pipeline pour un jeu d'options. L'espace de travail temporaire ne vit que
//     pendant run() et est supprimé sur toute sortie.
class CombineJob {
public:
    explicit CombineJob(CombineOptions options);

    // EN: Throws a CombineError subclass on any fatal condition. Dry-run summaries go to `out`.
    // FR: Lance une sous-classe de CombineError sur toute condition fatale. Les résumés de
    //     simulation vont sur `out`.
    CombineOutcome run(std::ostream& out);

    const CombineOptions& getOptions() const { return options_; }

    // EN: Aggregated header check: HeaderReadError listing every file with an empty header.
    // FR: Vérification agrégée : HeaderReadError listant chaque fichier à l'en-tête vide.
    static void validateHeaders(const std::vector<CSV::SourceFile>& files);

private:
    CombineOptions options_;

    std::vector<CSV::SourceFile> sniffAll(const std::vector<std::filesystem::path>& paths) const;
    void ensureOutputIsNotAnInput(const std::vector<std::filesystem::path>& paths) const;
    DryRunSummary buildSummary(const CSV::DiscoveryResult& discovery, const CSV::SchemaPlan& plan,
                               bool normalized) const;
    static void checkInterrupted();
};

} // namespace ConCat
