// EN: Command line parsing for ConCat - table-driven options mapped onto configuration paths
// FR: Analyse de la ligne de commande pour ConCat - options pilotées par table, projetées sur des chemins de configuration

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/config/config_manager.hpp"

namespace ConCat {
namespace CLI {

// EN: CLI option types and definitions
// FR: Types et définitions des options CLI
enum class CliOptionType {
    BOOLEAN,        // EN: Boolean flag / FR: Drapeau booléen
    INTEGER,        // EN: Integer value / FR: Valeur entière
    STRING,         // EN: String value / FR: Valeur chaîne
    STRING_LIST     // EN: One or more values, space- or comma-separated / FR: Une ou plusieurs valeurs, séparées par espace ou virgule
};

// EN: CLI option value constraints
// FR: Contraintes de valeur d'option CLI
enum class CliOptionConstraint {
    NONE,           // EN: No constraints / FR: Aucune contrainte
    POSITIVE,       // EN: Must be positive (>0) / FR: Doit être positif (>0)
    ENUM_VALUES     // EN: Must be one of predefined values / FR: Doit être l'une des valeurs prédéfinies
};

// EN: CLI parsing result status
// FR: Statut de résultat d'analyse CLI
enum class CliParseStatus {
    SUCCESS,                // EN: Parsing completed successfully / FR: Analyse terminée avec succès
    HELP_REQUESTED,         // EN: Help was requested / FR: Aide demandée
    VERSION_REQUESTED,      // EN: Version was requested / FR: Version demandée
    INVALID_OPTION,         // EN: Unknown option provided / FR: Option inconnue fournie
    MISSING_VALUE,          // EN: Required value or option missing / FR: Valeur ou option requise manquante
    INVALID_VALUE,          // EN: Invalid value format / FR: Format de valeur invalide
    CONSTRAINT_VIOLATION,   // EN: Value or exclusivity constraint violation / FR: Violation de contrainte de valeur ou d'exclusivité
    DUPLICATE_OPTION        // EN: Duplicate option specified / FR: Option dupliquée spécifiée
};

// EN: CLI option definition structure
// FR: Structure de définition d'option CLI
struct CliOptionDefinition {
    std::string long_name;                          // EN: Long option name (--example) / FR: Nom d'option long (--exemple)
    std::optional<char> short_name;                 // EN: Short option name (-e) / FR: Nom d'option court (-e)
    CliOptionType type = CliOptionType::STRING;     // EN: Option value type / FR: Type de valeur d'option
    std::string description;                        // EN: Option description for help / FR: Description d'option pour l'aide
    std::string config_path;                        // EN: Configuration path (e.g., "combine.chunksize") / FR: Chemin de configuration (ex: "combine.chunksize")
    std::optional<std::string> default_value;       // EN: Default value as string / FR: Valeur par défaut en chaîne
    bool required = false;                          // EN: Whether option is required / FR: Si l'option est requise
    bool hidden = false;                            // EN: Hide from help output / FR: Masquer de la sortie d'aide
    bool negate = false;                            // EN: BOOLEAN flag that stores false (--no-x) / FR: Drapeau BOOLEAN qui stocke false (--no-x)

    // EN: Validation constraints
    // FR: Contraintes de validation
    CliOptionConstraint constraint = CliOptionConstraint::NONE;
    std::set<std::string> enum_values;              // EN: Valid enum values / FR: Valeurs d'énumération valides

    std::string exclusive_group;                    // EN: Mutually exclusive group name / FR: Nom du groupe mutuellement exclusif
    std::string metavar;                            // EN: Value placeholder in help / FR: Marqueur de valeur dans l'aide
    std::string category = "General";               // EN: Help category / FR: Catégorie d'aide
};

// EN: Parsed CLI option value
// FR: Valeur d'option CLI analysée
struct CliOptionValue {
    std::string option_name;                        // EN: Option name that was parsed / FR: Nom d'option qui a été analysé
    CliOptionType type = CliOptionType::STRING;     // EN: Parsed value type / FR: Type de valeur analysée
    std::vector<std::string> raw_values;            // EN: Raw string values from command line / FR: Valeurs chaîne brutes de la ligne de commande
    ConfigValue config_value;                       // EN: Converted configuration value / FR: Valeur de configuration convertie
    std::string config_path;                        // EN: Configuration path for override / FR: Chemin de configuration pour surcharge
};

// EN: CLI parsing result containing all parsed options and status
// FR: Résultat d'analyse CLI contenant toutes les options analysées et le statut
struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::vector<CliOptionValue> parsed_options;     // EN: Successfully parsed options / FR: Options analysées avec succès
    std::vector<std::string> positionals;           // EN: Non-option arguments in order / FR: Arguments non-options dans l'ordre
    std::vector<std::string> errors;                // EN: Parsing error messages / FR: Messages d'erreur d'analyse
    std::unordered_map<std::string, ConfigValue> overrides; // EN: Configuration overrides map / FR: Carte des surcharges de configuration

    std::string help_text;                          // EN: Generated help text (if requested) / FR: Texte d'aide généré (si demandé)
    std::string version_text;                       // EN: Version information (if requested) / FR: Information de version (si demandée)

    size_t total_arguments_processed = 0;
    std::chrono::milliseconds parse_duration{0};

    bool ok() const { return status == CliParseStatus::SUCCESS; }
};

// EN: Main configuration override parser for handling CLI arguments
// FR: Analyseur principal de surcharge de configuration pour gérer les arguments CLI
class ConfigOverrideParser {
public:
    ConfigOverrideParser();
    ~ConfigOverrideParser();

    ConfigOverrideParser(const ConfigOverrideParser&) = delete;
    ConfigOverrideParser& operator=(const ConfigOverrideParser&) = delete;
    ConfigOverrideParser(ConfigOverrideParser&&) = delete;
    ConfigOverrideParser& operator=(ConfigOverrideParser&&) = delete;

    // EN: Option definition management. Throws std::invalid_argument on duplicate names.
    // FR: Gestion des définitions d'options. Lance std::invalid_argument sur nom dupliqué.
    void addOption(const CliOptionDefinition& option_def);
    void addOptions(const std::vector<CliOptionDefinition>& option_defs);

    // EN: Declare a mutually exclusive group; when required, exactly one member must be given.
    // FR: Déclare un groupe mutuellement exclusif ; s'il est requis, exactement un membre doit être donné.
    void addExclusiveGroup(const std::string& group, bool required);

    // EN: CLI parsing operations (argv[0] is skipped)
    // FR: Opérations d'analyse CLI (argv[0] est ignoré)
    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    std::string generateHelpText() const;
    std::string generateVersionText() const;

    void setProgramName(const std::string& program_name);
    void setUsage(const std::string& usage);
    void setHelpHeader(const std::string& header);
    void setHelpFooter(const std::string& footer);
    void setVersionInfo(const std::string& version, const std::string& build_info = "");

    std::vector<CliOptionDefinition> getOptionDefinitions() const;
    std::optional<CliOptionDefinition> getOptionDefinition(const std::string& name) const;
    bool hasOption(const std::string& name) const;

    // EN: Seed `config` with every declared default, typed per option.
    // FR: Initialise `config` avec chaque défaut déclaré, typé selon l'option.
    void applyDefaults(ConfigManager& config) const;

    // EN: Write parsed overrides into `config`. Returns the number applied.
    // FR: Écrit les surcharges analysées dans `config`. Retourne le nombre appliqué.
    static size_t applyOverrides(const CliParseResult& result, ConfigManager& config);

private:
    class ConfigOverrideParserImpl;
    std::unique_ptr<ConfigOverrideParserImpl> impl_;
};

// EN: Utility functions for configuration override operations
// FR: Fonctions utilitaires pour les opérations de surcharge de configuration
namespace ConfigOverrideUtils {

    std::string cliParseStatusToString(CliParseStatus status);

    // EN: Value conversion. parseCliValue expects a value already accepted by validateCliValue.
    // FR: Conversion de valeur. parseCliValue attend une valeur déjà acceptée par validateCliValue.
    ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type);
    ConfigValue parseCliValueList(const std::vector<std::string>& raw_values);

    bool validateCliValue(const std::string& raw_value, CliOptionType type,
                          const CliOptionDefinition& definition, std::string& error_message);

    // EN: "a,b , c" -> {"a", "b", "c"}; empty items dropped
    // FR: "a,b , c" -> {"a", "b", "c"} ; éléments vides ignorés
    std::vector<std::string> splitCommaList(const std::string& raw);

    std::string formatOptionHelp(const CliOptionDefinition& option, size_t max_width = 80);

    bool isShortOption(const std::string& arg);
    bool isLongOption(const std::string& arg);
    std::string extractOptionName(const std::string& arg);

} // namespace ConfigOverrideUtils

} // namespace CLI
} // namespace ConCat
