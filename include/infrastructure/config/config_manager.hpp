// EN: Layered configuration for ConCat - defaults, YAML file, environment, command line
// FR: Configuration en couches pour ConCat - défauts, fichier YAML, environnement, ligne de commande

#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace ConCat {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(ValueType(value)) {}

    ConfigValue(const char* value) : value_(ValueType(std::string(value))) {}

    // EN: Get value as specific type (throws if empty or type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si vide ou type incorrect).
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        if (const T* v = std::get_if<T>(&*value_)) {
            return *v;
        }
        throw std::runtime_error("ConfigValue type mismatch");
    }

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const {
        if (!value_) {
            return std::nullopt;
        }
        if (const T* v = std::get_if<T>(&*value_)) {
            return *v;
        }
        return std::nullopt;
    }

    template<typename T>
    T asOrDefault(const T& default_value) const {
        auto result = tryAs<T>();
        return result ? *result : default_value;
    }

    bool isValid() const { return value_.has_value(); }

    // EN: Name of the held alternative: "bool", "int", "double", "string", "array" or "empty".
    // FR: Nom de l'alternative contenue : "bool", "int", "double", "string", "array" ou "empty".
    std::string typeName() const;

    // EN: Convert value to string representation.
    // FR: Convertit la valeur en représentation chaîne.
    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    std::vector<std::string> keys() const;

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Main configuration manager with YAML parsing and environment overrides.
// FR: Gestionnaire de configuration principal avec parsing YAML et surcharges d'environnement.
class ConfigManager {
public:
    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file, merging over current values.
    //     Throws std::runtime_error if the file is missing or malformed.
    // FR: Charge la configuration depuis un fichier YAML, fusionnée sur les valeurs courantes.
    //     Lance std::runtime_error si le fichier est absent ou mal formé.
    void loadFromFile(const std::string& filename);

    // EN: Same as loadFromFile, from an in-memory YAML document.
    // FR: Identique à loadFromFile, depuis un document YAML en mémoire.
    void loadFromString(const std::string& yaml_content);

    // EN: Apply PREFIX<SECTION>_<KEY> environment variables to existing sections.
    //     Values are coerced to the type of the value they replace. Returns the count applied.
    // FR: Applique les variables d'environnement PREFIX<SECTION>_<KEY> aux sections existantes.
    //     Les valeurs sont converties au type de la valeur remplacée. Retourne le nombre appliqué.
    size_t loadEnvironmentOverrides(const std::string& prefix = "CONCAT_");

    ConfigValue get(const std::string& section, const std::string& key) const;

    void set(const std::string& section, const std::string& key, const ConfigValue& value);

    // EN: Set value by dotted path ("combine.chunksize").
    // FR: Définit une valeur par chemin pointé ("combine.chunksize").
    void setPath(const std::string& path, const ConfigValue& value);

    bool has(const std::string& section, const std::string& key) const;

    // EN: Reset all configuration data.
    // FR: Remet à zéro toutes les données de configuration.
    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

    // EN: Convert a raw string into a value of the same type as `like` (or inferred if `like` is empty).
    //     Throws std::invalid_argument on conversion failure.
    // FR: Convertit une chaîne brute en valeur du même type que `like` (ou inférée si `like` est vide).
    //     Lance std::invalid_argument en cas d'échec de conversion.
    static ConfigValue coerce(const std::string& raw, const ConfigValue& like);

    // EN: Split "section.key" into its two parts.
    // FR: Sépare "section.key" en ses deux parties.
    static std::pair<std::string, std::string> splitPath(const std::string& path);

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    void loadYaml(const YAML::Node& root, const std::string& origin);

    ConfigValue getUnlocked(const std::string& section, const std::string& key) const;

    static ConfigValue parseYamlValue(const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
};

} // namespace ConCat
