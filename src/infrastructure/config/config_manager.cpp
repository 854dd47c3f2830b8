// EN: Implementation of the ConfigManager class. YAML parsing and environment overrides.
// FR: Implémentation de la classe ConfigManager. Parsing YAML et surcharges d'environnement.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>

extern char** environ;

namespace ConCat {

namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<bool> parseBool(const std::string& raw) {
    std::string lowered = toLower(raw);
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") return true;
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") return false;
    return std::nullopt;
}

std::optional<int> parseInt(const std::string& raw) {
    if (raw.empty()) return std::nullopt;
    size_t consumed = 0;
    try {
        int value = std::stoi(raw, &consumed);
        if (consumed != raw.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> parseDouble(const std::string& raw) {
    if (raw.empty()) return std::nullopt;
    size_t consumed = 0;
    try {
        double value = std::stod(raw, &consumed);
        if (consumed != raw.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<std::string> splitList(const std::string& raw) {
    std::vector<std::string> items;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        size_t end = item.find_last_not_of(" \t");
        items.push_back(item.substr(start, end - start + 1));
    }
    return items;
}

} // namespace

std::string ConfigValue::typeName() const {
    if (!value_) {
        return "empty";
    }
    switch (value_->index()) {
        case 0: return "bool";
        case 1: return "int";
        case 2: return "double";
        case 3: return "string";
        case 4: return "array";
        default: return "unknown";
    }
}

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream ss;
            ss << v;
            return ss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

// EN: Load configuration from YAML file with error handling.
// FR: Charge la configuration depuis un fichier YAML avec gestion d'erreur.
void ConfigManager::loadFromFile(const std::string& filename) {
    if (!std::filesystem::exists(filename)) {
        LOG_ERROR("config", "Configuration file not found: " + filename);
        throw std::runtime_error("Configuration file not found: " + filename);
    }

    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("config", "Failed to parse configuration: " + std::string(e.what()));
        throw std::runtime_error("Invalid YAML in " + filename + ": " + e.what());
    }

    loadYaml(yaml, filename);
}

void ConfigManager::loadFromString(const std::string& yaml_content) {
    YAML::Node yaml;
    try {
        yaml = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("Invalid YAML: ") + e.what());
    }
    loadYaml(yaml, "<string>");
}

void ConfigManager::loadYaml(const YAML::Node& root, const std::string& origin) {
    if (root.IsNull()) {
        LOG_WARN("config", "Configuration is empty: " + origin);
        return;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Configuration root must be a mapping: " + origin);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // EN: Process YAML nodes and merge them into ConfigSections.
    // FR: Traite les nœuds YAML et les fusionne dans les ConfigSections.
    for (const auto& section : root) {
        std::string section_name = section.first.as<std::string>();
        ConfigSection& config_section = sections_[section_name];

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                std::string key = item.first.as<std::string>();
                config_section.set(key, parseYamlValue(item.second));
            }
        } else {
            config_section.set("value", parseYamlValue(section.second));
        }
    }

    LOG_INFO("config", "Configuration loaded from: " + origin);
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) {
    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(item.as<std::string>());
        }
        return ConfigValue(array_value);
    }
    if (node.IsNull()) {
        return ConfigValue(std::string());
    }
    if (!node.IsScalar()) {
        throw std::runtime_error("Unsupported YAML node type for configuration value");
    }
    return coerce(node.as<std::string>(), ConfigValue());
}

// EN: Environment variables are matched against known sections, so keys keep their underscores.
// FR: Les variables d'environnement sont rapprochées des sections connues, les clés gardent leurs underscores.
size_t ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t applied = 0;

    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        size_t eq = entry.find('=');
        if (eq == std::string::npos) continue;

        std::string name = entry.substr(0, eq);
        std::string raw = entry.substr(eq + 1);
        if (name.rfind(prefix, 0) != 0) continue;

        std::string rest = name.substr(prefix.size());
        for (auto& [section_name, section] : sections_) {
            std::string section_prefix = toUpper(section_name) + "_";
            if (rest.rfind(section_prefix, 0) != 0) continue;

            std::string key = toLower(rest.substr(section_prefix.size()));
            if (key.empty()) continue;

            try {
                section.set(key, coerce(raw, section.get(key)));
            } catch (const std::invalid_argument& e) {
                throw std::invalid_argument("Invalid value in " + name + ": " + e.what());
            }
            LOG_DEBUG("config", "Environment override applied: " + section_name + "." + key);
            ++applied;
            break;
        }
    }

    return applied;
}

ConfigValue ConfigManager::coerce(const std::string& raw, const ConfigValue& like) {
    std::string type = like.typeName();

    if (type == "bool") {
        auto parsed = parseBool(raw);
        if (!parsed) throw std::invalid_argument("expected a boolean, got '" + raw + "'");
        return ConfigValue(*parsed);
    }
    if (type == "int") {
        auto parsed = parseInt(raw);
        if (!parsed) throw std::invalid_argument("expected an integer, got '" + raw + "'");
        return ConfigValue(*parsed);
    }
    if (type == "double") {
        auto parsed = parseDouble(raw);
        if (!parsed) throw std::invalid_argument("expected a number, got '" + raw + "'");
        return ConfigValue(*parsed);
    }
    if (type == "array") {
        return ConfigValue(splitList(raw));
    }
    if (type == "string") {
        return ConfigValue(raw);
    }

    // EN: No reference type: infer bool, then int, then double, then string.
    // FR: Pas de type de référence : infère bool, puis int, puis double, puis chaîne.
    std::string lowered = toLower(raw);
    if (lowered == "true" || lowered == "false") {
        return ConfigValue(lowered == "true");
    }
    if (auto as_int = parseInt(raw)) {
        return ConfigValue(*as_int);
    }
    if (auto as_double = parseDouble(raw)) {
        return ConfigValue(*as_double);
    }
    return ConfigValue(raw);
}

std::pair<std::string, std::string> ConfigManager::splitPath(const std::string& path) {
    size_t dot_pos = path.find('.');
    if (dot_pos == std::string::npos) {
        return {"default", path};
    }
    return {path.substr(0, dot_pos), path.substr(dot_pos + 1)};
}

ConfigValue ConfigManager::getUnlocked(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return getUnlocked(section, key);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

void ConfigManager::setPath(const std::string& path, const ConfigValue& value) {
    auto [section, key] = splitPath(path);
    set(section, key, value);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto section_it = sections_.find(section);
    return section_it != sections_.end() && section_it->second.has(key);
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
}

std::string ConfigManager::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    std::ostringstream out;
    for (const auto& name : names) {
        const auto& section = sections_.at(name);
        out << "[" << name << "]\n";
        for (const auto& key : section.keys()) {
            out << "  " << key << " = " << section.get(key).toString() << "\n";
        }
    }
    return out.str();
}

} // namespace ConCat
