// EN: Implementation of the ConCat command line parser.
// FR: Implémentation de l'analyseur de ligne de commande ConCat.

#include "infrastructure/cli/config_override.hpp"
#include "infrastructure/logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>

namespace ConCat {
namespace CLI {

// EN: Private implementation class for ConfigOverrideParser
// FR: Classe d'implémentation privée pour ConfigOverrideParser
class ConfigOverrideParser::ConfigOverrideParserImpl {
public:
    ConfigOverrideParserImpl()
        : program_name_("concat")
        , version_("1.0.0") {
    }

    void addOption(const CliOptionDefinition& option_def) {
        if (option_def.long_name.empty()) {
            throw std::invalid_argument("Option long name cannot be empty");
        }

        if (index_by_long_name_.count(option_def.long_name) > 0) {
            throw std::invalid_argument("Option with long name '" + option_def.long_name + "' already exists");
        }

        if (option_def.short_name && index_by_short_name_.count(*option_def.short_name) > 0) {
            throw std::invalid_argument("Option with short name '-" + std::string(1, *option_def.short_name) + "' already exists");
        }

        if (option_def.long_name == "help" || option_def.long_name == "version") {
            throw std::invalid_argument("Option name '" + option_def.long_name + "' is reserved");
        }

        size_t index = option_definitions_.size();
        option_definitions_.push_back(option_def);
        index_by_long_name_[option_def.long_name] = index;
        if (option_def.short_name) {
            index_by_short_name_[*option_def.short_name] = index;
        }
    }

    void addExclusiveGroup(const std::string& group, bool required) {
        exclusive_groups_[group] = required;
    }

    // EN: Main parsing implementation
    // FR: Implémentation d'analyse principale
    CliParseResult parse(const std::vector<std::string>& arguments) const {
        auto start_time = std::chrono::steady_clock::now();

        CliParseResult result;
        result.total_arguments_processed = arguments.size();

        std::set<std::string> seen_options;

        for (size_t i = 0; i < arguments.size(); ++i) {
            const std::string& arg = arguments[i];

            if (arg.empty()) continue;

            // EN: Help and version short-circuit everything else
            // FR: L'aide et la version court-circuitent tout le reste
            if (arg == "--help" || arg == "-h") {
                result.status = CliParseStatus::HELP_REQUESTED;
                result.help_text = generateHelpText();
                return finish(result, start_time);
            }

            if (arg == "--version" || arg == "-v") {
                result.status = CliParseStatus::VERSION_REQUESTED;
                result.version_text = generateVersionText();
                return finish(result, start_time);
            }

            if (!ConfigOverrideUtils::isLongOption(arg) && !ConfigOverrideUtils::isShortOption(arg)) {
                result.positionals.push_back(arg);
                continue;
            }

            // EN: --name=value form
            // FR: Forme --name=value
            std::optional<std::string> inline_value;
            std::string option_token = arg;
            if (ConfigOverrideUtils::isLongOption(arg)) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    inline_value = arg.substr(eq + 1);
                    option_token = arg.substr(0, eq);
                }
            }

            const CliOptionDefinition* option_def = findOption(option_token);
            if (!option_def) {
                fail(result, CliParseStatus::INVALID_OPTION, "Unknown option: " + option_token);
                continue;
            }

            if (!seen_options.insert(option_def->long_name).second) {
                fail(result, CliParseStatus::DUPLICATE_OPTION,
                     "Option --" + option_def->long_name + " specified more than once");
                continue;
            }

            CliOptionValue option_value;
            option_value.option_name = option_def->long_name;
            option_value.type = option_def->type;
            option_value.config_path = option_def->config_path;

            if (option_def->type == CliOptionType::BOOLEAN) {
                if (inline_value) {
                    fail(result, CliParseStatus::INVALID_VALUE,
                         "Option --" + option_def->long_name + " does not take a value");
                    continue;
                }
                option_value.raw_values = {option_def->negate ? "false" : "true"};
                option_value.config_value = ConfigValue(!option_def->negate);
            } else if (option_def->type == CliOptionType::STRING_LIST) {
                std::vector<std::string> raw_values;
                if (inline_value) {
                    raw_values.push_back(*inline_value);
                }
                while (!inline_value && i + 1 < arguments.size() && !looksLikeOption(arguments[i + 1])) {
                    raw_values.push_back(arguments[++i]);
                }

                std::vector<std::string> items;
                for (const auto& raw : raw_values) {
                    for (auto& item : ConfigOverrideUtils::splitCommaList(raw)) {
                        items.push_back(std::move(item));
                    }
                }
                if (items.empty()) {
                    fail(result, CliParseStatus::MISSING_VALUE,
                         "Option " + option_token + " requires at least one value");
                    continue;
                }

                std::string validation_error;
                bool valid = true;
                for (const auto& item : items) {
                    if (!ConfigOverrideUtils::validateCliValue(item, CliOptionType::STRING, *option_def, validation_error)) {
                        fail(result, CliParseStatus::CONSTRAINT_VIOLATION,
                             "Invalid value for option " + option_token + ": " + validation_error);
                        valid = false;
                        break;
                    }
                }
                if (!valid) continue;

                option_value.raw_values = raw_values;
                option_value.config_value = ConfigOverrideUtils::parseCliValueList(items);
            } else {
                std::string value;
                if (inline_value) {
                    value = *inline_value;
                } else if (i + 1 < arguments.size() && !looksLikeOption(arguments[i + 1])) {
                    value = arguments[++i];
                } else {
                    fail(result, CliParseStatus::MISSING_VALUE, "Option " + option_token + " requires a value");
                    continue;
                }

                std::string validation_error;
                if (!ConfigOverrideUtils::validateCliValue(value, option_def->type, *option_def, validation_error)) {
                    bool is_format = validation_error.rfind("expected", 0) == 0;
                    fail(result, is_format ? CliParseStatus::INVALID_VALUE : CliParseStatus::CONSTRAINT_VIOLATION,
                         "Invalid value for option " + option_token + ": " + validation_error);
                    continue;
                }

                option_value.raw_values = {value};
                option_value.config_value = ConfigOverrideUtils::parseCliValue(value, option_def->type);
            }

            result.overrides[option_value.config_path] = option_value.config_value;
            result.parsed_options.push_back(std::move(option_value));
        }

        checkRequired(result, seen_options);
        checkExclusiveGroups(result, seen_options);

        return finish(result, start_time);
    }

    std::string generateHelpText() const {
        std::ostringstream help;

        if (!help_header_.empty()) {
            help << help_header_ << "\n\n";
        }
        help << "Usage: " << (usage_.empty() ? program_name_ + " [OPTIONS]" : usage_) << "\n\n";

        // EN: Group options by category, keeping declaration order inside a category
        // FR: Groupe les options par catégorie, en gardant l'ordre de déclaration
        std::vector<std::string> categories;
        std::map<std::string, std::vector<const CliOptionDefinition*>> options_by_category;
        for (const auto& opt : option_definitions_) {
            if (opt.hidden) continue;
            if (options_by_category.find(opt.category) == options_by_category.end()) {
                categories.push_back(opt.category);
            }
            options_by_category[opt.category].push_back(&opt);
        }

        for (const auto& category : categories) {
            help << category << " Options:\n";
            for (const auto* opt : options_by_category[category]) {
                help << ConfigOverrideUtils::formatOptionHelp(*opt, 80) << "\n";
            }
            help << "\n";
        }

        help << "Other Options:\n";
        help << "  -h, --help                    Show this help message and exit\n";
        help << "  -v, --version                 Show version information and exit\n";

        if (!help_footer_.empty()) {
            help << "\n" << help_footer_ << "\n";
        }

        return help.str();
    }

    std::string generateVersionText() const {
        std::ostringstream version;
        version << program_name_ << " " << version_;
        if (!build_info_.empty()) {
            version << " (" << build_info_ << ")";
        }
        version << "\n";
        return version.str();
    }

    const CliOptionDefinition* findByLongName(const std::string& name) const {
        auto it = index_by_long_name_.find(name);
        return it != index_by_long_name_.end() ? &option_definitions_[it->second] : nullptr;
    }

    std::vector<CliOptionDefinition> option_definitions_;
    std::unordered_map<std::string, size_t> index_by_long_name_;
    std::unordered_map<char, size_t> index_by_short_name_;
    std::map<std::string, bool> exclusive_groups_;

    std::string program_name_;
    std::string usage_;
    std::string help_header_;
    std::string help_footer_;
    std::string version_;
    std::string build_info_;

private:
    const CliOptionDefinition* findOption(const std::string& token) const {
        std::string name = ConfigOverrideUtils::extractOptionName(token);
        if (ConfigOverrideUtils::isLongOption(token)) {
            return findByLongName(name);
        }
        if (name.size() == 1) {
            auto it = index_by_short_name_.find(name[0]);
            if (it != index_by_short_name_.end()) {
                return &option_definitions_[it->second];
            }
        }
        return nullptr;
    }

    static bool looksLikeOption(const std::string& arg) {
        return ConfigOverrideUtils::isLongOption(arg) || ConfigOverrideUtils::isShortOption(arg);
    }

    static void fail(CliParseResult& result, CliParseStatus status, const std::string& message) {
        result.errors.push_back(message);
        // EN: The first error decides the status
        // FR: La première erreur décide du statut
        if (result.status == CliParseStatus::SUCCESS) {
            result.status = status;
        }
    }

    void checkRequired(CliParseResult& result, const std::set<std::string>& seen) const {
        for (const auto& opt : option_definitions_) {
            if (opt.required && seen.count(opt.long_name) == 0) {
                fail(result, CliParseStatus::MISSING_VALUE, "Missing required option --" + opt.long_name);
            }
        }
    }

    void checkExclusiveGroups(CliParseResult& result, const std::set<std::string>& seen) const {
        for (const auto& [group, required] : exclusive_groups_) {
            std::vector<std::string> members;
            std::vector<std::string> present;
            for (const auto& opt : option_definitions_) {
                if (opt.exclusive_group != group) continue;
                members.push_back("--" + opt.long_name);
                if (seen.count(opt.long_name) > 0) {
                    present.push_back("--" + opt.long_name);
                }
            }

            if (present.size() > 1) {
                fail(result, CliParseStatus::CONSTRAINT_VIOLATION,
                     "Options " + join(present, ", ") + " are mutually exclusive");
            } else if (required && present.empty() && !members.empty()) {
                fail(result, CliParseStatus::MISSING_VALUE,
                     "One of " + join(members, ", ") + " is required");
            }
        }
    }

    static std::string join(const std::vector<std::string>& parts, const std::string& sep) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out += sep;
            out += parts[i];
        }
        return out;
    }

    static CliParseResult finish(CliParseResult& result, std::chrono::steady_clock::time_point start_time) {
        auto end_time = std::chrono::steady_clock::now();
        result.parse_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        return std::move(result);
    }
};

// EN: ConfigOverrideParser public interface implementation
// FR: Implémentation de l'interface publique ConfigOverrideParser
ConfigOverrideParser::ConfigOverrideParser()
    : impl_(std::make_unique<ConfigOverrideParserImpl>()) {
}

ConfigOverrideParser::~ConfigOverrideParser() = default;

void ConfigOverrideParser::addOption(const CliOptionDefinition& option_def) {
    impl_->addOption(option_def);
}

void ConfigOverrideParser::addOptions(const std::vector<CliOptionDefinition>& option_defs) {
    for (const auto& option_def : option_defs) {
        impl_->addOption(option_def);
    }
}

void ConfigOverrideParser::addExclusiveGroup(const std::string& group, bool required) {
    impl_->addExclusiveGroup(group, required);
}

CliParseResult ConfigOverrideParser::parse(int argc, char* argv[]) const {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return impl_->parse(arguments);
}

CliParseResult ConfigOverrideParser::parse(const std::vector<std::string>& arguments) const {
    return impl_->parse(arguments);
}

std::string ConfigOverrideParser::generateHelpText() const {
    return impl_->generateHelpText();
}

std::string ConfigOverrideParser::generateVersionText() const {
    return impl_->generateVersionText();
}

void ConfigOverrideParser::setProgramName(const std::string& program_name) {
    impl_->program_name_ = program_name;
}

void ConfigOverrideParser::setUsage(const std::string& usage) {
    impl_->usage_ = usage;
}

void ConfigOverrideParser::setHelpHeader(const std::string& header) {
    impl_->help_header_ = header;
}

void ConfigOverrideParser::setHelpFooter(const std::string& footer) {
    impl_->help_footer_ = footer;
}

void ConfigOverrideParser::setVersionInfo(const std::string& version, const std::string& build_info) {
    impl_->version_ = version;
    impl_->build_info_ = build_info;
}

std::vector<CliOptionDefinition> ConfigOverrideParser::getOptionDefinitions() const {
    return impl_->option_definitions_;
}

std::optional<CliOptionDefinition> ConfigOverrideParser::getOptionDefinition(const std::string& name) const {
    const CliOptionDefinition* def = impl_->findByLongName(name);
    if (!def) {
        return std::nullopt;
    }
    return *def;
}

bool ConfigOverrideParser::hasOption(const std::string& name) const {
    return impl_->findByLongName(name) != nullptr;
}

void ConfigOverrideParser::applyDefaults(ConfigManager& config) const {
    for (const auto& opt : impl_->option_definitions_) {
        if (opt.config_path.empty()) continue;

        // EN: Two flags may target one path (--x / --no-x); the first default wins.
        // FR: Deux drapeaux peuvent viser un même chemin (--x / --no-x) ; le premier défaut l'emporte.
        auto [section, key] = ConfigManager::splitPath(opt.config_path);
        if (config.has(section, key)) continue;

        if (opt.type == CliOptionType::BOOLEAN) {
            bool value = opt.default_value ? (*opt.default_value == "true") : opt.negate;
            config.set(section, key, ConfigValue(value));
        } else if (opt.type == CliOptionType::STRING_LIST) {
            config.set(section, key, ConfigOverrideUtils::parseCliValueList(
                opt.default_value ? ConfigOverrideUtils::splitCommaList(*opt.default_value) : std::vector<std::string>{}));
        } else if (opt.default_value) {
            config.set(section, key, ConfigOverrideUtils::parseCliValue(*opt.default_value, opt.type));
        } else if (opt.type == CliOptionType::STRING) {
            config.set(section, key, ConfigValue(std::string()));
        }
    }
}

size_t ConfigOverrideParser::applyOverrides(const CliParseResult& result, ConfigManager& config) {
    size_t applied = 0;
    for (const auto& option : result.parsed_options) {
        if (option.config_path.empty()) continue;
        config.setPath(option.config_path, option.config_value);
        LOG_DEBUG("cli", "Override applied: " + option.config_path + " = " + option.config_value.toString());
        ++applied;
    }
    return applied;
}

// EN: Utility functions implementation
// FR: Implémentation des fonctions utilitaires
namespace ConfigOverrideUtils {

std::string cliParseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS: return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED: return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION: return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE: return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE: return "INVALID_VALUE";
        case CliParseStatus::CONSTRAINT_VIOLATION: return "CONSTRAINT_VIOLATION";
        case CliParseStatus::DUPLICATE_OPTION: return "DUPLICATE_OPTION";
        default: return "UNKNOWN";
    }
}

ConfigValue parseCliValue(const std::string& raw_value, CliOptionType type) {
    switch (type) {
        case CliOptionType::BOOLEAN: {
            std::string lower = raw_value;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return ConfigValue(lower == "true" || lower == "1" || lower == "yes" || lower == "on");
        }
        case CliOptionType::INTEGER:
            return ConfigValue(std::stoi(raw_value));
        case CliOptionType::STRING_LIST:
            return parseCliValueList(splitCommaList(raw_value));
        case CliOptionType::STRING:
        default:
            return ConfigValue(raw_value);
    }
}

ConfigValue parseCliValueList(const std::vector<std::string>& raw_values) {
    return ConfigValue(raw_values);
}

bool validateCliValue(const std::string& raw_value, CliOptionType type,
                      const CliOptionDefinition& definition, std::string& error_message) {
    std::optional<double> numeric;

    if (type == CliOptionType::INTEGER) {
        size_t consumed = 0;
        try {
            long long value = std::stoll(raw_value, &consumed);
            if (consumed != raw_value.size()) {
                error_message = "expected an integer, got '" + raw_value + "'";
                return false;
            }
            if (value > std::numeric_limits<int>::max() || value < std::numeric_limits<int>::min()) {
                error_message = "integer out of range: " + raw_value;
                return false;
            }
            numeric = static_cast<double>(value);
        } catch (const std::exception&) {
            error_message = "expected an integer, got '" + raw_value + "'";
            return false;
        }
    }

    switch (definition.constraint) {
        case CliOptionConstraint::POSITIVE:
            if (numeric && *numeric <= 0) {
                error_message = "must be positive, got " + raw_value;
                return false;
            }
            break;
        case CliOptionConstraint::ENUM_VALUES:
            if (definition.enum_values.count(raw_value) == 0) {
                std::string allowed;
                for (const auto& v : definition.enum_values) {
                    if (!allowed.empty()) allowed += ", ";
                    allowed += v;
                }
                error_message = "invalid choice '" + raw_value + "' (choose from " + allowed + ")";
                return false;
            }
            break;
        case CliOptionConstraint::NONE:
        default:
            break;
    }

    return true;
}

std::vector<std::string> splitCommaList(const std::string& raw) {
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

std::string formatOptionHelp(const CliOptionDefinition& option, size_t max_width) {
    std::ostringstream left;
    left << "  ";
    if (option.short_name) {
        left << "-" << *option.short_name << ", ";
    } else {
        left << "    ";
    }
    left << "--" << option.long_name;

    if (option.type != CliOptionType::BOOLEAN) {
        std::string metavar = option.metavar;
        if (metavar.empty()) {
            if (!option.enum_values.empty()) {
                metavar = "{";
                for (const auto& v : option.enum_values) {
                    if (metavar.size() > 1) metavar += ",";
                    metavar += v;
                }
                metavar += "}";
            } else {
                metavar = option.long_name;
                std::transform(metavar.begin(), metavar.end(), metavar.begin(),
                               [](unsigned char c) { return c == '-' ? '_' : static_cast<char>(std::toupper(c)); });
            }
        }
        left << " " << metavar;
        if (option.type == CliOptionType::STRING_LIST) {
            left << " ...";
        }
    }

    std::string description = option.description;
    if (option.default_value && option.type != CliOptionType::BOOLEAN) {
        description += " (default: " + *option.default_value + ")";
    }
    if (option.required) {
        description += " [required]";
    }

    std::string left_text = left.str();
    const size_t column = 32;
    std::ostringstream line;
    line << left_text;
    if (left_text.size() + 2 > column) {
        line << "\n" << std::string(column, ' ');
    } else {
        line << std::string(column - left_text.size(), ' ');
    }

    // EN: Wrap description at max_width
    // FR: Coupe la description à max_width
    size_t width = max_width > column + 20 ? max_width - column : 20;
    std::istringstream words(description);
    std::string word;
    size_t current = 0;
    bool first = true;
    while (words >> word) {
        if (!first && current + 1 + word.size() > width) {
            line << "\n" << std::string(column, ' ');
            current = 0;
            first = true;
        }
        if (!first) {
            line << ' ';
            ++current;
        }
        line << word;
        current += word.size();
        first = false;
    }

    return line.str();
}

bool isShortOption(const std::string& arg) {
    return arg.size() >= 2 && arg[0] == '-' && arg[1] != '-' &&
           !std::isdigit(static_cast<unsigned char>(arg[1])) && arg[1] != '.';
}

bool isLongOption(const std::string& arg) {
    return arg.size() > 2 && arg[0] == '-' && arg[1] == '-';
}

std::string extractOptionName(const std::string& arg) {
    if (isLongOption(arg)) {
        std::string name = arg.substr(2);
        size_t eq = name.find('=');
        return eq == std::string::npos ? name : name.substr(0, eq);
    }
    if (isShortOption(arg)) {
        return arg.substr(1);
    }
    return arg;
}

} // namespace ConfigOverrideUtils

} // namespace CLI
} // namespace ConCat
