#include "csv/dialect.hpp"
#include "csv/combine_errors.hpp"
#include <algorithm>
#include <cctype>

namespace ConCat {
namespace CSV {

namespace {

std::string lowered(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const std::vector<std::pair<std::string, char>>& supportedDelimiters() {
    static const std::vector<std::pair<std::string, char>> delimiters = {
        {"comma", ','},
        {"tab", '\t'},
        {"semicolon", ';'},
        {"pipe", '|'}
    };
    return delimiters;
}

char delimiterFromName(const std::string& name) {
    std::string key = lowered(name);
    for (const auto& [delim_name, delim] : supportedDelimiters()) {
        if (delim_name == key) {
            return delim;
        }
    }
    throw ConfigurationError("Unsupported delimiter '" + name + "' (choose from comma, tab, semicolon, pipe)");
}

std::string delimiterName(char delimiter) {
    for (const auto& [delim_name, delim] : supportedDelimiters()) {
        if (delim == delimiter) {
            return delim_name;
        }
    }
    return std::string(1, delimiter);
}

std::string delimiterDisplay(char delimiter) {
    if (delimiter == '\t') {
        return "\\t";
    }
    return std::string(1, delimiter);
}

std::string formatNameList(const std::vector<std::string>& names) {
    std::string out = "[";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += "'" + names[i] + "'";
    }
    out += "]";
    return out;
}

SchemaPolicy schemaPolicyFromString(const std::string& value) {
    std::string key = lowered(value);
    if (key == "strict") return SchemaPolicy::STRICT;
    if (key == "union") return SchemaPolicy::UNION;
    if (key == "intersection") return SchemaPolicy::INTERSECTION;
    throw ConfigurationError("Invalid schema policy '" + value + "' (choose from strict, union, intersection)");
}

std::string schemaPolicyToString(SchemaPolicy policy) {
    switch (policy) {
        case SchemaPolicy::STRICT: return "strict";
        case SchemaPolicy::UNION: return "union";
        case SchemaPolicy::INTERSECTION: return "intersection";
    }
    return "unknown";
}

MissingPolicy missingPolicyFromString(const std::string& value) {
    std::string key = lowered(value);
    if (key == "error") return MissingPolicy::ERROR;
    if (key == "skip") return MissingPolicy::SKIP;
    if (key == "fillna") return MissingPolicy::FILLNA;
    throw ConfigurationError("Invalid missing policy '" + value + "' (choose from error, skip, fillna)");
}

std::string missingPolicyToString(MissingPolicy policy) {
    switch (policy) {
        case MissingPolicy::ERROR: return "error";
        case MissingPolicy::SKIP: return "skip";
        case MissingPolicy::FILLNA: return "fillna";
    }
    return "unknown";
}

SourceColumnMode sourceColumnModeFromString(const std::string& value) {
    std::string key = lowered(value);
    if (key == "name") return SourceColumnMode::NAME;
    if (key == "stem") return SourceColumnMode::STEM;
    if (key == "path") return SourceColumnMode::PATH;
    throw ConfigurationError("Invalid source column mode '" + value + "' (choose from name, stem, path)");
}

std::string sourceColumnModeToString(SourceColumnMode mode) {
    switch (mode) {
        case SourceColumnMode::NAME: return "name";
        case SourceColumnMode::STEM: return "stem";
        case SourceColumnMode::PATH: return "path";
    }
    return "unknown";
}

SourceFile::SourceFile(std::filesystem::path origin, std::filesystem::path path,
                       char delimiter, std::vector<std::string> header)
    : origin_(std::move(origin))
    , path_(std::move(path))
    , delimiter_(delimiter)
    , header_(std::move(header)) {
}

std::unordered_map<std::string, size_t> SourceFile::headerMap(bool case_insensitive) const {
    std::unordered_map<std::string, size_t> map;
    map.reserve(header_.size());
    for (size_t i = 0; i < header_.size(); ++i) {
        map.emplace(case_insensitive ? lowered(header_[i]) : header_[i], i);
    }
    return map;
}

SourceFile SourceFile::rebased(std::filesystem::path path, char delimiter, std::vector<std::string> header) const {
    return SourceFile(origin_, std::move(path), delimiter, std::move(header));
}

std::string SourceFile::sourceValue(SourceColumnMode mode) const {
    switch (mode) {
        case SourceColumnMode::STEM: return origin_.stem().string();
        case SourceColumnMode::PATH: return origin_.string();
        case SourceColumnMode::NAME:
        default: return origin_.filename().string();
    }
}

} // namespace CSV
} // namespace ConCat
