#include "csv/delimiter_sniffer.hpp"
#include "csv/combine_errors.hpp"
#include "csv/dialect.hpp"
#include "csv/streaming_parser.hpp"
#include "infrastructure/logging/logger.hpp"
#include <algorithm>
#include <fstream>
#include <map>

namespace ConCat {
namespace CSV {

namespace {

size_t splitCount(const std::string& line, char delimiter) {
    return static_cast<size_t>(std::count(line.begin(), line.end(), delimiter)) + 1;
}

} // namespace

DelimiterSniffer::DelimiterSniffer(size_t sample_rows) : sample_rows_(sample_rows) {}

SniffResult DelimiterSniffer::sniffFile(const std::filesystem::path& path) const {
    auto lines = readHeadLines(path, sample_rows_);
    SniffResult result = sniffLines(lines);
    LOG_DEBUG("sniffer", path.filename().string() + ": delimiter '" + delimiterDisplay(result.delimiter) +
              "' score=(" + std::to_string(result.score.mode_count) + "," +
              std::to_string(result.score.mode_value) + ")" + (result.used_fallback ? " [fallback]" : ""));
    return result;
}

SniffResult DelimiterSniffer::sniffLines(const std::vector<std::string>& lines) const {
    SniffResult result;
    std::optional<char> best;

    for (const auto& [name, delimiter] : supportedDelimiters()) {
        auto score = scoreCandidate(lines, delimiter);
        if (!score.has_value()) {
            continue;
        }
        if (*score > result.score) {
            result.score = *score;
            best = delimiter;
        }
    }

    result.sampled_lines = static_cast<size_t>(std::count_if(lines.begin(), lines.end(),
        [](const std::string& line) { return !StreamingParser::trim(line).empty(); }));

    if (best.has_value()) {
        result.delimiter = *best;
    } else {
        result.delimiter = fallbackDelimiter(lines);
        result.used_fallback = true;
    }
    return result;
}

std::optional<DelimiterScore> DelimiterSniffer::scoreCandidate(const std::vector<std::string>& lines, char delimiter) {
    // EN: Field count -> (frequency, first-seen position); ties on frequency go to the count seen first
    // FR: Nombre de champs -> (fréquence, position de première apparition) ; égalités au premier vu
    std::map<size_t, std::pair<long, size_t>> distribution;
    size_t position = 0;
    for (const auto& raw : lines) {
        std::string line = StreamingParser::trim(raw);
        if (line.empty()) {
            continue;
        }
        auto [it, inserted] = distribution.try_emplace(splitCount(line, delimiter), 0L, position++);
        it->second.first++;
    }
    if (distribution.empty()) {
        return std::nullopt;
    }

    auto mode = distribution.begin();
    for (auto it = distribution.begin(); it != distribution.end(); ++it) {
        bool more_frequent = it->second.first > mode->second.first;
        bool seen_earlier = it->second.first == mode->second.first && it->second.second < mode->second.second;
        if (more_frequent || seen_earlier) {
            mode = it;
        }
    }
    return DelimiterScore{mode->second.first, static_cast<long>(mode->first)};
}

char DelimiterSniffer::fallbackDelimiter(const std::vector<std::string>& lines) const {
    // EN: Consistency heuristic: a candidate present the same non-zero number of times on every
    //     non-blank line; the first such candidate wins, comma otherwise.
    // FR: Heuristique de cohérence : un candidat présent le même nombre non nul de fois sur chaque
    //     ligne non vide ; le premier l'emporte, virgule sinon.
    for (const auto& [name, delimiter] : supportedDelimiters()) {
        std::optional<long> expected;
        bool consistent = true;
        for (const auto& raw : lines) {
            std::string line = StreamingParser::trim(raw);
            if (line.empty()) {
                continue;
            }
            long occurrences = static_cast<long>(std::count(line.begin(), line.end(), delimiter));
            if (occurrences == 0 || (expected.has_value() && *expected != occurrences)) {
                consistent = false;
                break;
            }
            expected = occurrences;
        }
        if (consistent && expected.has_value()) {
            return delimiter;
        }
    }
    return ',';
}

std::vector<std::string> DelimiterSniffer::readHeadLines(const std::filesystem::path& path, size_t n) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw IoError("Cannot open " + path.string() + " for reading");
    }
    std::vector<std::string> lines;
    std::string line;
    while (lines.size() < n && std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        line.clear();
    }
    if (file.bad()) {
        throw IoError("Read error on " + path.string());
    }
    return lines;
}

} // namespace CSV
} // namespace ConCat
