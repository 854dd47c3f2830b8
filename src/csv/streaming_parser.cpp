// EN: Streaming delimited-text reader implementation - constant memory per chunk
// FR: Implémentation du lecteur de texte délimité en streaming - mémoire constante par bloc

#include "csv/streaming_parser.hpp"
#include "infrastructure/logging/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace ConCat {
namespace CSV {

std::string parserErrorToString(ParserError error) {
    switch (error) {
        case ParserError::SUCCESS: return "SUCCESS";
        case ParserError::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ParserError::FILE_READ_ERROR: return "FILE_READ_ERROR";
        case ParserError::UNTERMINATED_QUOTE: return "UNTERMINATED_QUOTE";
        case ParserError::NOT_OPEN: return "NOT_OPEN";
    }
    return "UNKNOWN";
}

// EN: ParserStatistics implementation
// FR: Implémentation de ParserStatistics

ParserStatistics::ParserStatistics() {
    reset();
}

void ParserStatistics::reset() {
    rows_parsed_ = 0;
    rows_skipped_ = 0;
    bytes_read_ = 0;
    min_field_count_ = SIZE_MAX;
    max_field_count_ = 0;
    parsing_duration_ = std::chrono::duration<double>(0);
}

void ParserStatistics::startTiming() {
    start_time_ = std::chrono::steady_clock::now();
}

void ParserStatistics::stopTiming() {
    parsing_duration_ = std::chrono::steady_clock::now() - start_time_;
}

void ParserStatistics::recordFieldCount(size_t count) {
    min_field_count_ = std::min(min_field_count_, count);
    max_field_count_ = std::max(max_field_count_, count);
}

double ParserStatistics::getRowsPerSecond() const {
    double seconds = parsing_duration_.count();
    return seconds > 0.0 ? static_cast<double>(rows_parsed_) / seconds : 0.0;
}

std::string ParserStatistics::generateReport() const {
    std::ostringstream oss;
    oss << "=== Parser Statistics ===\n";
    oss << "Rows parsed: " << rows_parsed_ << "\n";
    oss << "Rows skipped: " << rows_skipped_ << "\n";
    oss << "Bytes read: " << bytes_read_ << "\n";
    oss << "Field count range: " << getMinFieldCount() << " - " << max_field_count_ << "\n";
    oss << "Duration: " << std::fixed << std::setprecision(3) << parsing_duration_.count() << "s\n";
    oss << "Rows/second: " << std::fixed << std::setprecision(1) << getRowsPerSecond() << "\n";
    return oss.str();
}

// EN: StreamingParser implementation
// FR: Implémentation de StreamingParser

StreamingParser::StreamingParser() : StreamingParser(ParserConfig{}) {}

StreamingParser::StreamingParser(const ParserConfig& config) : config_(config) {}

StreamingParser::~StreamingParser() {
    close();
}

StreamingParser::StreamingParser(StreamingParser&& other) noexcept
    : config_(other.config_)
    , stats_(other.stats_)
    , input_(std::move(other.input_))
    , eof_(other.eof_)
    , first_line_(other.first_line_)
    , last_error_(other.last_error_)
    , records_read_(other.records_read_) {
    other.last_error_ = ParserError::NOT_OPEN;
}

StreamingParser& StreamingParser::operator=(StreamingParser&& other) noexcept {
    if (this != &other) {
        config_ = other.config_;
        stats_ = other.stats_;
        input_ = std::move(other.input_);
        eof_ = other.eof_;
        first_line_ = other.first_line_;
        last_error_ = other.last_error_;
        records_read_ = other.records_read_;
        other.last_error_ = ParserError::NOT_OPEN;
    }
    return *this;
}

ParserError StreamingParser::open(const std::string& file_path) {
    close();
    auto file = std::make_unique<std::ifstream>(file_path, std::ios::in | std::ios::binary);
    if (!file->is_open()) {
        // EN: Distinguish a missing file from an unreadable one
        // FR: Distingue un fichier absent d'un fichier illisible
        std::ifstream readable(file_path);
        last_error_ = readable.good() ? ParserError::FILE_READ_ERROR : ParserError::FILE_NOT_FOUND;
        LOG_DEBUG("parser", "Cannot open " + file_path + ": " + parserErrorToString(last_error_));
        return last_error_;
    }
    input_ = std::move(file);
    eof_ = false;
    first_line_ = true;
    records_read_ = 0;
    last_error_ = ParserError::SUCCESS;
    stats_.startTiming();
    return last_error_;
}

void StreamingParser::close() {
    if (input_) {
        stats_.stopTiming();
        input_.reset();
    }
    eof_ = true;
}

bool StreamingParser::readPhysicalLine(std::string& line) {
    if (!input_ || eof_) {
        return false;
    }
    if (!std::getline(*input_, line)) {
        if (input_->bad()) {
            last_error_ = ParserError::FILE_READ_ERROR;
        }
        eof_ = true;
        return false;
    }
    stats_.addBytesRead(line.size() + (input_->eof() ? 0 : 1));

    if (first_line_) {
        first_line_ = false;
        if (line.size() >= 3 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line.erase(0, 3);
        }
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

bool StreamingParser::hasOpenQuote(const std::string& text) const {
    // EN: A quote opens a quoted field only at the start of a field; a doubled quote
    //     inside a quoted field is literal.
    // FR: Une quote n'ouvre un champ quoté qu'en début de champ ; une quote doublée dans
    //     un champ quoté est littérale.
    bool in_quotes = false;
    bool field_start = true;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == config_.quote_char) {
                if (i + 1 < text.size() && text[i + 1] == config_.quote_char) {
                    ++i;
                } else {
                    in_quotes = false;
                }
            }
            field_start = false;
        } else if (c == config_.quote_char && field_start) {
            in_quotes = true;
            field_start = false;
        } else {
            field_start = (c == config_.delimiter);
        }
    }
    return in_quotes;
}

bool StreamingParser::readLogicalRecord(std::string& record) {
    if (!readPhysicalLine(record)) {
        return false;
    }
    size_t lines = 1;
    while (hasOpenQuote(record)) {
        std::string continuation;
        if (lines >= config_.max_record_lines || !readPhysicalLine(continuation)) {
            // EN: Keep what was read; the open quote swallows the rest of the input
            // FR: Conserve ce qui a été lu ; la quote ouverte absorbe le reste de l'entrée
            last_error_ = ParserError::UNTERMINATED_QUOTE;
            LOG_WARN("parser", "Unterminated quoted field near record " + std::to_string(records_read_ + 1));
            break;
        }
        record += '\n';
        record += continuation;
        ++lines;
    }
    return true;
}

bool StreamingParser::readRecord(Record& fields) {
    if (!input_) {
        last_error_ = ParserError::NOT_OPEN;
        return false;
    }
    std::string raw;
    while (readLogicalRecord(raw)) {
        if (config_.skip_empty_rows && trim(raw).empty()) {
            stats_.incrementRowsSkipped();
            continue;
        }
        fields = parseRow(raw, config_);
        ++records_read_;
        stats_.incrementRowsParsed();
        stats_.recordFieldCount(fields.size());
        return true;
    }
    return false;
}

std::optional<Record> StreamingParser::readHeader() {
    Record fields;
    while (readRecord(fields)) {
        if (!isBlankRecord(fields)) {
            for (auto& field : fields) {
                field = trim(field);
            }
            return fields;
        }
    }
    return std::nullopt;
}

RecordChunk StreamingParser::nextChunk(size_t max_rows) {
    RecordChunk chunk;
    chunk.first_row_number = records_read_ + 1;
    if (max_rows == 0) {
        return chunk;
    }
    chunk.rows.reserve(std::min<size_t>(max_rows, 4096));
    Record fields;
    while (chunk.rows.size() < max_rows && readRecord(fields)) {
        chunk.rows.push_back(std::move(fields));
        fields = Record{};
    }
    return chunk;
}

std::vector<std::string> StreamingParser::parseRow(const std::string& row, const ParserConfig& config) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;
    bool field_start = true;

    auto finish_field = [&]() {
        fields.push_back(config.trim_whitespace ? trim(current) : current);
        current.clear();
        field_start = true;
    };

    for (size_t pos = 0; pos < row.size(); ++pos) {
        char c = row[pos];
        if (in_quotes) {
            if (c == config.quote_char) {
                if (pos + 1 < row.size() && row[pos + 1] == config.quote_char) {
                    // EN: Escaped quote within quoted field
                    // FR: Quote échappée dans un champ quoté
                    current += c;
                    ++pos;
                } else {
                    in_quotes = false;
                }
            } else {
                current += c;
            }
        } else if (c == config.quote_char && field_start) {
            in_quotes = true;
            field_start = false;
        } else if (c == config.delimiter) {
            finish_field();
        } else {
            current += c;
            field_start = false;
        }
    }
    finish_field();
    return fields;
}

std::string StreamingParser::escapeField(const std::string& field, const ParserConfig& config) {
    bool needs_quoting = field.find(config.delimiter) != std::string::npos ||
                         field.find(config.quote_char) != std::string::npos ||
                         field.find('\n') != std::string::npos ||
                         field.find('\r') != std::string::npos;
    if (!needs_quoting) {
        return field;
    }

    std::string escaped;
    escaped.reserve(field.size() + 2);
    escaped += config.quote_char;
    for (char c : field) {
        if (c == config.quote_char) {
            escaped += config.quote_char;
        }
        escaped += c;
    }
    escaped += config.quote_char;
    return escaped;
}

bool StreamingParser::isBlankRecord(const Record& fields) {
    return std::all_of(fields.begin(), fields.end(),
                       [](const std::string& field) { return trim(field).empty(); });
}

std::string StreamingParser::trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return std::string();
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

} // namespace CSV
} // namespace ConCat
