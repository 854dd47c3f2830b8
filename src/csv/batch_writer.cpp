// EN: Buffered delimited-text writer implementation
// FR: Implémentation du writer de texte délimité bufferisé

#include "csv/batch_writer.hpp"
#include "csv/streaming_parser.hpp"
#include "infrastructure/logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace ConCat {
namespace CSV {

std::string writerErrorToString(WriterError error) {
    switch (error) {
        case WriterError::SUCCESS: return "SUCCESS";
        case WriterError::FILE_OPEN_ERROR: return "FILE_OPEN_ERROR";
        case WriterError::FILE_WRITE_ERROR: return "FILE_WRITE_ERROR";
        case WriterError::COMPRESSION_ERROR: return "COMPRESSION_ERROR";
        case WriterError::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case WriterError::NOT_OPEN: return "NOT_OPEN";
        case WriterError::HEADER_ALREADY_WRITTEN: return "HEADER_ALREADY_WRITTEN";
    }
    return "UNKNOWN";
}

// EN: WriterConfig implementation
// FR: Implémentation de WriterConfig

bool WriterConfig::isValid() const {
    if (delimiter == quote_char || delimiter == '\n' || delimiter == '\r') {
        return false;
    }
    if (line_ending.empty() || buffer_size == 0) {
        return false;
    }
    return compression_level >= 1 && compression_level <= 9;
}

CompressionType WriterConfig::detectCompressionFromFilename(const std::string& filename) {
    std::string lower_filename = filename;
    std::transform(lower_filename.begin(), lower_filename.end(), lower_filename.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_filename.ends_with(".gz") ? CompressionType::GZIP : CompressionType::NONE;
}

// EN: WriterStatistics implementation
// FR: Implémentation de WriterStatistics

WriterStatistics::WriterStatistics() {
    reset();
}

void WriterStatistics::reset() {
    rows_written_ = 0;
    bytes_written_ = 0;
    flush_count_ = 0;
    header_written_ = false;
    write_duration_ = std::chrono::duration<double>(0);
}

void WriterStatistics::startTiming() {
    start_time_ = std::chrono::steady_clock::now();
}

void WriterStatistics::stopTiming() {
    write_duration_ = std::chrono::steady_clock::now() - start_time_;
}

std::string WriterStatistics::generateReport() const {
    std::ostringstream oss;
    oss << "=== Writer Statistics ===\n";
    oss << "Header written: " << (header_written_ ? "yes" : "no") << "\n";
    oss << "Rows written: " << rows_written_ << "\n";
    oss << "Bytes written: " << bytes_written_ << "\n";
    oss << "Flushes: " << flush_count_ << "\n";
    oss << "Duration: " << std::fixed << std::setprecision(3) << write_duration_.count() << "s\n";
    return oss.str();
}

// EN: BatchWriter implementation
// FR: Implémentation de BatchWriter

BatchWriter::BatchWriter() : BatchWriter(WriterConfig{}) {}

BatchWriter::BatchWriter(const WriterConfig& config) : config_(config) {}

BatchWriter::~BatchWriter() {
    if (file_open_) {
        WriterError result = close();
        if (result != WriterError::SUCCESS) {
            LOG_ERROR("batch_writer", "Close failed in destructor for " + filename_ + ": " +
                      writerErrorToString(result));
        }
    }
}

WriterError BatchWriter::open(const std::string& filename) {
    if (!config_.isValid()) {
        return WriterError::INVALID_CONFIGURATION;
    }
    if (file_open_) {
        WriterError result = close();
        if (result != WriterError::SUCCESS) {
            return result;
        }
    }

    if (config_.create_parent_directories) {
        std::filesystem::path parent = std::filesystem::path(filename).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                LOG_ERROR("batch_writer", "Cannot create directory " + parent.string() + ": " + ec.message());
                return WriterError::FILE_OPEN_ERROR;
            }
        }
    }

    active_compression_ = config_.compression == CompressionType::AUTO
        ? WriterConfig::detectCompressionFromFilename(filename)
        : config_.compression;

    if (active_compression_ == CompressionType::GZIP) {
        std::string mode = "wb" + std::to_string(config_.compression_level);
        gz_file_ = gzopen(filename.c_str(), mode.c_str());
        if (gz_file_ == nullptr) {
            LOG_ERROR("batch_writer", "Cannot open gzip file for writing: " + filename);
            return WriterError::FILE_OPEN_ERROR;
        }
    } else {
        file_stream_ = std::make_unique<std::ofstream>(filename, std::ios::binary | std::ios::trunc);
        if (!file_stream_->is_open()) {
            file_stream_.reset();
            LOG_ERROR("batch_writer", "Cannot open file for writing: " + filename);
            return WriterError::FILE_OPEN_ERROR;
        }
    }

    filename_ = filename;
    file_open_ = true;
    buffer_.clear();
    buffer_.reserve(config_.buffer_size);
    stats_.reset();
    stats_.startTiming();
    LOG_DEBUG("batch_writer", "Opened " + filename + (active_compression_ == CompressionType::GZIP ? " (gzip)" : ""));
    return WriterError::SUCCESS;
}

WriterError BatchWriter::close() {
    if (!file_open_) {
        return WriterError::SUCCESS;
    }
    WriterError result = writeBuffer();

    if (gz_file_ != nullptr) {
        if (gzclose(gz_file_) != Z_OK && result == WriterError::SUCCESS) {
            result = WriterError::COMPRESSION_ERROR;
        }
        gz_file_ = nullptr;
    }
    if (file_stream_) {
        file_stream_->close();
        if (file_stream_->fail() && result == WriterError::SUCCESS) {
            result = WriterError::FILE_WRITE_ERROR;
        }
        file_stream_.reset();
    }

    file_open_ = false;
    stats_.stopTiming();
    LOG_DEBUG("batch_writer", "Closed " + filename_ + " after " + std::to_string(stats_.getRowsWritten()) + " rows");
    return result;
}

WriterError BatchWriter::writeHeader(const std::vector<std::string>& headers) {
    if (!file_open_) {
        return WriterError::NOT_OPEN;
    }
    if (!config_.write_header) {
        return WriterError::SUCCESS;
    }
    if (stats_.isHeaderWritten() || stats_.getRowsWritten() > 0) {
        return WriterError::HEADER_ALREADY_WRITTEN;
    }
    WriterError result = appendLine(formatRow(headers));
    if (result == WriterError::SUCCESS) {
        stats_.markHeaderWritten();
    }
    return result;
}

WriterError BatchWriter::writeRow(const std::vector<std::string>& fields) {
    if (!file_open_) {
        return WriterError::NOT_OPEN;
    }
    WriterError result = appendLine(formatRow(fields));
    if (result == WriterError::SUCCESS) {
        stats_.incrementRowsWritten();
    }
    return result;
}

WriterError BatchWriter::flush() {
    if (!file_open_) {
        return WriterError::NOT_OPEN;
    }
    WriterError result = writeBuffer();
    if (result != WriterError::SUCCESS) {
        return result;
    }
    if (gz_file_ != nullptr) {
        return gzflush(gz_file_, Z_SYNC_FLUSH) == Z_OK ? WriterError::SUCCESS : WriterError::COMPRESSION_ERROR;
    }
    file_stream_->flush();
    return file_stream_->fail() ? WriterError::FILE_WRITE_ERROR : WriterError::SUCCESS;
}

std::string BatchWriter::formatRow(const std::vector<std::string>& fields) const {
    ParserConfig quoting;
    quoting.delimiter = config_.delimiter;
    quoting.quote_char = config_.quote_char;

    // EN: A lone empty field is quoted so the line is not read back as blank
    // FR: Un champ vide isolé est quoté pour que la ligne ne soit pas relue comme vide
    if (fields.size() == 1 && fields.front().empty()) {
        return std::string(2, config_.quote_char);
    }

    std::string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            line += config_.delimiter;
        }
        line += StreamingParser::escapeField(fields[i], quoting);
    }
    return line;
}

WriterError BatchWriter::appendLine(const std::string& line) {
    buffer_ += line;
    buffer_ += config_.line_ending;
    if (buffer_.size() >= config_.buffer_size) {
        return writeBuffer();
    }
    return WriterError::SUCCESS;
}

WriterError BatchWriter::writeBuffer() {
    if (buffer_.empty()) {
        return WriterError::SUCCESS;
    }

    if (gz_file_ != nullptr) {
        int written = gzwrite(gz_file_, buffer_.data(), static_cast<unsigned>(buffer_.size()));
        if (written <= 0 || static_cast<size_t>(written) != buffer_.size()) {
            int errnum = 0;
            const char* message = gzerror(gz_file_, &errnum);
            LOG_ERROR("batch_writer", "gzwrite failed on " + filename_ + ": " + (message ? message : "unknown"));
            return WriterError::COMPRESSION_ERROR;
        }
    } else {
        file_stream_->write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        if (file_stream_->fail()) {
            LOG_ERROR("batch_writer", "Write failed on " + filename_);
            return WriterError::FILE_WRITE_ERROR;
        }
    }

    stats_.addBytesWritten(buffer_.size());
    stats_.incrementFlushCount();
    buffer_.clear();
    return WriterError::SUCCESS;
}

} // namespace CSV
} // namespace ConCat
