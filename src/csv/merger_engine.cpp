// EN: Streaming multi-file merger implementation
// FR: Implémentation du fusionneur multi-fichiers en streaming

#include "csv/merger_engine.hpp"
#include "csv/batch_writer.hpp"
#include "csv/combine_errors.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace ConCat {
namespace CSV {

void MergeConfig::validate() const {
    if (output_path.empty()) {
        throw ConfigurationError("Output path is required (--out)");
    }
    if (chunk_size == 0) {
        throw ConfigurationError("--chunksize must be a positive integer");
    }
    if (source_column.enabled && source_column.name.empty()) {
        throw ConfigurationError("--source-col-name must not be empty");
    }
}

// EN: MergeStatistics implementation
// FR: Implémentation de MergeStatistics

MergeStatistics::MergeStatistics() {
    reset();
}

void MergeStatistics::reset() {
    files_processed_ = 0;
    rows_read_ = 0;
    rows_written_ = 0;
    malformed_rows_ = 0;
    padded_rows_ = 0;
    bytes_read_ = 0;
    chunks_processed_ = 0;
    total_duration_ = std::chrono::duration<double>(0);
    std::lock_guard<std::mutex> lock(timing_mutex_);
    phase_timings_.clear();
}

void MergeStatistics::startTiming() {
    start_time_ = std::chrono::steady_clock::now();
}

void MergeStatistics::stopTiming() {
    total_duration_ = std::chrono::steady_clock::now() - start_time_;
}

void MergeStatistics::recordPhaseTime(const std::string& phase, std::chrono::duration<double> duration) {
    std::lock_guard<std::mutex> lock(timing_mutex_);
    phase_timings_[phase] += duration;
}

double MergeStatistics::getRowsPerSecond() const {
    double seconds = total_duration_.count();
    if (seconds <= 0.0) return 0.0;
    return static_cast<double>(rows_written_.load()) / seconds;
}

std::map<std::string, std::chrono::duration<double>> MergeStatistics::getPhaseTimings() const {
    std::lock_guard<std::mutex> lock(timing_mutex_);
    return phase_timings_;
}

std::string MergeStatistics::generateReport() const {
    std::ostringstream report;
    report << std::fixed << std::setprecision(2);

    report << "=== Merge Statistics ===\n";
    report << "Total Duration: " << total_duration_.count() << " seconds\n";

    report << "Rows:\n";
    report << "  - Read: " << rows_read_.load() << "\n";
    report << "  - Written: " << rows_written_.load() << "\n";
    report << "  - Malformed (truncated): " << malformed_rows_.load() << "\n";
    report << "  - Short (padded): " << padded_rows_.load() << "\n";

    report << "Files:\n";
    report << "  - Processed: " << files_processed_.load() << "\n";
    report << "  - Bytes Read: " << bytes_read_.load() << " bytes\n";
    report << "  - Chunks: " << chunks_processed_.load() << "\n";

    report << "Performance:\n";
    report << "  - Rows/second: " << getRowsPerSecond() << "\n";

    auto phase_timings = getPhaseTimings();
    if (!phase_timings.empty()) {
        report << "Phase Timings:\n";
        for (const auto& [phase, duration] : phase_timings) {
            report << "  - " << phase << ": " << duration.count() << " seconds\n";
        }
    }
    return report.str();
}

// EN: MergerEngine implementation
// FR: Implémentation de MergerEngine

MergerEngine::MergerEngine(const MergeConfig& config) : config_(config) {
    config_.validate();
}

std::vector<std::string> MergerEngine::outputColumns(const SchemaPlan& plan) const {
    std::vector<std::string> columns;
    columns.reserve(plan.columns.size() + 1);
    if (config_.source_column.enabled) {
        if (std::find(plan.columns.begin(), plan.columns.end(), config_.source_column.name) != plan.columns.end()) {
            throw ConfigurationError("Source column name '" + config_.source_column.name +
                                     "' collides with an input column; use --source-col-name or --no-source-col");
        }
        columns.push_back(config_.source_column.name);
    }
    columns.insert(columns.end(), plan.columns.begin(), plan.columns.end());
    return columns;
}

size_t MergerEngine::merge(const SchemaPlan& plan) {
    if (plan.files.size() != plan.mappings.size()) {
        throw ConfigurationError("Schema plan has " + std::to_string(plan.files.size()) + " files but " +
                                 std::to_string(plan.mappings.size()) + " column mappings");
    }
    std::vector<std::string> header = outputColumns(plan);

    stats_.reset();
    stats_.startTiming();

    WriterConfig writer_config;
    writer_config.delimiter = config_.output_delimiter;
    writer_config.write_header = config_.write_header;
    writer_config.compression = CompressionType::AUTO;
    BatchWriter writer(writer_config);

    const std::string output = config_.output_path.string();
    WriterError status = writer.open(output);
    if (status != WriterError::SUCCESS) {
        throw IoError("Cannot open output " + output + ": " + writerErrorToString(status));
    }

    try {
        status = writer.writeHeader(header);
        if (status != WriterError::SUCCESS) {
            throw IoError("Cannot write header to " + output + ": " + writerErrorToString(status));
        }

        for (size_t i = 0; i < plan.files.size(); ++i) {
            checkInterrupted();
            auto file_start = std::chrono::steady_clock::now();
            size_t rows = mergeFile(plan.files[i], plan.mappings[i], writer);
            stats_.recordPhaseTime("merge", std::chrono::steady_clock::now() - file_start);
            stats_.incrementFilesProcessed();
            LOG_DEBUG("merger", "[COMBINE] " + plan.files[i].origin().string() + " (sep='" +
                      delimiterDisplay(plan.files[i].delimiter()) + "'): " + std::to_string(rows) + " rows");
        }

        status = writer.close();
        if (status != WriterError::SUCCESS) {
            throw IoError("Cannot finalize output " + output + ": " + writerErrorToString(status));
        }
    } catch (...) {
        // EN: Drop the partial output, then propagate the original error
        // FR: Supprime la sortie partielle, puis propage l'erreur d'origine
        WriterError close_status = writer.close();
        if (close_status != WriterError::SUCCESS) {
            LOG_WARN("merger", "Close after failure returned " + writerErrorToString(close_status));
        }
        std::error_code ec;
        std::filesystem::remove(config_.output_path, ec);
        stats_.stopTiming();
        throw;
    }

    stats_.stopTiming();
    LOG_INFO("merger", "Wrote " + std::to_string(stats_.getRowsWritten()) + " rows from " +
             std::to_string(stats_.getFilesProcessed()) + " file(s) to " + output);
    return stats_.getRowsWritten();
}

size_t MergerEngine::mergeFile(const SourceFile& file, const ColumnMapping& mapping, BatchWriter& writer) {
    ParserConfig parser_config;
    parser_config.delimiter = file.delimiter();
    StreamingParser parser(parser_config);
    ParserError open_status = parser.open(file.path().string());
    if (open_status != ParserError::SUCCESS) {
        throw IoError("Cannot read " + file.path().string() + ": " + parserErrorToString(open_status));
    }

    // EN: The header row is consumed with the same rule used at discovery time
    // FR: La ligne d'en-tête est consommée avec la même règle qu'à la découverte
    auto header = parser.readHeader();
    if (!header.has_value()) {
        return 0;
    }
    const size_t width = header->size();
    const bool with_source = config_.source_column.enabled;
    const std::string source_value = with_source ? file.sourceValue(config_.source_column.mode) : std::string();

    size_t rows_written = 0;
    size_t malformed = 0;
    Record out;
    while (true) {
        checkInterrupted();
        RecordChunk chunk = parser.nextChunk(config_.chunk_size);
        if (chunk.empty()) {
            break;
        }
        stats_.incrementChunksProcessed();
        stats_.incrementRowsRead(chunk.size());

        for (auto& row : chunk.rows) {
            if (row.size() > width) {
                malformed++;
                row.resize(width);
            } else if (row.size() < width) {
                stats_.incrementPaddedRows();
                row.resize(width);
            }

            out.clear();
            if (with_source) {
                out.push_back(source_value);
            }
            Record projected = projectRow(row, mapping);
            out.insert(out.end(), std::make_move_iterator(projected.begin()), std::make_move_iterator(projected.end()));

            WriterError status = writer.writeRow(out);
            if (status != WriterError::SUCCESS) {
                throw IoError("Cannot write to " + config_.output_path.string() + ": " + writerErrorToString(status));
            }
            rows_written++;
        }
        stats_.incrementRowsWritten(chunk.size());
    }

    if (parser.lastError() == ParserError::FILE_READ_ERROR) {
        throw IoError("Read error on " + file.path().string());
    }
    parser.close();
    stats_.addBytesRead(parser.getStatistics().getBytesRead());
    LOG_DEBUG("merger", file.origin().string() + "\n" + parser.getStatistics().generateReport());
    if (malformed > 0) {
        stats_.incrementMalformedRows(malformed);
        LOG_WARN("merger", file.origin().filename().string() + ": " + std::to_string(malformed) +
                 " row(s) wider than the header were truncated");
    }
    return rows_written;
}

Record MergerEngine::projectRow(const Record& row, const ColumnMapping& mapping) {
    Record projected;
    projected.reserve(mapping.source_index.size());
    for (const auto& index : mapping.source_index) {
        if (index.has_value() && *index < row.size()) {
            projected.push_back(row[*index]);
        } else {
            projected.emplace_back();
        }
    }
    return projected;
}

void MergerEngine::checkInterrupted() const {
    if (SignalHandler::getInstance().isShutdownRequested()) {
        throw InterruptedError();
    }
}

} // namespace CSV
} // namespace ConCat
