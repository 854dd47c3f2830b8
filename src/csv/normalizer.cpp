#include "csv/normalizer.hpp"
#include "csv/batch_writer.hpp"
#include "csv/combine_errors.hpp"
#include "csv/header_reader.hpp"
#include "csv/streaming_parser.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/threading/thread_pool.hpp"
#include <algorithm>
#include <exception>
#include <future>

namespace ConCat {
namespace CSV {

Normalizer::Normalizer(const NormalizerConfig& config) : config_(config) {
    if (config_.chunk_size == 0) {
        throw ConfigurationError("chunk size must be positive");
    }
    if (config_.thread_count == 0) {
        throw ConfigurationError("thread count must be positive");
    }
}

std::vector<SourceFile> Normalizer::normalize(const std::vector<SourceFile>& files, ScopedWorkspace& workspace) const {
    const std::filesystem::path& target_dir = workspace.path();
    LOG_INFO("normalizer", "Normalizing " + std::to_string(files.size()) + " file(s) to '" +
             delimiterDisplay(config_.target_delimiter) + "' in " + target_dir.string());

    std::vector<std::future<RewriteResult>> futures;
    futures.reserve(files.size());
    {
        ThreadPoolConfig pool_config;
        pool_config.thread_count = std::min(config_.thread_count, std::max<size_t>(files.size(), 1));
        pool_config.name = "normalizer";
        ThreadPool pool(pool_config);

        for (size_t i = 0; i < files.size(); ++i) {
            std::filesystem::path destination = target_dir / scratchName(i, files[i].origin());
            futures.push_back(pool.submitNamed("normalize:" + files[i].origin().filename().string(),
                                               &Normalizer::rewriteFile, files[i], destination,
                                               config_.target_delimiter, config_.chunk_size));
        }
        pool.waitForAll();

        ThreadPoolStats pool_stats = pool.getStats();
        LOG_DEBUG("normalizer", std::to_string(pool_stats.completed_tasks) + " rewrite task(s) done, " +
                  std::to_string(pool_stats.failed_tasks) + " failed, peak queue " +
                  std::to_string(pool_stats.peak_queue_size) + " on " + std::to_string(pool_stats.total_threads) +
                  " worker(s) in " + std::to_string(pool_stats.total_runtime.count()) + " ms");
    }

    // EN: Every task has finished here; keep the first failure, log the others
    // FR: Toutes les tâches sont terminées ici ; garde le premier échec, journalise les autres
    std::exception_ptr first_failure;
    std::vector<RewriteResult> results;
    results.reserve(files.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            results.push_back(futures[i].get());
        } catch (const std::exception& e) {
            if (!first_failure) {
                first_failure = std::current_exception();
            } else {
                LOG_WARN("normalizer", "Additional failure on " + files[i].origin().string() + ": " + e.what());
            }
        }
    }
    if (first_failure) {
        std::rethrow_exception(first_failure);
    }

    std::vector<SourceFile> rebuilt;
    rebuilt.reserve(files.size());
    size_t total_rows = 0;
    for (size_t i = 0; i < files.size(); ++i) {
        const auto& destination = results[i].destination;
        rebuilt.push_back(files[i].rebased(destination, config_.target_delimiter,
                                           HeaderReader::readHeader(destination, config_.target_delimiter)));
        total_rows += results[i].rows_written;
    }
    LOG_INFO("normalizer", "Normalized " + std::to_string(files.size()) + " file(s), " +
             std::to_string(total_rows) + " rows");
    return rebuilt;
}

RewriteResult Normalizer::rewriteFile(const SourceFile& source, const std::filesystem::path& destination,
                                      char target_delimiter, size_t chunk_size) {
    ParserConfig parser_config;
    parser_config.delimiter = source.delimiter();
    StreamingParser parser(parser_config);
    ParserError open_status = parser.open(source.path().string());
    if (open_status != ParserError::SUCCESS) {
        throw IoError("Cannot read " + source.path().string() + ": " + parserErrorToString(open_status));
    }

    auto header = parser.readHeader();
    if (!header.has_value()) {
        throw IoError("No header row in " + source.path().string());
    }

    WriterConfig writer_config;
    writer_config.delimiter = target_delimiter;
    writer_config.compression = CompressionType::NONE;
    BatchWriter writer(writer_config);
    WriterError status = writer.open(destination.string());
    if (status != WriterError::SUCCESS) {
        throw IoError("Cannot write " + destination.string() + ": " + writerErrorToString(status));
    }
    status = writer.writeHeader(*header);

    RewriteResult result;
    result.destination = destination;
    const size_t width = header->size();

    while (status == WriterError::SUCCESS) {
        if (SignalHandler::getInstance().isShutdownRequested()) {
            throw InterruptedError();
        }
        RecordChunk chunk = parser.nextChunk(chunk_size);
        if (chunk.empty()) {
            break;
        }
        for (auto& row : chunk.rows) {
            if (row.size() > width) {
                result.malformed_rows++;
            }
            row.resize(width);
            status = writer.writeRow(row);
            if (status != WriterError::SUCCESS) {
                break;
            }
            result.rows_written++;
        }
    }

    WriterError close_status = writer.close();
    if (status == WriterError::SUCCESS) {
        status = close_status;
    }
    if (status != WriterError::SUCCESS) {
        throw IoError("Cannot write " + destination.string() + ": " + writerErrorToString(status));
    }
    if (parser.lastError() == ParserError::FILE_READ_ERROR) {
        throw IoError("Read error on " + source.path().string());
    }
    if (result.malformed_rows > 0) {
        LOG_WARN("normalizer", source.origin().filename().string() + ": " + std::to_string(result.malformed_rows) +
                 " row(s) wider than the header were truncated");
    }
    LOG_DEBUG("normalizer", source.origin().string() + " -> " + destination.string());
    return result;
}

std::string Normalizer::scratchName(size_t index, const std::filesystem::path& origin) {
    return std::to_string(index) + "_" + origin.filename().string();
}

std::vector<char> Normalizer::distinctDelimiters(const std::vector<SourceFile>& files) {
    std::vector<char> observed;
    for (const auto& file : files) {
        if (std::find(observed.begin(), observed.end(), file.delimiter()) == observed.end()) {
            observed.push_back(file.delimiter());
        }
    }
    return observed;
}

} // namespace CSV
} // namespace ConCat
