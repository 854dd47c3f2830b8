// EN: Streaming multi-file merger - projects every input onto the schema and appends to one output
// FR: Fusionneur multi-fichiers en streaming - projette chaque entrée sur le schéma et ajoute à une sortie

#pragma once

#include "csv/dialect.hpp"
#include "csv/schema_reconciler.hpp"
#include "csv/streaming_parser.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ConCat {
namespace CSV {

class BatchWriter;

// EN: Injected source-identifier column
// FR: Colonne d'identification de source injectée
struct SourceColumnConfig {
    bool enabled{true};
    std::string name{"source_file"};
    SourceColumnMode mode{SourceColumnMode::NAME};
};

// EN: Merge configuration
// FR: Configuration de fusion
struct MergeConfig {
    std::filesystem::path output_path;
    char output_delimiter{','};
    bool write_header{true};
    size_t chunk_size{200000};              // EN: Rows held in memory at once / FR: Lignes en mémoire à la fois
    SourceColumnConfig source_column;

    // EN: Throws ConfigurationError on invalid values
    // FR: Lance ConfigurationError sur valeurs invalides
    void validate() const;
};

// EN: Statistics collector for merge operations
// FR: Collecteur de statistiques pour opérations de fusion
class MergeStatistics {
public:
    MergeStatistics();

    void reset();

    void startTiming();
    void stopTiming();
    void recordPhaseTime(const std::string& phase, std::chrono::duration<double> duration);

    size_t getFilesProcessed() const { return files_processed_.load(); }
    size_t getRowsRead() const { return rows_read_.load(); }
    size_t getRowsWritten() const { return rows_written_.load(); }
    size_t getMalformedRows() const { return malformed_rows_.load(); }
    size_t getPaddedRows() const { return padded_rows_.load(); }
    size_t getBytesRead() const { return bytes_read_.load(); }
    size_t getChunksProcessed() const { return chunks_processed_.load(); }

    double getRowsPerSecond() const;
    std::chrono::duration<double> getTotalDuration() const { return total_duration_; }
    std::map<std::string, std::chrono::duration<double>> getPhaseTimings() const;

    void incrementFilesProcessed(size_t count = 1) { files_processed_ += count; }
    void incrementRowsRead(size_t count = 1) { rows_read_ += count; }
    void incrementRowsWritten(size_t count = 1) { rows_written_ += count; }
    void incrementMalformedRows(size_t count = 1) { malformed_rows_ += count; }
    void incrementPaddedRows(size_t count = 1) { padded_rows_ += count; }
    void incrementChunksProcessed(size_t count = 1) { chunks_processed_ += count; }
    void addBytesRead(size_t bytes) { bytes_read_ += bytes; }

    std::string generateReport() const;

private:
    std::atomic<size_t> files_processed_{0};
    std::atomic<size_t> rows_read_{0};
    std::atomic<size_t> rows_written_{0};
    std::atomic<size_t> malformed_rows_{0};     // EN: Rows wider than the header (truncated) / FR: Lignes plus larges que l'en-tête (tronquées)
    std::atomic<size_t> padded_rows_{0};        // EN: Rows narrower than the header / FR: Lignes plus étroites que l'en-tête
    std::atomic<size_t> bytes_read_{0};
    std::atomic<size_t> chunks_processed_{0};

    std::chrono::steady_clock::time_point start_time_;
    std::chrono::duration<double> total_duration_{0};
    std::map<std::string, std::chrono::duration<double>> phase_timings_;
    mutable std::mutex timing_mutex_;
};

// EN: Sequential merger: one output handle, files in plan order, one chunk in memory at a time.
// FR: Fusionneur séquentiel : un seul flux de sortie, fichiers dans l'ordre du plan, un bloc en mémoire.
class MergerEngine {
public:
    explicit MergerEngine(const MergeConfig& config);

    const MergeConfig& getConfig() const { return config_; }

    // EN: Writes the header (once, even with no data rows) then every row of every plan file.
    //     Returns the number of data rows written. Throws IoError or InterruptedError; a partially
    //     written output is removed on failure.
    // FR: Écrit l'en-tête (une fois, même sans ligne de données) puis chaque ligne de chaque fichier
    //     du plan. Retourne le nombre de lignes écrites. Lance IoError ou InterruptedError ; une
    //     sortie partielle est supprimée en cas d'échec.
    size_t merge(const SchemaPlan& plan);

    // EN: Output header: optional source column followed by the schema. Throws ConfigurationError
    //     when the source column name collides with a schema column.
    // FR: En-tête de sortie : colonne source optionnelle puis le schéma. Lance ConfigurationError
    //     si le nom de la colonne source entre en collision avec une colonne du schéma.
    std::vector<std::string> outputColumns(const SchemaPlan& plan) const;

    const MergeStatistics& getStatistics() const { return stats_; }

    // EN: Projects one data row (already shaped to the file header width) onto the schema.
    //     Unmapped columns become the null value (empty string).
    // FR: Projette une ligne (déjà mise à la largeur de l'en-tête) sur le schéma.
    //     Les colonnes non mappées deviennent la valeur nulle (chaîne vide).
    static Record projectRow(const Record& row, const ColumnMapping& mapping);

private:
    MergeConfig config_;
    MergeStatistics stats_;

    size_t mergeFile(const SourceFile& file, const ColumnMapping& mapping, BatchWriter& writer);
    void checkInterrupted() const;
};

} // namespace CSV
} // namespace ConCat
