// EN: Buffered delimited-text writer with a single header and optional gzip compression
// FR: Writer de texte délimité bufferisé avec un en-tête unique et compression gzip optionnelle

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <zlib.h>

namespace ConCat {
namespace CSV {

// EN: Compression types supported by the writer
// FR: Types de compression supportés par le writer
enum class CompressionType {
    NONE,           // EN: No compression / FR: Pas de compression
    GZIP,           // EN: GZIP compression / FR: Compression GZIP
    AUTO            // EN: GZIP when the file name ends with .gz / FR: GZIP si le nom de fichier se termine par .gz
};

// EN: Writer error types
// FR: Types d'erreur du writer
enum class WriterError {
    SUCCESS,                    // EN: No error / FR: Aucune erreur
    FILE_OPEN_ERROR,            // EN: Error opening file / FR: Erreur d'ouverture du fichier
    FILE_WRITE_ERROR,           // EN: Error writing to file / FR: Erreur d'écriture dans le fichier
    COMPRESSION_ERROR,          // EN: zlib reported a failure / FR: zlib a signalé un échec
    INVALID_CONFIGURATION,      // EN: Invalid writer configuration / FR: Configuration de writer invalide
    NOT_OPEN,                   // EN: No file open / FR: Aucun fichier ouvert
    HEADER_ALREADY_WRITTEN      // EN: Second header attempt / FR: Seconde tentative d'en-tête
};

std::string writerErrorToString(WriterError error);

// EN: Writer configuration options
// FR: Options de configuration du writer
struct WriterConfig {
    char delimiter{','};                    // EN: Field delimiter character / FR: Caractère délimiteur de champ
    char quote_char{'"'};                   // EN: Quote character for fields / FR: Caractère de quote pour les champs
    std::string line_ending{"\n"};          // EN: Line ending sequence / FR: Séquence de fin de ligne
    bool write_header{true};                // EN: Write header row / FR: Écrire la ligne d'en-tête
    bool create_parent_directories{true};   // EN: mkdir -p on the parent of the output / FR: mkdir -p sur le parent de la sortie
    size_t buffer_size{65536};              // EN: Bytes buffered before a flush / FR: Octets bufferisés avant un flush
    CompressionType compression{CompressionType::AUTO};
    int compression_level{6};               // EN: Compression level (1-9) / FR: Niveau de compression (1-9)

    bool isValid() const;

    static CompressionType detectCompressionFromFilename(const std::string& filename);
};

// EN: Writer statistics
// FR: Statistiques du writer
class WriterStatistics {
public:
    WriterStatistics();

    void reset();
    void startTiming();
    void stopTiming();

    void incrementRowsWritten() { rows_written_++; }
    void incrementFlushCount() { flush_count_++; }
    void addBytesWritten(size_t bytes) { bytes_written_ += bytes; }
    void markHeaderWritten() { header_written_ = true; }

    size_t getRowsWritten() const { return rows_written_; }
    size_t getBytesWritten() const { return bytes_written_; }
    size_t getFlushCount() const { return flush_count_; }
    bool isHeaderWritten() const { return header_written_; }
    std::chrono::duration<double> getWriteDuration() const { return write_duration_; }

    std::string generateReport() const;

private:
    size_t rows_written_{0};
    size_t bytes_written_{0};       // EN: Uncompressed bytes / FR: Octets non compressés
    size_t flush_count_{0};
    bool header_written_{false};
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::duration<double> write_duration_{0};
};

// EN: Sequential writer over one output file. The file is truncated at open; the header can be
//     written at most once and only before the first row.
// FR: Writer séquentiel sur un fichier de sortie. Le fichier est tronqué à l'ouverture ; l'en-tête
//     ne peut être écrit qu'une fois et seulement avant la première ligne.
class BatchWriter {
public:
    BatchWriter();
    explicit BatchWriter(const WriterConfig& config);
    ~BatchWriter();

    BatchWriter(const BatchWriter&) = delete;
    BatchWriter& operator=(const BatchWriter&) = delete;

    const WriterConfig& getConfig() const { return config_; }

    WriterError open(const std::string& filename);
    WriterError close();
    bool isOpen() const { return file_open_; }

    // EN: No-op returning SUCCESS when write_header is disabled.
    // FR: Sans effet (SUCCESS) si write_header est désactivé.
    WriterError writeHeader(const std::vector<std::string>& headers);
    WriterError writeRow(const std::vector<std::string>& fields);
    WriterError flush();

    CompressionType activeCompression() const { return active_compression_; }
    const std::string& getFilename() const { return filename_; }
    const WriterStatistics& getStatistics() const { return stats_; }

    std::string formatRow(const std::vector<std::string>& fields) const;

private:
    WriterConfig config_;
    WriterStatistics stats_;

    std::unique_ptr<std::ofstream> file_stream_;
    gzFile gz_file_{nullptr};
    CompressionType active_compression_{CompressionType::NONE};
    std::string filename_;
    std::string buffer_;
    bool file_open_{false};

    WriterError appendLine(const std::string& line);
    WriterError writeBuffer();
};

} // namespace CSV
} // namespace ConCat
