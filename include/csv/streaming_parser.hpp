// EN: Streaming delimited-text reader - reads records in bounded chunks without loading whole files
// FR: Lecteur de texte délimité en streaming - lit les enregistrements par blocs bornés sans charger le fichier

#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ConCat {
namespace CSV {

// EN: One parsed record (fields in file order)
// FR: Un enregistrement analysé (champs dans l'ordre du fichier)
using Record = std::vector<std::string>;

// EN: Parser error types
// FR: Types d'erreur du parser
enum class ParserError {
    SUCCESS,                    // EN: No error / FR: Aucune erreur
    FILE_NOT_FOUND,             // EN: Input file not found / FR: Fichier d'entrée introuvable
    FILE_READ_ERROR,            // EN: Error reading file / FR: Erreur de lecture du fichier
    UNTERMINATED_QUOTE,         // EN: Quoted field runs to end of file / FR: Champ quoté jusqu'à la fin du fichier
    NOT_OPEN                    // EN: No input attached / FR: Aucune entrée attachée
};

std::string parserErrorToString(ParserError error);

// EN: Parser configuration options
// FR: Options de configuration du parser
struct ParserConfig {
    char delimiter{','};                    // EN: Field delimiter character / FR: Caractère délimiteur de champ
    char quote_char{'"'};                   // EN: Quote character for escaped fields / FR: Caractère de quote pour champs échappés
    bool trim_whitespace{false};            // EN: Trim leading/trailing whitespace of each field / FR: Supprimer espaces en début/fin de champ
    bool skip_empty_rows{true};             // EN: Skip blank lines / FR: Ignorer les lignes vides
    size_t max_record_lines{100000};        // EN: Physical lines one quoted record may span / FR: Lignes physiques qu'un enregistrement quoté peut couvrir
};

// EN: A bounded batch of records
// FR: Un lot borné d'enregistrements
struct RecordChunk {
    std::vector<Record> rows;
    size_t first_row_number{0};             // EN: 1-based record number of rows[0] / FR: Numéro (base 1) de rows[0]

    bool empty() const { return rows.empty(); }
    size_t size() const { return rows.size(); }
};

// EN: Parser statistics
// FR: Statistiques du parser
class ParserStatistics {
public:
    ParserStatistics();

    void reset();
    void startTiming();
    void stopTiming();

    void incrementRowsParsed() { rows_parsed_++; }
    void incrementRowsSkipped() { rows_skipped_++; }
    void addBytesRead(size_t bytes) { bytes_read_ += bytes; }
    void recordFieldCount(size_t count);

    size_t getRowsParsed() const { return rows_parsed_; }
    size_t getRowsSkipped() const { return rows_skipped_; }
    size_t getBytesRead() const { return bytes_read_; }
    size_t getMinFieldCount() const { return rows_parsed_ == 0 ? 0 : min_field_count_; }
    size_t getMaxFieldCount() const { return max_field_count_; }
    std::chrono::duration<double> getParsingDuration() const { return parsing_duration_; }
    double getRowsPerSecond() const;

    std::string generateReport() const;

private:
    size_t rows_parsed_{0};
    size_t rows_skipped_{0};
    size_t bytes_read_{0};
    size_t min_field_count_{SIZE_MAX};
    size_t max_field_count_{0};
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::duration<double> parsing_duration_{0};
};

// EN: Pull-based reader over one delimited text source. Records may span several physical lines
//     when a quoted field contains line breaks. Bytes are taken as-is; invalid UTF-8 never fails a read.
// FR: Lecteur à la demande sur une source de texte délimité. Un enregistrement peut couvrir plusieurs
//     lignes physiques si un champ quoté contient des sauts de ligne. Les octets sont pris tels quels.
class StreamingParser {
public:
    StreamingParser();
    explicit StreamingParser(const ParserConfig& config);
    ~StreamingParser();

    StreamingParser(const StreamingParser&) = delete;
    StreamingParser& operator=(const StreamingParser&) = delete;
    StreamingParser(StreamingParser&& other) noexcept;
    StreamingParser& operator=(StreamingParser&& other) noexcept;

    const ParserConfig& getConfig() const { return config_; }

    // EN: Attach an input. A leading UTF-8 byte order mark is dropped.
    // FR: Attache une entrée. Une marque d'ordre d'octets UTF-8 initiale est supprimée.
    ParserError open(const std::string& file_path);
    void close();
    bool isOpen() const { return input_ != nullptr; }

    // EN: Reads the next record into `fields`. Returns false at end of input or on error
    //     (see lastError()). Blank lines are skipped when configured.
    // FR: Lit l'enregistrement suivant dans `fields`. Retourne false en fin d'entrée ou en
    //     cas d'erreur (voir lastError()). Les lignes vides sont ignorées si configuré.
    bool readRecord(Record& fields);

    // EN: Consumes records up to and including the first one holding a non-blank cell and
    //     returns its cells trimmed. std::nullopt when the input has no such record.
    // FR: Consomme les enregistrements jusqu'au premier contenant une cellule non vide et
    //     retourne ses cellules nettoyées. std::nullopt si l'entrée n'en a pas.
    std::optional<Record> readHeader();

    // EN: Reads up to max_rows records. An empty chunk means end of input.
    // FR: Lit jusqu'à max_rows enregistrements. Un bloc vide signifie fin d'entrée.
    RecordChunk nextChunk(size_t max_rows);

    bool eof() const { return eof_; }
    ParserError lastError() const { return last_error_; }
    size_t recordsRead() const { return records_read_; }

    const ParserStatistics& getStatistics() const { return stats_; }
    void resetStatistics() { stats_.reset(); }

    // EN: Splits one logical record, honouring quotes and doubled quotes.
    // FR: Découpe un enregistrement logique en respectant les quotes et quotes doublées.
    static std::vector<std::string> parseRow(const std::string& row, const ParserConfig& config = ParserConfig{});

    // EN: Minimal quoting: only fields holding the delimiter, the quote or a line break are quoted.
    // FR: Quoting minimal : seuls les champs contenant le délimiteur, la quote ou un saut de ligne sont quotés.
    static std::string escapeField(const std::string& field, const ParserConfig& config = ParserConfig{});

    static bool isBlankRecord(const Record& fields);
    static std::string trim(const std::string& value);

private:
    ParserConfig config_;
    ParserStatistics stats_;

    std::unique_ptr<std::istream> input_;
    bool eof_{false};
    bool first_line_{true};
    ParserError last_error_{ParserError::NOT_OPEN};
    size_t records_read_{0};

    bool readPhysicalLine(std::string& line);
    bool readLogicalRecord(std::string& record);
    bool hasOpenQuote(const std::string& text) const;
};

} // namespace CSV
} // namespace ConCat
