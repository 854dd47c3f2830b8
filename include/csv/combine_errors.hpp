// EN: Fatal error taxonomy for the combine pipeline
// FR: Taxonomie des erreurs fatales du pipeline de combinaison

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ConCat {
namespace CSV {

// EN: Error codes carried by every CombineError
// FR: Codes d'erreur portés par chaque CombineError
enum class CombineErrorCode {
    DISCOVERY,              // EN: Input path missing or unreadable / FR: Chemin d'entrée absent ou illisible
    EXTENSION_CONFLICT,     // EN: Mixed extensions without --extension / FR: Extensions mixtes sans --extension
    NO_INPUT,               // EN: Nothing left to merge after discovery / FR: Rien à fusionner après découverte
    SCHEMA_MISMATCH,        // EN: strict policy with divergent headers / FR: Politique strict avec en-têtes divergents
    EMPTY_INTERSECTION,     // EN: intersection policy gave no columns / FR: Politique intersection sans colonne
    MISSING_COLUMNS,        // EN: Requested columns missing under 'error' / FR: Colonnes demandées absentes sous 'error'
    NO_USABLE_FILES,        // EN: Every file skipped / FR: Tous les fichiers ignorés
    DELIMITER_CONFLICT,     // EN: Mixed delimiters without --normalize / FR: Délimiteurs mixtes sans --normalize
    HEADER_READ,            // EN: One or more headers unreadable / FR: Un ou plusieurs en-têtes illisibles
    CONFIGURATION,          // EN: Invalid option values / FR: Valeurs d'options invalides
    IO,                     // EN: Read/write failure / FR: Échec de lecture/écriture
    INTERRUPTED             // EN: SIGINT/SIGTERM received / FR: SIGINT/SIGTERM reçu
};

// EN: Base class of every fatal combine error.
// FR: Classe de base de toutes les erreurs fatales de combinaison.
class CombineError : public std::runtime_error {
public:
    CombineError(CombineErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    CombineErrorCode code() const noexcept { return code_; }

    // EN: Process exit status for this error (130 when interrupted, 1 otherwise)
    // FR: Code de sortie du processus pour cette erreur (130 si interrompu, 1 sinon)
    int exitCode() const noexcept { return code_ == CombineErrorCode::INTERRUPTED ? 130 : 1; }

private:
    CombineErrorCode code_;
};

class DiscoveryError : public CombineError {
public:
    explicit DiscoveryError(const std::string& message)
        : CombineError(CombineErrorCode::DISCOVERY, message) {}
};

class ExtensionConflictError : public CombineError {
public:
    explicit ExtensionConflictError(const std::string& message)
        : CombineError(CombineErrorCode::EXTENSION_CONFLICT, message) {}
};

class NoInputError : public CombineError {
public:
    explicit NoInputError(const std::string& message)
        : CombineError(CombineErrorCode::NO_INPUT, message) {}
};

// EN: Names the first divergent file together with both headers.
// FR: Nomme le premier fichier divergent avec les deux en-têtes.
class SchemaMismatchError : public CombineError {
public:
    SchemaMismatchError(const std::string& message, std::string file,
                        std::vector<std::string> base_header, std::vector<std::string> file_header)
        : CombineError(CombineErrorCode::SCHEMA_MISMATCH, message)
        , file_(std::move(file))
        , base_header_(std::move(base_header))
        , file_header_(std::move(file_header)) {}

    const std::string& file() const { return file_; }
    const std::vector<std::string>& baseHeader() const { return base_header_; }
    const std::vector<std::string>& fileHeader() const { return file_header_; }

private:
    std::string file_;
    std::vector<std::string> base_header_;
    std::vector<std::string> file_header_;
};

class EmptyIntersectionError : public CombineError {
public:
    explicit EmptyIntersectionError(const std::string& message)
        : CombineError(CombineErrorCode::EMPTY_INTERSECTION, message) {}
};

class MissingColumnsError : public CombineError {
public:
    MissingColumnsError(const std::string& message, std::string file, std::vector<std::string> missing)
        : CombineError(CombineErrorCode::MISSING_COLUMNS, message)
        , file_(std::move(file))
        , missing_(std::move(missing)) {}

    const std::string& file() const { return file_; }
    const std::vector<std::string>& missing() const { return missing_; }

private:
    std::string file_;
    std::vector<std::string> missing_;
};

class NoUsableFilesError : public CombineError {
public:
    explicit NoUsableFilesError(const std::string& message)
        : CombineError(CombineErrorCode::NO_USABLE_FILES, message) {}
};

class DelimiterConflictError : public CombineError {
public:
    DelimiterConflictError(const std::string& message, std::vector<char> observed)
        : CombineError(CombineErrorCode::DELIMITER_CONFLICT, message)
        , observed_(std::move(observed)) {}

    const std::vector<char>& observed() const { return observed_; }

private:
    std::vector<char> observed_;
};

// EN: Aggregated: lists every file whose header could not be read.
// FR: Agrégée : liste tous les fichiers dont l'en-tête n'a pu être lu.
class HeaderReadError : public CombineError {
public:
    HeaderReadError(const std::string& message, std::vector<std::string> files)
        : CombineError(CombineErrorCode::HEADER_READ, message)
        , files_(std::move(files)) {}

    const std::vector<std::string>& files() const { return files_; }

private:
    std::vector<std::string> files_;
};

class ConfigurationError : public CombineError {
public:
    explicit ConfigurationError(const std::string& message)
        : CombineError(CombineErrorCode::CONFIGURATION, message) {}
};

class IoError : public CombineError {
public:
    explicit IoError(const std::string& message)
        : CombineError(CombineErrorCode::IO, message) {}
};

class InterruptedError : public CombineError {
public:
    explicit InterruptedError(const std::string& message = "Interrupted.")
        : CombineError(CombineErrorCode::INTERRUPTED, message) {}
};

std::string combineErrorCodeToString(CombineErrorCode code);

} // namespace CSV
} // namespace ConCat
