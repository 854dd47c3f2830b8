// EN: Delimiter normalization - rewrites every input into a scratch workspace with one target delimiter
// FR: Normalisation des délimiteurs - réécrit chaque entrée dans un espace de travail avec un délimiteur cible

#pragma once

#include "csv/dialect.hpp"
#include "infrastructure/system/scoped_workspace.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace ConCat {
namespace CSV {

struct NormalizerConfig {
    char target_delimiter{','};
    size_t chunk_size{200000};      // EN: Rows per read/write batch / FR: Lignes par lot de lecture/écriture
    size_t thread_count{4};         // EN: Worker pool size / FR: Taille du pool de workers
};

// EN: Outcome of one file rewrite
// FR: Résultat de la réécriture d'un fichier
struct RewriteResult {
    std::filesystem::path destination;
    size_t rows_written{0};
    size_t malformed_rows{0};
};

class Normalizer {
public:
    explicit Normalizer(const NormalizerConfig& config);

    const NormalizerConfig& getConfig() const { return config_; }

    // EN: Rewrites each file concurrently (one task per file) into `workspace` and returns the
    //     rebuilt records in input order. Blocks until every task has finished; the first failure
    //     in input order is rethrown (IoError, InterruptedError).
    // FR: Réécrit chaque fichier en parallèle (une tâche par fichier) dans `workspace` et retourne
    //     les enregistrements reconstruits dans l'ordre d'entrée. Bloque jusqu'à la fin de toutes
    //     les tâches ; le premier échec dans l'ordre d'entrée est relancé.
    std::vector<SourceFile> normalize(const std::vector<SourceFile>& files, ScopedWorkspace& workspace) const;

    // EN: Streams `source` in chunks and writes it to `destination` with `target_delimiter`.
    //     The header is written once; rows are padded or truncated to the header width.
    // FR: Lit `source` par blocs et l'écrit dans `destination` avec `target_delimiter`.
    //     L'en-tête est écrit une fois ; les lignes sont complétées ou tronquées à sa largeur.
    static RewriteResult rewriteFile(const SourceFile& source, const std::filesystem::path& destination,
                                     char target_delimiter, size_t chunk_size);

    // EN: "<index>_<basename>": unique even for equal basenames in different directories.
    // FR: "<index>_<basename>" : unique même pour des noms identiques dans des répertoires différents.
    static std::string scratchName(size_t index, const std::filesystem::path& origin);

    // EN: Distinct delimiters in first-seen order
    // FR: Délimiteurs distincts dans l'ordre de première apparition
    static std::vector<char> distinctDelimiters(const std::vector<SourceFile>& files);

private:
    NormalizerConfig config_;
};

} // namespace CSV
} // namespace ConCat
