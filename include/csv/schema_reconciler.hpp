// EN: Schema reconciliation - unifies per-file headers or maps an explicitly requested column list
// FR: Réconciliation de schéma - unifie les en-têtes par fichier ou mappe une liste de colonnes demandée

#pragma once

#include "csv/dialect.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ConCat {
namespace CSV {

// EN: How the output schema was built
// FR: Manière dont le schéma de sortie a été construit
enum class SchemaMode {
    RECONCILED,     // EN: Derived from every header under a policy / FR: Dérivé de tous les en-têtes selon une politique
    REQUESTED       // EN: User-supplied column list / FR: Liste de colonnes fournie par l'utilisateur
};

std::string schemaModeToString(SchemaMode mode);

// EN: For one file: per schema column, the file column index feeding it (std::nullopt = null-filled)
// FR: Pour un fichier : par colonne du schéma, l'index de colonne source (std::nullopt = rempli de nulls)
struct ColumnMapping {
    std::vector<std::optional<size_t>> source_index;

    size_t missingCount() const;
};

// EN: A file excluded by the 'skip' missing policy
// FR: Un fichier exclu par la politique 'skip'
struct SkippedFile {
    std::string file;
    std::vector<std::string> missing;
};

// EN: Immutable outcome of reconciliation: the schema, the files to merge and how each one maps onto it.
// FR: Résultat immuable de la réconciliation : le schéma, les fichiers à fusionner et leur projection.
struct SchemaPlan {
    SchemaMode mode{SchemaMode::RECONCILED};
    std::vector<std::string> columns;
    std::vector<SourceFile> files;
    std::vector<ColumnMapping> mappings;    // EN: Aligned with files / FR: Aligné sur files
    std::vector<SkippedFile> skipped;

    SchemaPolicy policy{SchemaPolicy::STRICT};
    MissingPolicy missing_policy{MissingPolicy::ERROR};
    bool case_insensitive{false};
};

class SchemaReconciler {
public:
    // EN: Output columns under `policy`. Throws SchemaMismatchError (strict) or
    //     EmptyIntersectionError (intersection). Column names are unique in the result.
    // FR: Colonnes de sortie selon `policy`. Lance SchemaMismatchError (strict) ou
    //     EmptyIntersectionError (intersection). Les noms sont uniques dans le résultat.
    static std::vector<std::string> reconcile(const std::vector<std::vector<std::string>>& headers,
                                              SchemaPolicy policy,
                                              const std::vector<std::string>& file_names = {});

    static SchemaPlan planReconciled(const std::vector<SourceFile>& files, SchemaPolicy policy);

    // EN: Requested mode. The schema is `requested` verbatim. Throws ConfigurationError on duplicate
    //     names, MissingColumnsError under 'error', NoUsableFilesError when 'skip' removes every file.
    // FR: Mode demandé. Le schéma est `requested` tel quel. Lance ConfigurationError sur doublon,
    //     MissingColumnsError sous 'error', NoUsableFilesError si 'skip' retire tous les fichiers.
    static SchemaPlan planRequested(const std::vector<SourceFile>& files,
                                    const std::vector<std::string>& requested,
                                    bool case_insensitive,
                                    MissingPolicy missing_policy);

    // EN: Resolve `columns` against one file's header; missing names are returned through `missing`.
    // FR: Résout `columns` sur l'en-tête d'un fichier ; les noms absents sont retournés dans `missing`.
    static ColumnMapping mapColumns(const SourceFile& file,
                                    const std::vector<std::string>& columns,
                                    bool case_insensitive,
                                    std::vector<std::string>* missing = nullptr);
};

} // namespace CSV
} // namespace ConCat
