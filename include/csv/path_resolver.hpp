// EN: Input discovery - turns a directory, glob patterns or a file list into a sorted set of files
// FR: Découverte des entrées - transforme un répertoire, des motifs glob ou une liste en ensemble trié

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ConCat {
namespace CSV {

// EN: How the user designated the inputs (mutually exclusive)
// FR: Manière dont l'utilisateur a désigné les entrées (mutuellement exclusives)
enum class InputMode {
    DIRECTORY,      // EN: Regular files directly inside one directory / FR: Fichiers réguliers d'un répertoire
    GLOB,           // EN: Glob patterns or literal paths / FR: Motifs glob ou chemins littéraux
    FILES           // EN: Explicit file list / FR: Liste explicite de fichiers
};

std::string inputModeToString(InputMode mode);

struct DiscoveryRequest {
    InputMode mode{InputMode::FILES};
    std::filesystem::path directory;
    std::vector<std::string> patterns;
    std::vector<std::filesystem::path> files;
    std::optional<std::string> extension;   // EN: Required extension, any case, dot optional / FR: Extension requise, casse libre, point optionnel
};

struct DiscoveryResult {
    std::vector<std::filesystem::path> files;  // EN: Absolute, normalised, sorted, unique / FR: Absolus, normalisés, triés, uniques
    std::string extension;                     // EN: Lowercase, without dot / FR: Minuscule, sans point
};

// EN: Resolves the user's input designation into the list of files to merge.
// FR: Résout la désignation des entrées en liste de fichiers à fusionner.
class PathResolver {
public:
    PathResolver() = default;

    // EN: Throws DiscoveryError (missing path), ExtensionConflictError (mixed extensions without
    //     a required one) or NoInputError (empty set before or after filtering).
    // FR: Lance DiscoveryError (chemin absent), ExtensionConflictError (extensions mixtes sans
    //     extension imposée) ou NoInputError (ensemble vide avant ou après filtrage).
    DiscoveryResult resolve(const DiscoveryRequest& request) const;

    // EN: ".CSV" -> "csv"
    // FR: ".CSV" -> "csv"
    static std::string normalizeExtension(const std::string& extension);

    // EN: Lowercase suffix of a path without the dot ("" when none)
    // FR: Suffixe en minuscules sans le point ("" si aucun)
    static std::string extensionOf(const std::filesystem::path& path);

    // EN: Expands one glob(3) pattern; no match yields an empty list.
    // FR: Développe un motif glob(3) ; aucune correspondance donne une liste vide.
    static std::vector<std::filesystem::path> expandGlob(const std::string& pattern);

private:
    std::vector<std::filesystem::path> collect(const DiscoveryRequest& request) const;
    std::string inferExtension(const std::vector<std::filesystem::path>& files) const;
};

} // namespace CSV
} // namespace ConCat
