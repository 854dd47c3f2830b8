// EN: Header extraction - first row with a non-blank cell, quote-aware, cells trimmed
// FR: Extraction d'en-tête - première ligne avec une cellule non vide, quotes gérées, cellules nettoyées

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ConCat {
namespace CSV {

class HeaderReader {
public:
    // EN: Returns an empty vector when the file has no row with a non-blank cell.
    //     Throws IoError when the file cannot be opened.
    // FR: Retourne un vecteur vide si le fichier n'a aucune ligne avec une cellule non vide.
    //     Lance IoError si le fichier ne peut être ouvert.
    static std::vector<std::string> readHeader(const std::filesystem::path& path, char delimiter);
};

} // namespace CSV
} // namespace ConCat
