// EN: Delimiter vocabulary, policy enums and the per-file SourceFile record
// FR: Vocabulaire des délimiteurs, énumérations de politiques et enregistrement SourceFile par fichier

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ConCat {
namespace CSV {

// EN: Named delimiters accepted on the command line, in sniffing order.
// FR: Délimiteurs nommés acceptés en ligne de commande, dans l'ordre de détection.
const std::vector<std::pair<std::string, char>>& supportedDelimiters();

// EN: "comma" -> ',' etc. Throws ConfigurationError for unknown names.
// FR: "comma" -> ',' etc. Lance ConfigurationError pour les noms inconnus.
char delimiterFromName(const std::string& name);

// EN: ',' -> "comma" etc. Returns the character itself when not a named delimiter.
// FR: ',' -> "comma" etc. Retourne le caractère lui-même s'il n'est pas nommé.
std::string delimiterName(char delimiter);

// EN: Printable form: "," or "\t".
// FR: Forme affichable : "," ou "\t".
std::string delimiterDisplay(char delimiter);

// EN: Names shown as a quoted list in messages: "['id', 'name']".
// FR: Noms affichés comme liste quotée dans les messages : "['id', 'name']".
std::string formatNameList(const std::vector<std::string>& names);

// EN: Column reconciliation policy (reconciled mode)
// FR: Politique de réconciliation des colonnes (mode réconcilié)
enum class SchemaPolicy {
    STRICT,         // EN: Header sets must be equal / FR: Les ensembles d'en-têtes doivent être égaux
    UNION,          // EN: Every column, first-seen order / FR: Toutes les colonnes, ordre de première apparition
    INTERSECTION    // EN: Columns common to all files / FR: Colonnes communes à tous les fichiers
};

// EN: Handling of files lacking requested columns (requested mode)
// FR: Traitement des fichiers sans les colonnes demandées (mode demandé)
enum class MissingPolicy {
    ERROR,          // EN: Abort the run / FR: Interrompt l'exécution
    SKIP,           // EN: Exclude the file / FR: Exclut le fichier
    FILLNA          // EN: Keep the file, fill with nulls / FR: Garde le fichier, remplit de nulls
};

// EN: Value of the injected source column
// FR: Valeur de la colonne source injectée
enum class SourceColumnMode {
    NAME,           // EN: File name with extension / FR: Nom de fichier avec extension
    STEM,           // EN: File name without extension / FR: Nom de fichier sans extension
    PATH            // EN: Full path / FR: Chemin complet
};

SchemaPolicy schemaPolicyFromString(const std::string& value);
std::string schemaPolicyToString(SchemaPolicy policy);
MissingPolicy missingPolicyFromString(const std::string& value);
std::string missingPolicyToString(MissingPolicy policy);
SourceColumnMode sourceColumnModeFromString(const std::string& value);
std::string sourceColumnModeToString(SourceColumnMode mode);

// EN: Immutable per-file record. `origin` is the user's file; `path` is where rows are read
//     from (differs from origin only after normalization).
// FR: Enregistrement immuable par fichier. `origin` est le fichier de l'utilisateur ; `path`
//     est l'endroit d'où les lignes sont lues (diffère d'origin seulement après normalisation).
class SourceFile {
public:
    SourceFile(std::filesystem::path origin, std::filesystem::path path,
               char delimiter, std::vector<std::string> header);

    const std::filesystem::path& origin() const { return origin_; }
    const std::filesystem::path& path() const { return path_; }
    char delimiter() const { return delimiter_; }
    const std::vector<std::string>& header() const { return header_; }

    // EN: Header name -> column index. Keys are lowercased when case_insensitive; on
    //     collisions the first column wins.
    // FR: Nom d'en-tête -> index de colonne. Clés en minuscules si case_insensitive ; en cas
    //     de collision la première colonne l'emporte.
    std::unordered_map<std::string, size_t> headerMap(bool case_insensitive) const;

    // EN: New record reading from `path` with `delimiter`/`header`, same origin.
    // FR: Nouvel enregistrement lisant depuis `path` avec `delimiter`/`header`, même origine.
    SourceFile rebased(std::filesystem::path path, char delimiter, std::vector<std::string> header) const;

    // EN: Value of the source column for this file.
    // FR: Valeur de la colonne source pour ce fichier.
    std::string sourceValue(SourceColumnMode mode) const;

private:
    std::filesystem::path origin_;
    std::filesystem::path path_;
    char delimiter_;
    std::vector<std::string> header_;
};

} // namespace CSV
} // namespace ConCat
