// EN: Delimiter detection by field-count mode scoring over a bounded line sample
// FR: Détection du délimiteur par score du mode du nombre de champs sur un échantillon borné

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ConCat {
namespace CSV {

// EN: Score of one candidate: (frequency of the modal field count, modal field count).
//     Compared lexicographically.
// FR: Score d'un candidat : (fréquence du nombre de champs modal, nombre de champs modal).
//     Comparé lexicographiquement.
struct DelimiterScore {
    long mode_count{-1};
    long mode_value{-1};

    bool operator>(const DelimiterScore& other) const {
        return std::make_pair(mode_count, mode_value) > std::make_pair(other.mode_count, other.mode_value);
    }
    bool operator==(const DelimiterScore& other) const {
        return mode_count == other.mode_count && mode_value == other.mode_value;
    }
};

struct SniffResult {
    char delimiter{','};
    DelimiterScore score;
    bool used_fallback{false};
    size_t sampled_lines{0};    // EN: Non-empty lines that took part in scoring / FR: Lignes non vides ayant participé au score
};

// EN: Best-effort delimiter detection. Candidates are the supported delimiters in their fixed order;
//     a later candidate replaces the current best only with a strictly greater score.
// FR: Détection best-effort du délimiteur. Les candidats sont les délimiteurs supportés dans leur
//     ordre fixe ; un candidat suivant ne remplace le meilleur qu'avec un score strictement supérieur.
class DelimiterSniffer {
public:
    explicit DelimiterSniffer(size_t sample_rows = 50);

    size_t sampleRows() const { return sample_rows_; }

    SniffResult sniffFile(const std::filesystem::path& path) const;
    SniffResult sniffLines(const std::vector<std::string>& lines) const;

    // EN: Field-count distribution mode of `lines` split on `delimiter`; std::nullopt when
    //     no line is non-empty after trimming.
    // FR: Mode de la distribution du nombre de champs ; std::nullopt si aucune ligne n'est
    //     non vide après nettoyage.
    static std::optional<DelimiterScore> scoreCandidate(const std::vector<std::string>& lines, char delimiter);

    // EN: Up to n raw lines (line terminators removed). Throws IoError when unreadable.
    // FR: Jusqu'à n lignes brutes (fins de ligne retirées). Lance IoError si illisible.
    static std::vector<std::string> readHeadLines(const std::filesystem::path& path, size_t n);

private:
    size_t sample_rows_;

    char fallbackDelimiter(const std::vector<std::string>& lines) const;
};

} // namespace CSV
} // namespace ConCat
