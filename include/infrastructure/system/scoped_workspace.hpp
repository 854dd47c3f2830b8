// EN: Scratch directory owned by a scope - created on demand, removed on every exit path
// FR: Répertoire de travail possédé par une portée - créé à la demande, supprimé sur toute sortie

#pragma once

#include <filesystem>
#include <string>

namespace ConCat {

// EN: RAII scratch workspace. The directory is created lazily on first path() call under
//     the given parent (system temp dir by default) and recursively deleted in the destructor.
// FR: Espace de travail RAII. Le répertoire est créé paresseusement au premier appel de path()
//     sous le parent donné (répertoire temporaire système par défaut) et supprimé récursivement
//     dans le destructeur.
class ScopedWorkspace {
public:
    explicit ScopedWorkspace(std::string prefix = "concat_norm_",
                             std::filesystem::path parent = {});
    ~ScopedWorkspace();

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

    // EN: Directory path, creating it on first use. Throws std::runtime_error if creation fails.
    // FR: Chemin du répertoire, créé au premier usage. Lance std::runtime_error si la création échoue.
    const std::filesystem::path& path();

    bool isCreated() const { return !path_.empty(); }

    // EN: Remove the directory now. Safe to call more than once.
    // FR: Supprime le répertoire maintenant. Peut être appelé plusieurs fois.
    void cleanup() noexcept;

private:
    std::string prefix_;
    std::filesystem::path parent_;
    std::filesystem::path path_;
};

} // namespace ConCat
