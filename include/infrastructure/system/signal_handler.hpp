// EN: Signal Handler for ConCat - records SIGINT/SIGTERM so long loops can stop between chunks
// FR: Gestionnaire de signaux pour ConCat - enregistre SIGINT/SIGTERM pour arrêter les boucles entre chunks

#pragma once

#include <atomic>
#include <csignal>
#include <mutex>

namespace ConCat {

// EN: Process-wide signal handler. The C handler only stores into lock-free atomics;
//     everything else happens on the polling side.
// FR: Gestionnaire de signaux global au processus. Le handler C ne fait qu'écrire des
//     atomiques lock-free ; le reste se fait côté interrogation.
class SignalHandler {
public:
    // EN: Get the singleton instance
    // FR: Obtient l'instance singleton
    static SignalHandler& getInstance();

    // EN: Initialize signal handling (registers SIGINT, SIGTERM handlers)
    // FR: Initialise la gestion des signaux (enregistre les handlers SIGINT, SIGTERM)
    void initialize();

    // EN: Restore the default dispositions for SIGINT and SIGTERM
    // FR: Restaure les dispositions par défaut pour SIGINT et SIGTERM
    void restore();

    // EN: Manually trigger a shutdown request (useful for testing)
    // FR: Déclenche manuellement une demande d'arrêt (utile pour les tests)
    void triggerShutdown(int signal_number = SIGTERM);

    // EN: Check if shutdown has been requested
    // FR: Vérifie si un arrêt a été demandé
    bool isShutdownRequested() const;

    // EN: Signal number of the last request (0 if none)
    // FR: Numéro du dernier signal reçu (0 si aucun)
    int lastSignal() const;

    // EN: Number of signals recorded since the last reset
    // FR: Nombre de signaux enregistrés depuis la dernière remise à zéro
    int signalCount() const;

    // EN: Reset the signal handler (mainly for testing)
    // FR: Remet à zéro le gestionnaire de signaux (principalement pour les tests)
    void reset();

    bool isInitialized() const { return initialized_.load(); }

    ~SignalHandler();

private:
    SignalHandler() = default;

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;
    SignalHandler(SignalHandler&&) = delete;
    SignalHandler& operator=(SignalHandler&&) = delete;

    // EN: Static signal handler function (C-style callback)
    // FR: Fonction gestionnaire de signaux statique (callback style C)
    static void signalCallback(int signal_number);

    std::mutex mutex_;                              // EN: Serializes install/restore / FR: Sérialise installation/restauration
    std::atomic<bool> initialized_{false};

    // EN: Written from the signal context
    // FR: Écrits depuis le contexte du signal
    static volatile std::sig_atomic_t pending_signal_;
    static std::atomic<bool> shutdown_requested_;
    static std::atomic<int> pending_count_;
};

} // namespace ConCat
