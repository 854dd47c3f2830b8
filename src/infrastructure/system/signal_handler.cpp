// EN: Implementation of the SignalHandler class.
// FR: Implémentation de la classe SignalHandler.

#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"
#include <signal.h>
#include <stdexcept>
#include <string>

namespace ConCat {

volatile std::sig_atomic_t SignalHandler::pending_signal_ = 0;
std::atomic<bool> SignalHandler::shutdown_requested_{false};
std::atomic<int> SignalHandler::pending_count_{0};

SignalHandler& SignalHandler::getInstance() {
    static SignalHandler instance;
    return instance;
}

// EN: Destructor - restores default dispositions if we installed ours.
// FR: Destructeur - restaure les dispositions par défaut si les nôtres sont installées.
SignalHandler::~SignalHandler() {
    if (initialized_.load()) {
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
    }
}

// EN: Initialize signal handling by registering SIGINT and SIGTERM handlers.
// FR: Initialise la gestion des signaux en enregistrant les handlers SIGINT et SIGTERM.
void SignalHandler::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_.load()) {
        LOG_DEBUG("signal_handler", "SignalHandler already initialized");
        return;
    }

    struct sigaction action {};
    action.sa_handler = &SignalHandler::signalCallback;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    if (sigaction(SIGINT, &action, nullptr) != 0) {
        LOG_ERROR("signal_handler", "Failed to register SIGINT handler");
        throw std::runtime_error("Failed to register SIGINT handler");
    }

    if (sigaction(SIGTERM, &action, nullptr) != 0) {
        LOG_ERROR("signal_handler", "Failed to register SIGTERM handler");
        // EN: Restore SIGINT handler before throwing
        // FR: Restaure le handler SIGINT avant de lancer l'exception
        signal(SIGINT, SIG_DFL);
        throw std::runtime_error("Failed to register SIGTERM handler");
    }

    initialized_ = true;
    LOG_DEBUG("signal_handler", "SIGINT and SIGTERM handlers registered");
}

void SignalHandler::restore() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_.exchange(false)) {
        return;
    }
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
}

// EN: Async-signal-safe: only lock-free stores.
// FR: Async-signal-safe : uniquement des écritures lock-free.
void SignalHandler::signalCallback(int signal_number) {
    pending_signal_ = signal_number;
    pending_count_.fetch_add(1, std::memory_order_relaxed);
    shutdown_requested_.store(true);
}

void SignalHandler::triggerShutdown(int signal_number) {
    LOG_INFO("signal_handler", "Manual shutdown triggered with signal: " + std::to_string(signal_number));
    signalCallback(signal_number);
}

bool SignalHandler::isShutdownRequested() const {
    return shutdown_requested_.load();
}

int SignalHandler::lastSignal() const {
    return static_cast<int>(pending_signal_);
}

int SignalHandler::signalCount() const {
    return pending_count_.load();
}

void SignalHandler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_requested_.store(false);
    pending_signal_ = 0;
    pending_count_.store(0);
}

} // namespace ConCat
