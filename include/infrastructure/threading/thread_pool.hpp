// EN: Fixed-size worker pool with future-based task submission
// FR: Pool de workers de taille fixe avec soumission de tâches basée sur les futures

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace ConCat {

// EN: Thread pool statistics for monitoring.
// FR: Statistiques du pool de threads pour le monitoring.
struct ThreadPoolStats {
    size_t total_threads = 0;
    size_t active_threads = 0;
    size_t idle_threads = 0;
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    size_t peak_queue_size = 0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::milliseconds total_runtime{0};
};

// EN: Configuration for thread pool behavior and limits.
// FR: Configuration pour le comportement et les limites du pool de threads.
struct ThreadPoolConfig {
    // EN: Number of worker threads, fixed for the pool lifetime.
    // FR: Nombre de threads workers, fixe pour la durée de vie du pool.
    size_t thread_count = 4;

    // EN: Maximum number of queued tasks (0 = unbounded).
    // FR: Nombre maximum de tâches en queue (0 = illimité).
    size_t max_queue_size = 0;

    // EN: Prefix used in log messages for this pool.
    // FR: Préfixe utilisé dans les messages de log pour ce pool.
    std::string name = "threadpool";
};

namespace detail {
    // EN: Internal task wrapper with metadata.
    // FR: Wrapper interne de tâche avec métadonnées.
    struct Task {
        std::function<void()> function;
        std::string name;
        std::chrono::system_clock::time_point created_at;

        Task(std::function<void()> f, std::string n)
            : function(std::move(f)), name(std::move(n)), created_at(std::chrono::system_clock::now()) {}
    };
}

// EN: Bounded worker pool. Each submitted callable runs on one worker; its result or
//     exception is delivered through the returned future.
// FR: Pool de workers borné. Chaque callable soumis s'exécute sur un worker ; son résultat
//     ou son exception est livré via le future retourné.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config = ThreadPoolConfig{});

    // EN: Destructor - waits for all tasks to complete and stops all threads.
    // FR: Destructeur - attend que toutes les tâches se terminent et arrête tous les threads.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Submit a named task for better debugging.
    // FR: Soumet une tâche nommée pour un meilleur débogage.
    template<typename F, typename... Args>
    auto submitNamed(const std::string& name, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Barrier: wait until the queue is drained and no worker is busy.
    // FR: Barrière : attend que la queue soit vide et qu'aucun worker ne soit occupé.
    void waitForAll();

    // EN: Shutdown the thread pool gracefully (pending tasks still run).
    // FR: Arrête le pool de threads de manière gracieuse (les tâches en attente s'exécutent).
    void shutdown();

    ThreadPoolStats getStats() const;

    const ThreadPoolConfig& getConfig() const { return config_; }

private:
    void workerLoop();

    void enqueue(std::function<void()> function, const std::string& name);

    ThreadPoolConfig config_;

    std::vector<std::thread> workers_;
    mutable std::mutex threads_mutex_;

    std::queue<detail::Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> completed_tasks_{0};
    std::atomic<size_t> failed_tasks_{0};
    std::atomic<size_t> peak_queue_size_{0};

    std::chrono::system_clock::time_point start_time_;
};

// EN: Template method implementations.
// FR: Implémentations des méthodes templates.
template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submitNamed("", std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submitNamed(const std::string& name, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto bound = std::bind(std::forward<F>(f), std::forward<Args>(args)...);

    // EN: Failures are counted here, then rethrown into the future.
    // FR: Les échecs sont comptés ici, puis relancés dans le future.
    auto task = std::make_shared<std::packaged_task<return_type()>>(
        [this, bound]() mutable -> return_type {
            try {
                return bound();
            } catch (...) {
                failed_tasks_++;
                throw;
            }
        }
    );

    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); }, name);
    return result;
}

} // namespace ConCat
