// EN: Implementation of the ThreadPool class. Fixed worker count, FIFO queue, join barrier.
// FR: Implémentation de la classe ThreadPool. Nombre de workers fixe, queue FIFO, barrière de jointure.

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

namespace ConCat {

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : config_(config), start_time_(std::chrono::system_clock::now()) {

    // EN: Validate configuration.
    // FR: Valide la configuration.
    if (config_.thread_count == 0) {
        throw std::invalid_argument("thread_count must be at least 1");
    }

    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        workers_.reserve(config_.thread_count);
        for (size_t i = 0; i < config_.thread_count; ++i) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    LOG_DEBUG(config_.name, "Thread pool started with " + std::to_string(config_.thread_count) + " threads");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue(std::function<void()> function, const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        if (shutdown_requested_) {
            throw std::runtime_error("ThreadPool is shutting down, cannot accept new tasks");
        }

        if (config_.max_queue_size > 0 && task_queue_.size() >= config_.max_queue_size) {
            throw std::runtime_error("Task queue is full, cannot accept new tasks");
        }

        task_queue_.emplace(std::move(function), name);

        // EN: Update peak queue size.
        // FR: Met à jour la taille maximale de la queue.
        size_t current_size = task_queue_.size();
        size_t current_peak = peak_queue_size_.load();
        while (current_size > current_peak &&
               !peak_queue_size_.compare_exchange_weak(current_peak, current_size)) {
        }
    }

    queue_condition_.notify_one();
}

// EN: Wait for all currently queued tasks to complete.
// FR: Attend que toutes les tâches actuellement en queue se terminent.
void ThreadPool::waitForAll() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] {
        return task_queue_.empty() && active_threads_.load() == 0;
    });
}

void ThreadPool::shutdown() {
    if (shutdown_requested_.exchange(true)) {
        return; // EN: Already shutting down. FR: Déjà en cours d'arrêt.
    }

    queue_condition_.notify_all();

    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    LOG_DEBUG(config_.name, "Thread pool shutdown completed - Processed " +
              std::to_string(completed_tasks_.load()) + " tasks, " +
              std::to_string(failed_tasks_.load()) + " failed");
}

ThreadPoolStats ThreadPool::getStats() const {
    ThreadPoolStats current_stats;
    current_stats.created_at = start_time_;
    {
        std::lock_guard<std::mutex> lock(threads_mutex_);
        current_stats.total_threads = workers_.size();
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        current_stats.queued_tasks = task_queue_.size();
    }
    current_stats.active_threads = active_threads_.load();
    current_stats.idle_threads = current_stats.total_threads > current_stats.active_threads
        ? current_stats.total_threads - current_stats.active_threads : 0;
    current_stats.completed_tasks = completed_tasks_.load();
    current_stats.failed_tasks = failed_tasks_.load();
    current_stats.peak_queue_size = peak_queue_size_.load();

    auto now = std::chrono::system_clock::now();
    current_stats.total_runtime = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_);
    return current_stats;
}

// EN: Worker thread function. Drains the queue before honouring shutdown.
// FR: Fonction du thread worker. Vide la queue avant d'honorer l'arrêt.
void ThreadPool::workerLoop() {
    while (true) {
        std::function<void()> function;
        std::string name;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] {
                return !task_queue_.empty() || shutdown_requested_.load();
            });

            if (task_queue_.empty()) {
                break;
            }

            function = std::move(task_queue_.front().function);
            name = std::move(task_queue_.front().name);
            task_queue_.pop();
            active_threads_++;
        }

        if (!name.empty()) {
            LOG_DEBUG(config_.name, "Running task: " + name);
        }

        // EN: Tasks are packaged; exceptions land in their futures.
        // FR: Les tâches sont empaquetées ; les exceptions arrivent dans leurs futures.
        function();
        completed_tasks_++;

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_threads_--;
        }
        idle_condition_.notify_all();
    }
}

} // namespace ConCat
