#include "threadmanager.h"

// ThreadManager module logging macros
#define LOG_THREAD_DEBUG(message) LOG_DEBUG("thread", message)
#define LOG_THREAD_INFO(message)  LOG_INFO("thread", message)
#define LOG_THREAD_WARN(message)  LOG_WARN("thread", message)
#define LOG_THREAD_ERROR(message) LOG_ERROR("thread", message)

namespace remotefm {

ThreadManager::ThreadManager() : shutdown_requested_(false) {
    LOG_THREAD_DEBUG("ThreadManager initialized");
}

ThreadManager::~ThreadManager() {
    shutdown_all_threads();
    join_all_active_threads();
    LOG_THREAD_DEBUG("ThreadManager destroyed");
}

bool ThreadManager::add_managed_thread(std::function<void()> work, const std::string& name) {
    if (shutdown_requested_.load()) {
        LOG_THREAD_WARN("Refusing to start thread during shutdown: " << name);
        return false;
    }

    // Reap workers that are already done so the list stays short
    cleanup_finished_threads();

    std::lock_guard<std::mutex> lock(active_threads_mutex_);

    // Double-check after acquiring lock
    if (shutdown_requested_.load()) {
        LOG_THREAD_WARN("Refusing to start thread during shutdown (double-check): " << name);
        return false;
    }

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::thread t([work = std::move(work), finished, name]() {
        try {
            work();
        } catch (const std::exception& e) {
            LOG_THREAD_ERROR("Unhandled exception in thread " << name << ": " << e.what());
        }
        finished->store(true);
    });

    active_threads_.push_back(ManagedThread{name, std::move(t), finished});
    LOG_THREAD_DEBUG("Added managed thread: " << name << " (total: " << active_threads_.size() << ")");
    return true;
}

void ThreadManager::cleanup_finished_threads() {
    std::vector<ManagedThread> finished_threads;

    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        for (auto it = active_threads_.begin(); it != active_threads_.end();) {
            if (it->finished->load()) {
                finished_threads.push_back(std::move(*it));
                it = active_threads_.erase(it);
            } else {
                ++it;
            }
        }
    }

    // Join outside the lock; these threads have already returned
    for (auto& managed : finished_threads) {
        if (managed.thread.joinable()) {
            managed.thread.join();
        }
    }
}

void ThreadManager::shutdown_all_threads() {
    if (shutdown_requested_.exchange(true)) {
        return;
    }
    LOG_THREAD_INFO("Initiating shutdown of all background threads");

    // Notify all waiting threads to wake up immediately
    notify_shutdown();
}

void ThreadManager::join_all_active_threads() {
    std::vector<ManagedThread> threads_to_join;

    // Move threads out of the container while holding the lock
    {
        std::lock_guard<std::mutex> lock(active_threads_mutex_);
        if (active_threads_.empty()) {
            return;
        }

        LOG_THREAD_INFO("Waiting for " << active_threads_.size() << " managed threads to finish");
        threads_to_join = std::move(active_threads_);
        active_threads_.clear();
    }

    // Join threads without holding the mutex
    for (auto& managed : threads_to_join) {
        if (managed.thread.joinable()) {
            if (managed.thread.get_id() == std::this_thread::get_id()) {
                LOG_THREAD_ERROR("Thread " << managed.name << " cannot join itself, detaching");
                managed.thread.detach();
                continue;
            }
            managed.thread.join();
        }
    }

    LOG_THREAD_INFO("All managed threads have been cleaned up");
}

size_t ThreadManager::get_active_thread_count() const {
    std::lock_guard<std::mutex> lock(active_threads_mutex_);
    return active_threads_.size();
}

void ThreadManager::notify_shutdown() {
    {
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
    }
    shutdown_cv_.notify_all();
}

} // namespace remotefm
