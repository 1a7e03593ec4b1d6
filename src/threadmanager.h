#pragma once

#include "logger.h"
#include <thread>
#include <vector>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <string>

namespace remotefm {

/**
 * ThreadManager provides thread management capabilities for classes that need
 * to run short-lived background workers with graceful shutdown coordination.
 */
class ThreadManager {
public:
    ThreadManager();
    virtual ~ThreadManager();

    /**
     * Start a managed thread running the given function
     * @param work Function executed on the new thread
     * @param name Descriptive name for logging purposes
     * @return false if shutdown was already requested and nothing was started
     */
    bool add_managed_thread(std::function<void()> work, const std::string& name);

    /**
     * Join threads that have finished execution
     */
    void cleanup_finished_threads();

    /**
     * Signal all threads to shutdown and notify waiting threads
     */
    void shutdown_all_threads();

    /**
     * Join all active threads and wait for them to finish
     */
    void join_all_active_threads();

    /**
     * Get the current number of threads not yet joined
     */
    size_t get_active_thread_count() const;

    bool is_shutdown_requested() const { return shutdown_requested_.load(); }

protected:
    /**
     * Condition variable for coordinating thread shutdown
     * Threads should wait on this and check is_shutdown_requested()
     */
    std::condition_variable shutdown_cv_;

    /**
     * Mutex for the shutdown condition variable
     */
    std::mutex shutdown_mutex_;

    void notify_shutdown();

private:
    struct ManagedThread {
        std::string name;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    std::vector<ManagedThread> active_threads_;
    mutable std::mutex active_threads_mutex_;
    std::atomic<bool> shutdown_requested_;

    // Prevent copying
    ThreadManager(const ThreadManager&) = delete;
    ThreadManager& operator=(const ThreadManager&) = delete;
};

} // namespace remotefm
