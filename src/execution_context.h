#pragma once

#include "threadmanager.h"
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace remotefm {

using Task = std::function<void()>;

/**
 * Place where event handlers run, chosen by the host.
 * Implementations must run posted tasks one at a time, in posting order.
 */
class ExecutionContext {
public:
    virtual ~ExecutionContext() = default;
    virtual void post(Task task) = 0;
};

/**
 * Queues tasks until the host drains them with run_pending() on a thread
 * of its choosing (a UI loop, a test body).
 */
class ManualExecutionContext : public ExecutionContext {
public:
    void post(Task task) override;

    /**
     * Run every task queued so far, including tasks posted by those tasks
     * @return Number of tasks executed
     */
    size_t run_pending();

    size_t pending_count() const;

private:
    mutable std::mutex queue_mutex_;
    std::deque<Task> queue_;
    std::mutex run_mutex_;      // Keeps concurrent drains from interleaving
};

/**
 * Runs tasks on one dedicated background thread.
 * Tasks still queued at destruction are run before the thread exits.
 */
class SerialExecutionContext : public ExecutionContext, private ThreadManager {
public:
    SerialExecutionContext();
    ~SerialExecutionContext() override;

    void post(Task task) override;

    // Stop accepting tasks, run what is queued and join the thread
    void stop();

private:
    void run_loop();

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Task> queue_;
    bool stopping_;
};

} // namespace remotefm
