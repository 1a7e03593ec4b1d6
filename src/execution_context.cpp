#include "execution_context.h"

#define LOG_CONTEXT_DEBUG(message) LOG_DEBUG("context", message)
#define LOG_CONTEXT_WARN(message)  LOG_WARN("context", message)
#define LOG_CONTEXT_ERROR(message) LOG_ERROR("context", message)

namespace remotefm {

namespace {

void run_task(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        LOG_CONTEXT_ERROR("Event handler threw: " << e.what());
    }
}

} // anonymous namespace

//=============================================================================
// ManualExecutionContext Implementation
//=============================================================================

void ManualExecutionContext::post(Task task) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(std::move(task));
}

size_t ManualExecutionContext::run_pending() {
    std::lock_guard<std::mutex> run_lock(run_mutex_);

    size_t executed = 0;
    while (true) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty()) {
                break;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        run_task(task);
        ++executed;
    }
    return executed;
}

size_t ManualExecutionContext::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

//=============================================================================
// SerialExecutionContext Implementation
//=============================================================================

SerialExecutionContext::SerialExecutionContext() : stopping_(false) {
    add_managed_thread([this]() { run_loop(); }, "event context");
}

SerialExecutionContext::~SerialExecutionContext() {
    stop();
}

void SerialExecutionContext::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            LOG_CONTEXT_WARN("Dropping task posted to a stopped context");
            return;
        }
        queue_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
}

void SerialExecutionContext::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    shutdown_all_threads();
    join_all_active_threads();
}

void SerialExecutionContext::run_loop() {
    LOG_CONTEXT_DEBUG("Event context thread started");
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;  // stopping and drained
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        run_task(task);
    }
    LOG_CONTEXT_DEBUG("Event context thread stopped");
}

} // namespace remotefm
