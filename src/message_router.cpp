#include "message_router.h"
#include "logger.h"

#define LOG_ROUTER_DEBUG(message) LOG_DEBUG("router", message)
#define LOG_ROUTER_ERROR(message) LOG_ERROR("router", message)

namespace remotefm {

void MessageRouter::on(const std::string& message_type, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[message_type] = std::move(handler);
    LOG_ROUTER_DEBUG("Registered handler for " << message_type);
}

bool MessageRouter::off(const std::string& message_type) {
    std::unique_lock<std::mutex> lock(handlers_mutex_);
    bool removed = handlers_.erase(message_type) > 0;

    // Calls already past the lookup still hold a copy of the handler
    calls_finished_.wait(lock, [this, &message_type] { return !has_foreign_call_locked(message_type); });
    return removed;
}

bool MessageRouter::has_handler(const std::string& message_type) const {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    return handlers_.find(message_type) != handlers_.end();
}

bool MessageRouter::has_foreign_call_locked(const std::string& message_type) const {
    const std::thread::id self = std::this_thread::get_id();
    for (const auto& call : active_calls_) {
        if (call.message_type == message_type && call.thread != self) {
            return true;
        }
    }
    return false;
}

bool MessageRouter::dispatch(const std::string& message_type, const nlohmann::json& payload) {
    MessageHandler handler;
    std::list<ActiveCall>::iterator call;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(message_type);
        if (it == handlers_.end()) {
            LOG_ROUTER_DEBUG("No handler for message type " << message_type);
            return false;
        }
        handler = it->second;
        call = active_calls_.insert(active_calls_.end(), ActiveCall{message_type, std::this_thread::get_id()});
    }

    // Retires the call on every exit path, including non-standard exceptions
    struct CallGuard {
        MessageRouter& router;
        std::list<ActiveCall>::iterator call;
        ~CallGuard() {
            {
                std::lock_guard<std::mutex> lock(router.handlers_mutex_);
                router.active_calls_.erase(call);
            }
            router.calls_finished_.notify_all();
        }
    } guard{*this, call};

    // Run outside the lock so handlers may register or unregister
    try {
        handler(payload);
    } catch (const std::exception& e) {
        LOG_ROUTER_ERROR("Error handling " << message_type << " message: " << e.what());
    }
    return true;
}

} // namespace remotefm
