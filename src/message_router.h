#pragma once

#include <nlohmann/json.hpp>
#include <condition_variable>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace remotefm {

using MessageHandler = std::function<void(const nlohmann::json& payload)>;

/**
 * Inbound half of the peer channel: routes each received message to the
 * handler registered for its type. Processors register on construction and
 * unregister on teardown.
 */
class MessageRouter {
public:
    MessageRouter() = default;

    MessageRouter(const MessageRouter&) = delete;
    MessageRouter& operator=(const MessageRouter&) = delete;

    /**
     * Register a handler, replacing any previous one for the type
     */
    void on(const std::string& message_type, MessageHandler handler);

    /**
     * Remove the handler for a type and wait until calls to it that are
     * running on other threads have returned. Once off() returns, the
     * handler's owner may be destroyed. A handler may remove itself.
     * @return true if a handler was registered
     */
    bool off(const std::string& message_type);

    bool has_handler(const std::string& message_type) const;

    /**
     * Deliver a message on the calling thread.
     * Exceptions thrown by the handler are logged and swallowed so a
     * malformed payload cannot take down the receive loop.
     * @return true if a handler accepted the message type
     */
    bool dispatch(const std::string& message_type, const nlohmann::json& payload);

private:
    struct ActiveCall {
        std::string message_type;
        std::thread::id thread;
    };

    bool has_foreign_call_locked(const std::string& message_type) const;

    mutable std::mutex handlers_mutex_;
    std::condition_variable calls_finished_;
    std::unordered_map<std::string, MessageHandler> handlers_;
    std::list<ActiveCall> active_calls_;
};

} // namespace remotefm
