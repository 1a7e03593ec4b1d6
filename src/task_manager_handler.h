#pragma once

#include "message_router.h"
#include "messages.h"
#include "peer_connection.h"
#include <functional>
#include <mutex>
#include <string>

namespace remotefm {

using ProcessActionCallback = std::function<void(ProcessAction action, bool result)>;

/**
 * Remote process management as far as the file manager needs it:
 * starting a process from a remote path and hearing back whether it ran.
 */
class TaskManagerHandler {
public:
    explicit TaskManagerHandler(PeerConnection& peer);

    TaskManagerHandler(const TaskManagerHandler&) = delete;
    TaskManagerHandler& operator=(const TaskManagerHandler&) = delete;

    void register_handlers(MessageRouter& router);
    void unregister_handlers(MessageRouter& router);

    void set_process_action_callback(ProcessActionCallback callback);

    /**
     * Ask the peer to start a process
     * @return false if the path is empty or the message could not be sent
     */
    bool start_process(const std::string& remote_path);

private:
    void handle_process_response(const nlohmann::json& payload);

    PeerConnection& peer_;
    std::mutex callback_mutex_;
    ProcessActionCallback process_action_callback_;
};

} // namespace remotefm
