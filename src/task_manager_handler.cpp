#include "task_manager_handler.h"
#include "logger.h"

#define LOG_TASK_DEBUG(message) LOG_DEBUG("taskmanager", message)
#define LOG_TASK_INFO(message)  LOG_INFO("taskmanager", message)
#define LOG_TASK_WARN(message)  LOG_WARN("taskmanager", message)

namespace remotefm {

TaskManagerHandler::TaskManagerHandler(PeerConnection& peer) : peer_(peer) {
}

void TaskManagerHandler::register_handlers(MessageRouter& router) {
    router.on(message_types::DO_PROCESS_RESPONSE, [this](const nlohmann::json& payload) {
        handle_process_response(payload);
    });
}

void TaskManagerHandler::unregister_handlers(MessageRouter& router) {
    router.off(message_types::DO_PROCESS_RESPONSE);
}

void TaskManagerHandler::set_process_action_callback(ProcessActionCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    process_action_callback_ = std::move(callback);
}

bool TaskManagerHandler::start_process(const std::string& remote_path) {
    if (remote_path.empty()) {
        LOG_TASK_WARN("Refusing to start a process without a path");
        return false;
    }

    DoProcessStart message;
    message.file_path = remote_path;
    if (!send_message(peer_, message)) {
        LOG_TASK_WARN("Failed to send process start for " << remote_path);
        return false;
    }

    LOG_TASK_INFO("Requested remote process start: " << remote_path);
    return true;
}

void TaskManagerHandler::handle_process_response(const nlohmann::json& payload) {
    DoProcessResponse response = payload.get<DoProcessResponse>();
    LOG_TASK_DEBUG("Process " << process_action_to_string(response.action)
                   << (response.result ? " succeeded" : " failed"));

    ProcessActionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = process_action_callback_;
    }
    if (callback) {
        callback(response.action, response.result);
    }
}

} // namespace remotefm
