#include "file_manager.h"
#include "fs.h"
#include "remotefm_log_macros.h"
#include <utility>

namespace remotefm {

FileManager::FileManager(PeerConnection& peer, MessageRouter& router, ExecutionContext& context,
                         const FileManagerConfig& config)
    : peer_(peer), router_(router), config_(config),
      base_download_path_(config.get_base_download_path()),
      notifier_(context),
      upload_limiter_(config.max_concurrent_uploads),
      task_manager_(std::make_unique<TaskManagerHandler>(peer)),
      running_(true) {

    task_manager_->set_process_action_callback([this](ProcessAction action, bool result) {
        on_process_action(action, result);
    });
    task_manager_->register_handlers(router_);
    register_handlers();

    LOG_FM_INFO("FileManager initialized (downloads: " << base_download_path_
                << ", upload slots: " << upload_limiter_.get_capacity() << ")");
}

FileManager::~FileManager() {
    shutdown();
}

void FileManager::register_handlers() {
    router_.on(message_types::FILE_TRANSFER_CHUNK, [this](const nlohmann::json& payload) {
        handle_chunk(payload);
    });
    router_.on(message_types::FILE_TRANSFER_CANCEL, [this](const nlohmann::json& payload) {
        handle_cancel(payload);
    });
    router_.on(message_types::FILE_TRANSFER_COMPLETE, [this](const nlohmann::json& payload) {
        handle_complete(payload);
    });
    router_.on(message_types::GET_DRIVES_RESPONSE, [this](const nlohmann::json& payload) {
        handle_drives_response(payload);
    });
    router_.on(message_types::GET_DIRECTORY_RESPONSE, [this](const nlohmann::json& payload) {
        handle_directory_response(payload);
    });
    router_.on(message_types::SET_STATUS_FILE_MANAGER, [this](const nlohmann::json& payload) {
        handle_status(payload);
    });
}

void FileManager::unregister_handlers() {
    router_.off(message_types::FILE_TRANSFER_CHUNK);
    router_.off(message_types::FILE_TRANSFER_CANCEL);
    router_.off(message_types::FILE_TRANSFER_COMPLETE);
    router_.off(message_types::GET_DRIVES_RESPONSE);
    router_.off(message_types::GET_DIRECTORY_RESPONSE);
    router_.off(message_types::SET_STATUS_FILE_MANAGER);
}

void FileManager::set_drives_changed_callback(DrivesChangedCallback callback) {
    notifier_.set_drives_changed_callback(std::move(callback));
}

void FileManager::set_directory_changed_callback(DirectoryChangedCallback callback) {
    notifier_.set_directory_changed_callback(std::move(callback));
}

void FileManager::set_transfer_updated_callback(TransferUpdatedCallback callback) {
    notifier_.set_transfer_updated_callback(std::move(callback));
}

void FileManager::set_report_callback(ReportCallback callback) {
    notifier_.set_report_callback(std::move(callback));
}

//=============================================================================
// Transfer initiation
//=============================================================================

int FileManager::begin_download(const std::string& remote_path, const std::string& local_file_name,
                                bool overwrite) {
    if (remote_path.empty()) {
        return 0;
    }

    if (!running_.load()) {
        LOG_FM_WARN("Ignoring download of " << remote_path << " during shutdown");
        return 0;
    }

    if (!directory_exists(base_download_path_) && !create_directories(base_download_path_)) {
        // Opening the target below fails and reports the error
        LOG_FM_ERROR("Failed to create download directory " << base_download_path_);
    }

    std::string file_name = local_file_name.empty() ? get_filename_from_path(remote_path) : local_file_name;
    std::string local_path = combine_paths(base_download_path_, file_name);
    if (!overwrite) {
        local_path = make_unique_local_path(local_path);
    }

    auto transfer = std::make_shared<FileTransfer>();
    transfer->type = TransferType::DOWNLOAD;
    transfer->local_path = local_path;
    transfer->remote_path = remote_path;
    transfer->status = STATUS_PENDING;

    auto split = std::make_shared<FileSplit>(local_path, FileAccess::WRITE, config_.chunk_size);
    if (!split->open()) {
        // Never registered, so the id only labels the error event
        transfer->id = registry_.generate_unique_id();
        transfer->status = STATUS_ERROR_WRITING;
        transfer->state = TransferState::ERRORED;
        notifier_.notify_transfer_updated(*transfer);
        LOG_FM_ERROR("Cannot write " << local_path << ", download of " << remote_path << " aborted");
        return 0;
    }
    transfer->file_split = split;

    int id = registry_.register_with_unique_id(transfer);
    notifier_.notify_transfer_updated(*transfer);

    FileTransferRequest request;
    request.id = id;
    request.remote_path = remote_path;
    if (!send_message(peer_, request)) {
        LOG_FM_WARN("Failed to send transfer request " << id << " for " << remote_path);
    }

    LOG_FM_INFO("Requested download " << id << ": " << remote_path << " -> " << local_path);
    return id;
}

bool FileManager::begin_upload(const std::string& local_path, const std::string& remote_path) {
    if (!running_.load()) {
        LOG_FM_WARN("Ignoring upload of " << local_path << " during shutdown");
        return false;
    }

    return add_managed_thread([this, local_path, remote_path]() {
        run_upload(local_path, remote_path);
    }, "upload " + local_path);
}

std::string FileManager::make_unique_local_path(const std::string& local_path) const {
    if (!file_exists(local_path)) {
        return local_path;
    }

    std::string directory = get_parent_directory(local_path);
    std::string stem = get_filename_without_extension(local_path);
    std::string extension = get_file_extension(local_path);

    std::string candidate;
    int i = 1;
    do {
        candidate = combine_paths(directory, stem + "(" + std::to_string(i) + ")" + extension);
        ++i;
    } while (file_exists(candidate));

    return candidate;
}

//=============================================================================
// Upload worker
//=============================================================================

void FileManager::run_upload(const std::string& local_path, const std::string& remote_path) {
    auto transfer = std::make_shared<FileTransfer>();
    transfer->type = TransferType::UPLOAD;
    transfer->local_path = local_path;
    transfer->remote_path = remote_path;
    transfer->status = STATUS_PENDING;

    auto split = std::make_shared<FileSplit>(local_path, FileAccess::READ, config_.chunk_size);
    if (!split->open()) {
        transfer->id = registry_.generate_unique_id();
        transfer->status = STATUS_ERROR_READING;
        transfer->state = TransferState::ERRORED;
        notifier_.notify_transfer_updated(*transfer);
        LOG_FM_ERROR("Cannot read " << local_path << ", upload aborted");
        return;
    }

    transfer->file_split = split;
    transfer->size = split->get_file_size();

    const int id = registry_.register_with_unique_id(transfer);
    notifier_.notify_transfer_updated(*transfer);
    LOG_FM_INFO("Upload " << id << " queued: " << local_path << " (" << transfer->size << " bytes)");

    if (!upload_limiter_.try_acquire()) {
        LOG_FM_INFO("Upload " << id << " waiting for one of " << upload_limiter_.get_capacity() << " upload slots");
        if (!upload_limiter_.acquire()) {
            LOG_FM_DEBUG("Upload " << id << " abandoned while waiting for a slot");
            return;
        }
    }
    AdmissionSlot slot(upload_limiter_);

    FileChunk chunk;
    while (true) {
        ChunkReadResult result = split->next_chunk(chunk);
        if (result == ChunkReadResult::END_OF_FILE) {
            break;
        }
        if (result == ChunkReadResult::READ_ERROR) {
            handle_upload_failure(transfer);
            return;
        }

        FileTransfer snapshot = update_transfer(*transfer, [&chunk](FileTransfer& t) {
            t.transferred_size += chunk.data.size();
            t.state = TransferState::IN_PROGRESS;
            t.status = make_progress_status(TransferType::UPLOAD, t.get_progress_percentage());
        });
        notifier_.notify_transfer_updated(snapshot);

        if (!registry_.contains(id)) {
            snapshot = update_transfer(*transfer, [](FileTransfer& t) {
                t.status = STATUS_CANCELED;
                t.state = TransferState::CANCELED;
            });
            notifier_.notify_transfer_updated(snapshot);
            LOG_FM_INFO("Upload " << id << " canceled");
            return;
        }

        FileTransferChunkMessage message;
        message.id = id;
        message.chunk = std::move(chunk);
        message.file_path = remote_path;
        message.file_size = snapshot.size;

        bool sent = false;
        try {
            sent = send_message_blocking(peer_, message);
        } catch (const std::exception& e) {
            LOG_FM_ERROR("Sending chunk of upload " << id << " failed: " << e.what());
        }
        if (!sent) {
            handle_upload_failure(transfer);
            return;
        }
    }

    LOG_FM_INFO("Upload " << id << " sent all chunks, waiting for completion");
}

void FileManager::handle_upload_failure(const std::shared_ptr<FileTransfer>& transfer) {
    // Already removed means a cancel raced with the failure and was reported
    if (!registry_.contains(transfer->id)) {
        return;
    }

    FileTransfer snapshot = update_transfer(*transfer, [](FileTransfer& t) {
        t.status = STATUS_ERROR_READING;
        t.state = TransferState::ERRORED;
    });
    notifier_.notify_transfer_updated(snapshot);
    LOG_FM_ERROR("Upload " << snapshot.id << " failed, canceling");
    cancel_transfer(snapshot.id);
}

//=============================================================================
// Commands
//=============================================================================

void FileManager::cancel_transfer(int transfer_id) {
    FileTransferCancel message;
    message.id = transfer_id;
    if (!send_message(peer_, message)) {
        LOG_FM_WARN("Failed to send cancel for transfer " << transfer_id);
    }
}

void FileManager::rename_path(const std::string& remote_path, const std::string& new_path, FileType type) {
    DoPathRename message;
    message.path = remote_path;
    message.new_path = new_path;
    message.path_type = type;
    if (!send_message(peer_, message)) {
        LOG_FM_WARN("Failed to send rename of " << remote_path);
    }
}

void FileManager::delete_path(const std::string& remote_path, FileType type) {
    DoPathDelete message;
    message.path = remote_path;
    message.path_type = type;
    if (!send_message(peer_, message)) {
        LOG_FM_WARN("Failed to send delete of " << remote_path);
    }
}

void FileManager::get_directory_contents(const std::string& remote_path) {
    GetDirectory message;
    message.remote_path = remote_path;
    if (!send_message(peer_, message)) {
        LOG_FM_WARN("Failed to request directory " << remote_path);
    }
}

void FileManager::refresh_drives() {
    if (!send_message(peer_, GetDrives())) {
        LOG_FM_WARN("Failed to request drives");
    }
}

void FileManager::start_process(const std::string& remote_path) {
    task_manager_->start_process(remote_path);
}

std::vector<int> FileManager::active_transfer_ids() const {
    return registry_.active_ids();
}

size_t FileManager::active_transfer_count() const {
    return registry_.size();
}

//=============================================================================
// Inbound messages
//=============================================================================

void FileManager::handle_chunk(const nlohmann::json& payload) {
    FileTransferChunkMessage message = payload.get<FileTransferChunkMessage>();

    auto transfer = registry_.find(message.id);
    if (!transfer) {
        LOG_FM_DEBUG("Ignoring chunk for unknown transfer " << message.id);
        return;
    }

    // A failed download stays registered until the peer confirms the cancel;
    // chunks still in flight for it are dropped
    bool accepted = false;
    FileTransfer current = update_transfer(*transfer, [&message, &accepted](FileTransfer& t) {
        if (is_terminal_state(t.state)) {
            return;
        }
        accepted = true;
        t.size = message.file_size;
        t.transferred_size += message.chunk.data.size();
        t.state = TransferState::IN_PROGRESS;
    });
    if (!accepted) {
        LOG_FM_DEBUG("Dropping chunk for " << transfer_state_to_string(current.state)
                     << " transfer " << message.id);
        return;
    }

    if (!transfer->file_split || !transfer->file_split->write_chunk(message.chunk)) {
        FileTransfer snapshot = update_transfer(*transfer, [](FileTransfer& t) {
            t.status = STATUS_ERROR_WRITING;
            t.state = TransferState::ERRORED;
        });
        notifier_.notify_transfer_updated(snapshot);
        LOG_FM_ERROR("Writing chunk of download " << message.id << " failed, canceling");
        // Removal follows when the peer confirms the cancel
        cancel_transfer(message.id);
        return;
    }

    FileTransfer snapshot = update_transfer(*transfer, [](FileTransfer& t) {
        t.status = make_progress_status(TransferType::DOWNLOAD, t.get_progress_percentage());
    });
    notifier_.notify_transfer_updated(snapshot);
}

void FileManager::handle_cancel(const nlohmann::json& payload) {
    FileTransferCancel message = payload.get<FileTransferCancel>();

    auto transfer = registry_.find(message.id);
    if (!transfer) {
        LOG_FM_DEBUG("Ignoring cancel for unknown transfer " << message.id);
        return;
    }

    FileTransfer snapshot = update_transfer(*transfer, [&message](FileTransfer& t) {
        t.status = message.reason;
        t.state = TransferState::CANCELED;
    });
    notifier_.notify_transfer_updated(snapshot);

    // Only the caller that actually removed the entry cleans up the file
    if (registry_.remove(message.id) && snapshot.type == TransferType::DOWNLOAD) {
        if (file_exists(snapshot.local_path) && !delete_file(snapshot.local_path)) {
            LOG_FM_WARN("Could not delete partial download " << snapshot.local_path);
        }
    }

    LOG_FM_INFO("Transfer " << message.id << " " << transfer_state_to_string(snapshot.state)
                << " by peer: " << message.reason);
}

void FileManager::handle_complete(const nlohmann::json& payload) {
    FileTransferComplete message = payload.get<FileTransferComplete>();

    auto transfer = registry_.find(message.id);
    if (!transfer) {
        LOG_FM_DEBUG("Ignoring completion for unknown transfer " << message.id);
        return;
    }

    // The peer may have generated a temporary name for an upload
    FileTransfer snapshot = update_transfer(*transfer, [&message](FileTransfer& t) {
        t.remote_path = message.file_path;
        t.status = STATUS_COMPLETED;
        t.state = TransferState::COMPLETED;
    });
    registry_.remove(message.id);
    notifier_.notify_transfer_updated(snapshot);

    LOG_FM_INFO(transfer_type_to_string(snapshot.type) << " " << message.id << " completed: "
                << snapshot.local_path << " <-> " << snapshot.remote_path);
}

void FileManager::handle_drives_response(const nlohmann::json& payload) {
    GetDrivesResponse message = payload.get<GetDrivesResponse>();
    if (message.drives.empty()) {
        return;
    }
    notifier_.notify_drives_changed(std::move(message.drives));
}

void FileManager::handle_directory_response(const nlohmann::json& payload) {
    GetDirectoryResponse message = payload.get<GetDirectoryResponse>();
    notifier_.notify_directory_changed(message.remote_path, std::move(message.items));
}

void FileManager::handle_status(const nlohmann::json& payload) {
    SetStatusFileManager message = payload.get<SetStatusFileManager>();
    notifier_.notify_report(message.message);
}

void FileManager::on_process_action(ProcessAction action, bool result) {
    if (action != ProcessAction::START) {
        return;
    }
    notifier_.notify_report(result ? "Process started successfully" : "Process failed to start");
}

//=============================================================================
// Teardown
//=============================================================================

void FileManager::abort_transfer(FileTransfer& transfer) {
    cancel_transfer(transfer.id);

    if (transfer.file_split) {
        transfer.file_split->close();
    }

    if (transfer.type == TransferType::DOWNLOAD) {
        if (file_exists(transfer.local_path) && !delete_file(transfer.local_path)) {
            LOG_FM_WARN("Could not delete partial download " << transfer.local_path);
        }
    }
}

void FileManager::shutdown() {
    std::lock_guard<std::mutex> lock(teardown_mutex_);
    if (!running_.exchange(false)) {
        return;
    }

    LOG_FM_INFO("FileManager stopping...");

    auto transfers = registry_.take_all();
    for (auto& transfer : transfers) {
        abort_transfer(*transfer);
    }

    // Workers waiting for a slot give up; streaming workers notice their
    // transfer is gone before the next chunk
    upload_limiter_.shutdown();
    shutdown_all_threads();
    join_all_active_threads();

    // Uploads that registered while the first sweep ran
    auto stragglers = registry_.take_all();
    for (auto& transfer : stragglers) {
        abort_transfer(*transfer);
    }

    unregister_handlers();
    task_manager_->unregister_handlers(router_);
    task_manager_->set_process_action_callback(nullptr);

    LOG_FM_INFO("FileManager stopped (" << transfers.size() + stragglers.size() << " transfers canceled)");
}

} // namespace remotefm
