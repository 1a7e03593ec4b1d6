#pragma once

#include "admission_limiter.h"
#include "config.h"
#include "event_notifier.h"
#include "file_transfer.h"
#include "message_router.h"
#include "messages.h"
#include "peer_connection.h"
#include "task_manager_handler.h"
#include "threadmanager.h"
#include "transfer_registry.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace remotefm {

/**
 * File manager for one remote peer.
 *
 * Multiplexes uploads and downloads over the peer channel and relays the
 * peer's filesystem replies as events. Downloads advance only as inbound
 * chunks arrive on the dispatch thread; each upload runs on its own managed
 * worker, and at most config.max_concurrent_uploads of them stream at once.
 *
 * Cancellation is cooperative: an upload checks that it is still registered
 * before each chunk send, so a cancel takes effect within one chunk.
 *
 * The peer connection, router and execution context must outlive the
 * file manager.
 */
class FileManager : private ThreadManager {
public:
    /**
     * Constructor
     * @param peer Outbound channel to the remote peer
     * @param router Inbound dispatch table; handlers are registered here
     * @param context Execution context for event delivery, fixed for the lifetime
     * @param config File manager configuration
     */
    FileManager(PeerConnection& peer, MessageRouter& router, ExecutionContext& context,
                const FileManagerConfig& config = FileManagerConfig());

    /**
     * Destructor. Runs shutdown().
     */
    ~FileManager() override;

    // Event callbacks, invoked on the execution context
    void set_drives_changed_callback(DrivesChangedCallback callback);
    void set_directory_changed_callback(DirectoryChangedCallback callback);
    void set_transfer_updated_callback(TransferUpdatedCallback callback);
    void set_report_callback(ReportCallback callback);

    /**
     * Download a remote file into the download directory
     * @param remote_path Path of the file on the peer
     * @param local_file_name Local name; defaults to the remote file name
     * @param overwrite Replace an existing local file instead of picking "name(N).ext"
     * @return Transfer id, or 0 if nothing was registered
     */
    int begin_download(const std::string& remote_path, const std::string& local_file_name = "",
                       bool overwrite = false);

    /**
     * Upload a local file on a background worker
     * @param local_path Local file to send
     * @param remote_path Destination on the peer; empty lets the peer pick a temporary name
     * @return false if the file manager is shutting down
     */
    bool begin_upload(const std::string& local_path, const std::string& remote_path = "");

    /**
     * Ask the peer to cancel a transfer. Local state changes when the
     * peer's cancel arrives; unknown ids are harmless.
     */
    void cancel_transfer(int transfer_id);

    void rename_path(const std::string& remote_path, const std::string& new_path, FileType type);
    void delete_path(const std::string& remote_path, FileType type);
    void get_directory_contents(const std::string& remote_path);
    void refresh_drives();

    // Delegated to the task manager sub-handler
    void start_process(const std::string& remote_path);

    std::vector<int> active_transfer_ids() const;
    size_t active_transfer_count() const;

    const FileManagerConfig& get_config() const { return config_; }
    const std::string& get_base_download_path() const { return base_download_path_; }
    const AdmissionLimiter& get_upload_limiter() const { return upload_limiter_; }

    /**
     * Cancel every active transfer with the peer, close its file, delete
     * partial downloads, stop upload workers and detach from the router.
     * Safe to call more than once.
     */
    void shutdown();

private:
    // Upload worker body
    void run_upload(const std::string& local_path, const std::string& remote_path);
    void handle_upload_failure(const std::shared_ptr<FileTransfer>& transfer);

    // Inbound message handlers
    void register_handlers();
    void unregister_handlers();
    void handle_chunk(const nlohmann::json& payload);
    void handle_cancel(const nlohmann::json& payload);
    void handle_complete(const nlohmann::json& payload);
    void handle_drives_response(const nlohmann::json& payload);
    void handle_directory_response(const nlohmann::json& payload);
    void handle_status(const nlohmann::json& payload);
    void on_process_action(ProcessAction action, bool result);

    /**
     * Apply a change to a transfer's fields and return a snapshot taken
     * under the same lock, ready to be emitted
     */
    template <typename Func>
    FileTransfer update_transfer(FileTransfer& transfer, Func&& change) {
        std::lock_guard<std::mutex> lock(transfer_fields_mutex_);
        change(transfer);
        return transfer.snapshot();
    }

    // Cleanup for a transfer taken out of the registry during teardown
    void abort_transfer(FileTransfer& transfer);

    std::string make_unique_local_path(const std::string& local_path) const;

    PeerConnection& peer_;
    MessageRouter& router_;
    FileManagerConfig config_;
    std::string base_download_path_;

    EventNotifier notifier_;
    TransferRegistry registry_;
    AdmissionLimiter upload_limiter_;
    std::unique_ptr<TaskManagerHandler> task_manager_;

    // Serializes field updates between a transfer's owner and the peer's
    // cancel/complete handling. Never held across I/O.
    std::mutex transfer_fields_mutex_;

    std::atomic<bool> running_;
    std::mutex teardown_mutex_;
};

} // namespace remotefm
