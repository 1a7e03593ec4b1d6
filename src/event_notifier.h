#pragma once

#include "execution_context.h"
#include "file_transfer.h"
#include "messages.h"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace remotefm {

/**
 * Callback function types for file manager events
 */
using DrivesChangedCallback = std::function<void(const std::vector<Drive>& drives)>;
using DirectoryChangedCallback = std::function<void(const std::string& remote_path, const std::vector<FileSystemEntry>& entries)>;
using TransferUpdatedCallback = std::function<void(const FileTransfer& transfer)>;
using ReportCallback = std::function<void(const std::string& message)>;

/**
 * Delivers file manager events on the execution context bound at
 * construction. Handlers are looked up when the task runs, so a handler
 * replaced or cleared before delivery is honoured.
 */
class EventNotifier {
public:
    explicit EventNotifier(ExecutionContext& context);

    EventNotifier(const EventNotifier&) = delete;
    EventNotifier& operator=(const EventNotifier&) = delete;

    void set_drives_changed_callback(DrivesChangedCallback callback);
    void set_directory_changed_callback(DirectoryChangedCallback callback);
    void set_transfer_updated_callback(TransferUpdatedCallback callback);
    void set_report_callback(ReportCallback callback);

    // Drop every handler; queued events are discarded on delivery
    void clear_callbacks();

    void notify_drives_changed(std::vector<Drive> drives);
    void notify_directory_changed(const std::string& remote_path, std::vector<FileSystemEntry> entries);

    /**
     * Post a deep copy of the transfer taken now, so later changes by the
     * owning worker or dispatcher never reach the handler
     */
    void notify_transfer_updated(const FileTransfer& transfer);

    void notify_report(const std::string& message);

private:
    struct Handlers {
        std::mutex mutex;
        DrivesChangedCallback drives_changed;
        DirectoryChangedCallback directory_changed;
        TransferUpdatedCallback transfer_updated;
        ReportCallback report;
    };

    ExecutionContext& context_;
    // Shared with posted tasks so they stay valid if the notifier goes first
    std::shared_ptr<Handlers> handlers_;
};

} // namespace remotefm
