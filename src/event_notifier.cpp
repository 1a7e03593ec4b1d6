#include "event_notifier.h"

namespace remotefm {

EventNotifier::EventNotifier(ExecutionContext& context)
    : context_(context), handlers_(std::make_shared<Handlers>()) {
}

void EventNotifier::set_drives_changed_callback(DrivesChangedCallback callback) {
    std::lock_guard<std::mutex> lock(handlers_->mutex);
    handlers_->drives_changed = std::move(callback);
}

void EventNotifier::set_directory_changed_callback(DirectoryChangedCallback callback) {
    std::lock_guard<std::mutex> lock(handlers_->mutex);
    handlers_->directory_changed = std::move(callback);
}

void EventNotifier::set_transfer_updated_callback(TransferUpdatedCallback callback) {
    std::lock_guard<std::mutex> lock(handlers_->mutex);
    handlers_->transfer_updated = std::move(callback);
}

void EventNotifier::set_report_callback(ReportCallback callback) {
    std::lock_guard<std::mutex> lock(handlers_->mutex);
    handlers_->report = std::move(callback);
}

void EventNotifier::clear_callbacks() {
    std::lock_guard<std::mutex> lock(handlers_->mutex);
    handlers_->drives_changed = nullptr;
    handlers_->directory_changed = nullptr;
    handlers_->transfer_updated = nullptr;
    handlers_->report = nullptr;
}

void EventNotifier::notify_drives_changed(std::vector<Drive> drives) {
    auto handlers = handlers_;
    context_.post([handlers, drives = std::move(drives)]() {
        DrivesChangedCallback callback;
        {
            std::lock_guard<std::mutex> lock(handlers->mutex);
            callback = handlers->drives_changed;
        }
        if (callback) {
            callback(drives);
        }
    });
}

void EventNotifier::notify_directory_changed(const std::string& remote_path, std::vector<FileSystemEntry> entries) {
    auto handlers = handlers_;
    context_.post([handlers, remote_path, entries = std::move(entries)]() {
        DirectoryChangedCallback callback;
        {
            std::lock_guard<std::mutex> lock(handlers->mutex);
            callback = handlers->directory_changed;
        }
        if (callback) {
            callback(remote_path, entries);
        }
    });
}

void EventNotifier::notify_transfer_updated(const FileTransfer& transfer) {
    auto handlers = handlers_;
    context_.post([handlers, snapshot = transfer.snapshot()]() {
        TransferUpdatedCallback callback;
        {
            std::lock_guard<std::mutex> lock(handlers->mutex);
            callback = handlers->transfer_updated;
        }
        if (callback) {
            callback(snapshot);
        }
    });
}

void EventNotifier::notify_report(const std::string& message) {
    auto handlers = handlers_;
    context_.post([handlers, message]() {
        ReportCallback callback;
        {
            std::lock_guard<std::mutex> lock(handlers->mutex);
            callback = handlers->report;
        }
        if (callback) {
            callback(message);
        }
    });
}

} // namespace remotefm
