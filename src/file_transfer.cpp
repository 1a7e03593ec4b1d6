#include "file_transfer.h"
#include <cmath>
#include <cstdio>

namespace remotefm {

const char* const STATUS_PENDING = "Pending...";
const char* const STATUS_COMPLETED = "Completed";
const char* const STATUS_CANCELED = "Canceled";
const char* const STATUS_ERROR_READING = "Error reading file";
const char* const STATUS_ERROR_WRITING = "Error writing file";

const char* transfer_type_to_string(TransferType type) {
    switch (type) {
        case TransferType::UPLOAD: return "upload";
        case TransferType::DOWNLOAD: return "download";
        default: return "unknown";
    }
}

const char* transfer_state_to_string(TransferState state) {
    switch (state) {
        case TransferState::PENDING: return "pending";
        case TransferState::IN_PROGRESS: return "in_progress";
        case TransferState::COMPLETED: return "completed";
        case TransferState::CANCELED: return "canceled";
        case TransferState::ERRORED: return "errored";
        default: return "unknown";
    }
}

bool is_terminal_state(TransferState state) {
    return state == TransferState::COMPLETED ||
           state == TransferState::CANCELED ||
           state == TransferState::ERRORED;
}

//=============================================================================
// FileTransfer Implementation
//=============================================================================

FileTransfer FileTransfer::snapshot() const {
    FileTransfer copy;
    copy.id = id;
    copy.type = type;
    copy.local_path = local_path;
    copy.remote_path = remote_path;
    copy.status = status;
    copy.state = state;
    copy.size = size;
    copy.transferred_size = transferred_size;
    return copy;
}

double FileTransfer::get_progress_percentage() const {
    return calculate_progress(transferred_size, size);
}

double calculate_progress(uint64_t transferred_size, uint64_t size) {
    if (size == 0) {
        return 100.0;
    }
    double percentage = static_cast<double>(transferred_size) / static_cast<double>(size) * 100.0;
    return std::round(percentage * 100.0) / 100.0;
}

std::string format_progress(double progress) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", progress);

    std::string text(buffer);
    // Strip trailing zeros and a dangling decimal point
    size_t last = text.find_last_not_of('0');
    if (last != std::string::npos && text[last] == '.') {
        --last;
    }
    text.erase(last + 1);
    return text;
}

std::string make_progress_status(TransferType type, double progress) {
    const char* verb = (type == TransferType::UPLOAD) ? "Uploading" : "Downloading";
    return std::string(verb) + "...(" + format_progress(progress) + "%)";
}

} // namespace remotefm
