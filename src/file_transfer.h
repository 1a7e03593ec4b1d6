#pragma once

#include "file_split.h"
#include <string>
#include <memory>
#include <cstdint>

namespace remotefm {

/**
 * File transfer direction, seen from this side of the link
 */
enum class TransferType {
    UPLOAD,         // Local file sent to the remote peer
    DOWNLOAD        // Remote file received from the peer
};

/**
 * Lifecycle of a transfer. Every terminal state removes the transfer
 * from the registry.
 */
enum class TransferState {
    PENDING,        // Registered, no chunk moved yet
    IN_PROGRESS,    // Chunks are flowing
    COMPLETED,      // Peer confirmed completion
    CANCELED,       // Cancelled by either side
    ERRORED         // Local I/O failure
};

const char* transfer_type_to_string(TransferType type);
const char* transfer_state_to_string(TransferState state);
bool is_terminal_state(TransferState state);

// User visible status strings
extern const char* const STATUS_PENDING;
extern const char* const STATUS_COMPLETED;
extern const char* const STATUS_CANCELED;
extern const char* const STATUS_ERROR_READING;
extern const char* const STATUS_ERROR_WRITING;

/**
 * One upload or download tracked until it reaches a terminal state
 */
struct FileTransfer {
    int id;                         // Unique among active transfers, > 0 once registered
    TransferType type;
    std::string local_path;
    std::string remote_path;
    std::string status;             // Progress or error text
    TransferState state;
    uint64_t size;                  // Declared file size
    uint64_t transferred_size;      // Bytes moved so far

    // Owned file handle. Never part of a snapshot.
    std::shared_ptr<FileSplit> file_split;

    FileTransfer() : id(0), type(TransferType::DOWNLOAD), state(TransferState::PENDING),
                     size(0), transferred_size(0) {}

    /**
     * Deep copy of every observable field, without the file handle
     */
    FileTransfer snapshot() const;

    // Progress in percent, rounded to two decimals; 100 when size is 0
    double get_progress_percentage() const;
};

/**
 * Percentage of transferred bytes rounded to two decimals.
 * A declared size of 0 counts as complete.
 */
double calculate_progress(uint64_t transferred_size, uint64_t size);

/**
 * Render a rounded percentage without trailing zeros:
 * 33.33, 66.67, 12.5, 100
 */
std::string format_progress(double progress);

// "Uploading...(33.33%)" / "Downloading...(50%)"
std::string make_progress_status(TransferType type, double progress);

} // namespace remotefm
