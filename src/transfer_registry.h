#pragma once

#include "file_transfer.h"
#include <memory>
#include <mutex>
#include <random>
#include <unordered_map>
#include <vector>

namespace remotefm {

/**
 * Authoritative set of active transfers.
 *
 * Every operation runs under one mutex that covers lookup, insert and
 * remove only. No file or network I/O happens while it is held, except
 * closing a removed transfer's file handle.
 */
class TransferRegistry {
public:
    TransferRegistry();

    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    /**
     * Insert a transfer under its current id
     * @return false if the id is not positive or already registered
     */
    bool add(const std::shared_ptr<FileTransfer>& transfer);

    /**
     * Allocate a fresh id and insert the transfer in the same critical
     * section, so two callers can never register the same id.
     * @return The assigned id
     */
    int register_with_unique_id(const std::shared_ptr<FileTransfer>& transfer);

    std::shared_ptr<FileTransfer> find(int id) const;
    bool contains(int id) const;

    /**
     * Close the transfer's file handle and drop it
     * @return true if a transfer was removed
     */
    bool remove(int id);

    /**
     * Draw random ids until one is not in use. The id is not reserved;
     * prefer register_with_unique_id() when the transfer is ready.
     */
    int generate_unique_id();

    // Ids of all active transfers, in no particular order
    std::vector<int> active_ids() const;

    /**
     * Empty the registry in one critical section and hand the removed
     * transfers to the caller. File handles are left open.
     */
    std::vector<std::shared_ptr<FileTransfer>> take_all();

    size_t size() const;
    bool empty() const;

private:
    int draw_unused_id_locked();

    mutable std::mutex mutex_;
    std::unordered_map<int, std::shared_ptr<FileTransfer>> transfers_;
    std::mt19937 rng_;
};

} // namespace remotefm
