#include "transfer_registry.h"
#include "logger.h"
#include <limits>

#define LOG_REGISTRY_DEBUG(message) LOG_DEBUG("registry", message)
#define LOG_REGISTRY_WARN(message)  LOG_WARN("registry", message)

namespace remotefm {

TransferRegistry::TransferRegistry() : rng_(std::random_device{}()) {
}

bool TransferRegistry::add(const std::shared_ptr<FileTransfer>& transfer) {
    if (!transfer || transfer->id <= 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    bool inserted = transfers_.emplace(transfer->id, transfer).second;
    if (!inserted) {
        LOG_REGISTRY_WARN("Transfer id " << transfer->id << " is already registered");
    }
    return inserted;
}

int TransferRegistry::register_with_unique_id(const std::shared_ptr<FileTransfer>& transfer) {
    if (!transfer) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    int id = draw_unused_id_locked();
    transfer->id = id;
    transfers_.emplace(id, transfer);
    LOG_REGISTRY_DEBUG("Registered " << transfer_type_to_string(transfer->type) << " " << id
                       << " (" << transfers_.size() << " active)");
    return id;
}

std::shared_ptr<FileTransfer> TransferRegistry::find(int id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(id);
    return it != transfers_.end() ? it->second : nullptr;
}

bool TransferRegistry::contains(int id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.find(id) != transfers_.end();
}

bool TransferRegistry::remove(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transfers_.find(id);
    if (it == transfers_.end()) {
        return false;
    }

    if (it->second->file_split) {
        it->second->file_split->close();
    }
    transfers_.erase(it);
    LOG_REGISTRY_DEBUG("Removed transfer " << id << " (" << transfers_.size() << " active)");
    return true;
}

int TransferRegistry::generate_unique_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    return draw_unused_id_locked();
}

std::vector<int> TransferRegistry::active_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int> result;
    result.reserve(transfers_.size());
    for (const auto& entry : transfers_) {
        result.push_back(entry.first);
    }
    return result;
}

std::vector<std::shared_ptr<FileTransfer>> TransferRegistry::take_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<FileTransfer>> result;
    result.reserve(transfers_.size());
    for (auto& entry : transfers_) {
        result.push_back(std::move(entry.second));
    }
    transfers_.clear();
    return result;
}

size_t TransferRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.size();
}

bool TransferRegistry::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfers_.empty();
}

int TransferRegistry::draw_unused_id_locked() {
    std::uniform_int_distribution<int> dis(1, std::numeric_limits<int>::max());
    int id;
    do {
        id = dis(rng_);
    } while (transfers_.find(id) != transfers_.end());
    return id;
}

} // namespace remotefm
