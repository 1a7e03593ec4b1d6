#include "admission_limiter.h"
#include "logger.h"
#include <algorithm>

#define LOG_LIMITER_DEBUG(message) LOG_DEBUG("limiter", message)
#define LOG_LIMITER_ERROR(message) LOG_ERROR("limiter", message)

namespace remotefm {

AdmissionLimiter::AdmissionLimiter(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)), in_use_(0), peak_in_use_(0), shutdown_(false) {
}

bool AdmissionLimiter::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    slot_available_.wait(lock, [this] { return shutdown_ || in_use_ < capacity_; });

    if (shutdown_) {
        return false;
    }

    ++in_use_;
    peak_in_use_ = std::max(peak_in_use_, in_use_);
    LOG_LIMITER_DEBUG("Slot acquired (" << in_use_ << "/" << capacity_ << ")");
    return true;
}

bool AdmissionLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_ || in_use_ >= capacity_) {
        return false;
    }

    ++in_use_;
    peak_in_use_ = std::max(peak_in_use_, in_use_);
    return true;
}

void AdmissionLimiter::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ == 0) {
            LOG_LIMITER_ERROR("Release without a matching acquire");
            return;
        }
        --in_use_;
        LOG_LIMITER_DEBUG("Slot released (" << in_use_ << "/" << capacity_ << ")");
    }
    slot_available_.notify_one();
}

void AdmissionLimiter::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
    }
    slot_available_.notify_all();
}

size_t AdmissionLimiter::get_in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

size_t AdmissionLimiter::get_peak_in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_in_use_;
}

bool AdmissionLimiter::is_shutdown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

//=============================================================================
// AdmissionSlot Implementation
//=============================================================================

AdmissionSlot::AdmissionSlot(AdmissionLimiter& limiter) : limiter_(&limiter) {
}

AdmissionSlot::~AdmissionSlot() {
    release();
}

AdmissionSlot::AdmissionSlot(AdmissionSlot&& other) noexcept : limiter_(other.limiter_) {
    other.limiter_ = nullptr;
}

AdmissionSlot& AdmissionSlot::operator=(AdmissionSlot&& other) noexcept {
    if (this != &other) {
        release();
        limiter_ = other.limiter_;
        other.limiter_ = nullptr;
    }
    return *this;
}

void AdmissionSlot::release() {
    if (limiter_) {
        limiter_->release();
        limiter_ = nullptr;
    }
}

} // namespace remotefm
