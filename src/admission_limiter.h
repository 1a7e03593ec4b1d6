#pragma once

#include <condition_variable>
#include <mutex>
#include <cstddef>

namespace remotefm {

/**
 * Counting limiter bounding how many upload workers stream at once.
 * acquire() blocks until a slot is free or the limiter is shut down.
 */
class AdmissionLimiter {
public:
    explicit AdmissionLimiter(size_t capacity);

    AdmissionLimiter(const AdmissionLimiter&) = delete;
    AdmissionLimiter& operator=(const AdmissionLimiter&) = delete;

    /**
     * Block until a slot is available
     * @return false if the limiter was shut down while waiting
     */
    bool acquire();

    // Non-blocking variant
    bool try_acquire();

    void release();

    /**
     * Wake every waiter and make further acquire() calls fail.
     * Slots already held stay valid until released.
     */
    void shutdown();

    size_t get_capacity() const { return capacity_; }
    size_t get_in_use() const;
    // Highest number of slots held at the same time since construction
    size_t get_peak_in_use() const;
    bool is_shutdown() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable slot_available_;
    size_t in_use_;
    size_t peak_in_use_;
    bool shutdown_;
};

/**
 * Holds one admission slot and releases it exactly once, either through
 * release() or on destruction.
 */
class AdmissionSlot {
public:
    AdmissionSlot() : limiter_(nullptr) {}
    // Adopts a slot the caller already acquired from the limiter
    explicit AdmissionSlot(AdmissionLimiter& limiter);
    ~AdmissionSlot();

    AdmissionSlot(AdmissionSlot&& other) noexcept;
    AdmissionSlot& operator=(AdmissionSlot&& other) noexcept;

    AdmissionSlot(const AdmissionSlot&) = delete;
    AdmissionSlot& operator=(const AdmissionSlot&) = delete;

    bool is_held() const { return limiter_ != nullptr; }
    void release();

private:
    AdmissionLimiter* limiter_;
};

} // namespace remotefm
