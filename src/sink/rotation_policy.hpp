#ifndef ROTATION_POLICY_HPP
#define ROTATION_POLICY_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

// Decides when a partition writer should commit its buffer as an object.
// A non-positive interval disables that trigger.
class RotationPolicy {
public:
    RotationPolicy(size_t flush_size, int64_t rotate_interval_ms, int64_t rotate_schedule_interval_ms);

    // Record count threshold
    bool shouldRotateBySize(size_t buffered_records) const;

    // Record timestamp span threshold
    bool shouldRotateByInterval(std::chrono::system_clock::time_point first_timestamp,
                                std::chrono::system_clock::time_point last_timestamp) const;

    // Wall clock threshold since the last reset
    bool shouldRotateBySchedule() const;

    // Reset wall clock (call after a rotation)
    void reset();

    std::chrono::milliseconds getTimeSinceReset() const;

    size_t getFlushSize() const { return flush_size_; }
    int64_t getRotateIntervalMs() const { return rotate_interval_ms_; }
    int64_t getRotateScheduleIntervalMs() const { return rotate_schedule_interval_ms_; }

private:
    size_t flush_size_;
    int64_t rotate_interval_ms_;
    int64_t rotate_schedule_interval_ms_;
    std::chrono::steady_clock::time_point last_reset_time_;
};

#endif // ROTATION_POLICY_HPP
