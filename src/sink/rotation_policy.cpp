#include "rotation_policy.hpp"

RotationPolicy::RotationPolicy(size_t flush_size,
                               int64_t rotate_interval_ms,
                               int64_t rotate_schedule_interval_ms)
    : flush_size_(flush_size),
      rotate_interval_ms_(rotate_interval_ms),
      rotate_schedule_interval_ms_(rotate_schedule_interval_ms),
      last_reset_time_(std::chrono::steady_clock::now()) {
}

bool RotationPolicy::shouldRotateBySize(size_t buffered_records) const {
    return buffered_records > 0 && buffered_records >= flush_size_;
}

bool RotationPolicy::shouldRotateByInterval(std::chrono::system_clock::time_point first_timestamp,
                                            std::chrono::system_clock::time_point last_timestamp) const {
    if (rotate_interval_ms_ <= 0) {
        return false;
    }
    auto span = std::chrono::duration_cast<std::chrono::milliseconds>(last_timestamp - first_timestamp);
    return span.count() >= rotate_interval_ms_;
}

bool RotationPolicy::shouldRotateBySchedule() const {
    if (rotate_schedule_interval_ms_ <= 0) {
        return false;
    }
    return getTimeSinceReset().count() >= rotate_schedule_interval_ms_;
}

void RotationPolicy::reset() {
    last_reset_time_ = std::chrono::steady_clock::now();
}

std::chrono::milliseconds RotationPolicy::getTimeSinceReset() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - last_reset_time_);
}
