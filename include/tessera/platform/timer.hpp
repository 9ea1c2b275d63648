// Tessera Platform Layer
// timer.hpp - High-resolution timer utilities

#pragma once

#include <chrono>
#include <cstdint>

namespace tessera::platform {

// Simple stopwatch timer using steady_clock
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::nanoseconds;

    Timer();

    void reset();
    void pause();
    void resume();
    [[nodiscard]] bool is_paused() const;

    // Elapsed time since creation/reset, excluding paused intervals
    [[nodiscard]] Duration elapsed() const;
    [[nodiscard]] double elapsed_seconds() const;
    [[nodiscard]] double elapsed_milliseconds() const;

private:
    TimePoint start_time_;
    Duration paused_duration_{0};
    TimePoint pause_start_;
    bool is_paused_ = false;
};

// Per-frame timing with an exponentially smoothed FPS estimate
class FrameTimer {
public:
    static constexpr double FPS_SMOOTHING = 0.9;

    FrameTimer();

    // Measure the time since the previous tick and fold it into the estimate
    void tick();

    // Fold an externally measured frame duration into the estimate
    void record_frame(double delta_seconds);

    [[nodiscard]] double get_delta_time() const { return delta_time_; }
    [[nodiscard]] double get_delta_time_ms() const { return delta_time_ * 1000.0; }
    [[nodiscard]] double get_fps() const { return fps_; }
    [[nodiscard]] double get_total_time() const { return total_timer_.elapsed_seconds(); }
    [[nodiscard]] uint64_t get_frame_count() const { return frame_count_; }

    void reset();

private:
    Timer total_timer_;
    Timer::TimePoint last_tick_;

    double delta_time_ = 0.0;
    double fps_ = 0.0;
    uint64_t frame_count_ = 0;
};

}  // namespace tessera::platform
