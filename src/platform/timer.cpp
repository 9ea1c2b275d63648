// Tessera Platform Layer
// timer.cpp - Timer implementation

#include <tessera/platform/timer.hpp>

namespace tessera::platform {

// Timer implementation
Timer::Timer() : start_time_(Clock::now()) {}

void Timer::reset() {
    start_time_ = Clock::now();
    paused_duration_ = Duration{0};
    is_paused_ = false;
}

void Timer::pause() {
    if (!is_paused_) {
        is_paused_ = true;
        pause_start_ = Clock::now();
    }
}

void Timer::resume() {
    if (is_paused_) {
        is_paused_ = false;
        paused_duration_ += std::chrono::duration_cast<Duration>(Clock::now() - pause_start_);
    }
}

bool Timer::is_paused() const {
    return is_paused_;
}

Timer::Duration Timer::elapsed() const {
    auto now = Clock::now();
    auto total = std::chrono::duration_cast<Duration>(now - start_time_) - paused_duration_;
    if (is_paused_) {
        total -= std::chrono::duration_cast<Duration>(now - pause_start_);
    }
    return total;
}

double Timer::elapsed_seconds() const {
    return std::chrono::duration<double>(elapsed()).count();
}

double Timer::elapsed_milliseconds() const {
    return std::chrono::duration<double, std::milli>(elapsed()).count();
}

// FrameTimer implementation
FrameTimer::FrameTimer() : last_tick_(Timer::Clock::now()) {}

void FrameTimer::tick() {
    auto now = Timer::Clock::now();
    double delta = std::chrono::duration<double>(now - last_tick_).count();
    last_tick_ = now;
    record_frame(delta);
}

void FrameTimer::record_frame(double delta_seconds) {
    delta_time_ = delta_seconds;
    ++frame_count_;

    if (delta_seconds <= 0.0) {
        return;
    }

    double instant_fps = 1.0 / delta_seconds;
    if (fps_ <= 0.0) {
        fps_ = instant_fps;
    } else {
        fps_ = FPS_SMOOTHING * fps_ + (1.0 - FPS_SMOOTHING) * instant_fps;
    }
}

void FrameTimer::reset() {
    total_timer_.reset();
    last_tick_ = Timer::Clock::now();
    delta_time_ = 0.0;
    fps_ = 0.0;
    frame_count_ = 0;
}

}  // namespace tessera::platform
