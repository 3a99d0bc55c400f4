#include "TransportClock.hpp"
#include <algorithm>

namespace keyfall {

bool TransportClock::advance(double delta_seconds) {
    if (paused_) return false;

    current_time_ += delta_seconds * rate_;

    if (has_loop() && current_time_ >= *loop_end_) {
        current_time_ = *loop_start_;
        return true;
    }
    return false;
}

void TransportClock::set_loop_start() {
    loop_start_ = current_time_;
    loop_end_.reset();
}

bool TransportClock::set_loop_end() {
    if (!loop_start_ || current_time_ <= *loop_start_) {
        return false;
    }
    loop_end_ = current_time_;
    return true;
}

bool TransportClock::set_loop(double start, double end) {
    if (start < 0.0 || end <= start) {
        return false;
    }
    loop_start_ = start;
    loop_end_ = end;
    return true;
}

void TransportClock::clear_loop() {
    loop_start_.reset();
    loop_end_.reset();
}

void TransportClock::set_rate(double rate) {
    rate_ = std::max(kMinRate, rate);
}

void TransportClock::restart() {
    current_time_ = 0.0;
    clear_loop();
}

} // namespace keyfall
