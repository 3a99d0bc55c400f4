/**
 * @file TransportClock.hpp
 * @brief Playback clock with rate, pause and loop region.
 */

#ifndef KEYFALL_TRANSPORT_CLOCK_HPP
#define KEYFALL_TRANSPORT_CLOCK_HPP

#include <optional>

namespace keyfall {

/**
 * @brief Tracks playback position in seconds of score time.
 *
 * Advanced once per control tick by the elapsed wall time; rate scales how
 * much score time one wall second covers. Once both loop points are set the
 * clock wraps from loop_end back to loop_start.
 */
class TransportClock {
public:
    static constexpr double kMinRate = 0.1;
    static constexpr double kDefaultRate = 1.0;

    /**
     * @brief Advance by a wall-clock interval.
     *
     * @param delta_seconds Elapsed wall time since the previous tick.
     * @return true if the clock wrapped to loop_start during this call.
     */
    bool advance(double delta_seconds);

    /**
     * @brief Mark the current time as loop start. Clears any loop end.
     */
    void set_loop_start();

    /**
     * @brief Mark the current time as loop end.
     * @return false if no loop start is set or the current time is not past it.
     */
    bool set_loop_end();

    /**
     * @brief Set both loop points explicitly.
     * @return false (loop unchanged) unless 0 <= start < end.
     */
    bool set_loop(double start, double end);

    void clear_loop();

    /**
     * @brief Set the playback rate, clamped to kMinRate.
     */
    void set_rate(double rate);

    /**
     * @brief Nudge the rate by a (possibly negative) step, clamped to kMinRate.
     */
    void adjust_rate(double step) { set_rate(rate_ + step); }

    /**
     * @brief Return to time zero and drop the loop region.
     */
    void restart();

    void set_paused(bool paused) { paused_ = paused; }
    void toggle_pause() { paused_ = !paused_; }

    double current_time() const { return current_time_; }
    double rate() const { return rate_; }
    bool paused() const { return paused_; }
    std::optional<double> loop_start() const { return loop_start_; }
    std::optional<double> loop_end() const { return loop_end_; }
    bool has_loop() const { return loop_start_.has_value() && loop_end_.has_value(); }

private:
    double current_time_ = 0.0;
    double rate_ = kDefaultRate;
    bool paused_ = false;
    std::optional<double> loop_start_;
    std::optional<double> loop_end_;
};

} // namespace keyfall

#endif // KEYFALL_TRANSPORT_CLOCK_HPP
