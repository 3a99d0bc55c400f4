/**
 * @file Scheduler.hpp
 * @brief Control-thread tick that drives the mixer from the timeline and live input.
 */

#ifndef KEYFALL_SCHEDULER_HPP
#define KEYFALL_SCHEDULER_HPP

#include "LiveInput.hpp"
#include "LiveInputAdapter.hpp"
#include "NoteTimeline.hpp"
#include "TransportClock.hpp"
#include "VoiceMixer.hpp"
#include <optional>
#include <set>
#include <vector>

namespace keyfall {

/**
 * @brief Read-only view of the session for a presentation layer.
 */
struct SessionSnapshot {
    double current_time = 0.0;
    double rate = TransportClock::kDefaultRate;
    bool paused = false;
    std::optional<double> loop_start;
    std::optional<double> loop_end;
    std::set<int> sounding; ///< Timeline notes due at current_time
    std::set<int> held;     ///< Keys the performer is holding
    bool timeline_audio = true;
    bool live_audio = true;
};

/**
 * @brief Owns the transport, timeline and live key state of one session.
 *
 * Every method runs on the control thread. The only state shared with the
 * audio thread lives in the VoiceMixer, reached through its command queue.
 */
class Scheduler {
public:
    /**
     * @param mixer Voice mixer rendered by the audio thread. Must outlive the scheduler.
     * @param live_source Optional live input, polled each tick. Must outlive the scheduler.
     */
    explicit Scheduler(VoiceMixer& mixer, LiveInputSource* live_source = nullptr);

    /**
     * @brief Replace the note sequence and restart playback.
     *
     * Cancels any loop region. On failure the previous sequence and
     * transport are untouched.
     */
    bool load(const std::vector<ScheduledNote>& notes);

    /**
     * @brief Run one control tick.
     *
     * 1. Advance the transport by the elapsed wall time.
     * 2. On a loop wrap, rewind the events inside the loop.
     * 3. Drain live input.
     * 4. Resolve the timeline at the new time.
     * 5. Start every note that became due.
     * 6. Stop every note that ended, unless a held live key owns the pitch
     *    or another note of that pitch is still sounding on the timeline.
     *    A note that starts and ends within one tick is started and stopped.
     *
     * Steps 3 to 6 are skipped while paused.
     */
    void tick(double delta_seconds);

    /**
     * @brief Back to time zero: loop cleared, all events pending, all voices stopped.
     */
    void restart();

    /**
     * @brief Cancel playback: release held keys and silence every voice.
     */
    void stop();

    void set_timeline_audio_enabled(bool enabled) { timeline_audio_enabled_ = enabled; }
    void set_live_audio_enabled(bool enabled) { live_.set_audio_enabled(enabled); }
    bool timeline_audio_enabled() const { return timeline_audio_enabled_; }
    bool live_audio_enabled() const { return live_.audio_enabled(); }

    TransportClock& transport() { return transport_; }
    const TransportClock& transport() const { return transport_; }
    const NoteTimeline& timeline() const { return timeline_; }
    const LiveInputAdapter& live_input() const { return live_; }

    SessionSnapshot snapshot() const;

private:
    VoiceMixer& mixer_;
    LiveInputSource* live_source_;

    TransportClock transport_;
    NoteTimeline timeline_;
    LiveInputAdapter live_;
    std::set<int> sounding_;
    bool timeline_audio_enabled_ = true;
};

} // namespace keyfall

#endif // KEYFALL_SCHEDULER_HPP
