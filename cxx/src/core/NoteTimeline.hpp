/**
 * @file NoteTimeline.hpp
 * @brief Scheduled note events and their start/stop trigger state.
 */

#ifndef KEYFALL_NOTE_TIMELINE_HPP
#define KEYFALL_NOTE_TIMELINE_HPP

#include <cstddef>
#include <set>
#include <vector>

namespace keyfall {

/**
 * @brief One note of a decoded sequence, times in seconds.
 */
struct ScheduledNote {
    int pitch = 0;
    double start_time = 0.0;
    double end_time = 0.0;
};

/**
 * @brief A scheduled note plus its trigger state for the current pass.
 */
struct NoteEvent {
    enum class State {
        Pending,
        Started,
        Stopped
    };

    ScheduledNote note;
    State state = State::Pending;
};

/**
 * @brief Pitches whose state changed in one resolve() call.
 */
struct Resolution {
    std::set<int> to_start;
    std::set<int> to_stop;
    std::set<int> sounding; ///< start_time <= t < end_time, for display only
};

/**
 * @brief Ordered collection of note events, scanned in full every tick.
 */
class NoteTimeline {
public:
    /**
     * @brief Replace the event set.
     *
     * Every note is validated first (pitch 0..127, start >= 0, end > start);
     * if any is invalid nothing changes.
     *
     * @return false if the sequence was rejected.
     */
    bool load(const std::vector<ScheduledNote>& notes);

    /**
     * @brief Fire due transitions for the given time.
     *
     * Each event starts exactly once when current_time reaches its start and
     * stops exactly once when current_time reaches its end.
     */
    Resolution resolve(double current_time);

    /**
     * @brief Return every event to Pending.
     */
    void reset();

    /**
     * @brief Return events starting inside [loop_start, loop_end) to Pending.
     */
    void rewind(double loop_start, double loop_end);

    void clear() { events_.clear(); }

    const std::vector<NoteEvent>& events() const { return events_; }
    size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }

    /**
     * @brief Latest end time, 0 when empty.
     */
    double duration() const;

    static bool is_valid(const ScheduledNote& note);

private:
    std::vector<NoteEvent> events_;
};

} // namespace keyfall

#endif // KEYFALL_NOTE_TIMELINE_HPP
