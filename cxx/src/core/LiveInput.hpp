/**
 * @file LiveInput.hpp
 * @brief Live performance events and the sources that deliver them.
 */

#ifndef KEYFALL_LIVE_INPUT_HPP
#define KEYFALL_LIVE_INPUT_HPP

#include "RingBuffer.hpp"
#include "midi/MidiEvent.hpp"
#include <optional>

namespace keyfall {

/**
 * @brief A key pressed or released by the performer.
 */
struct LiveEvent {
    int pitch = 0;
    int velocity = 0;
    bool on = false;

    /**
     * @brief Convert a channel message; only note-on/note-off map to an event.
     * A note-on with velocity 0 becomes a release.
     */
    static std::optional<LiveEvent> from_midi(const midi::MidiEvent& event) {
        if (event.is_note_on()) return LiveEvent{event.pitch(), event.velocity(), true};
        if (event.is_note_off()) return LiveEvent{event.pitch(), event.velocity(), false};
        return std::nullopt;
    }
};

/**
 * @brief Non-blocking source of live events, polled by the control thread.
 */
class LiveInputSource {
public:
    virtual ~LiveInputSource() = default;

    /**
     * @brief Next pending event, or nullopt if none is ready. Never waits.
     */
    virtual std::optional<LiveEvent> poll() = 0;
};

/**
 * @brief Live source fed by one producer thread through an SPSC queue.
 */
class QueuedLiveInput : public LiveInputSource {
public:
    static constexpr size_t kCapacity = 256;

    /**
     * @return false if the queue is full and the event was dropped.
     */
    bool push(const LiveEvent& event) { return queue_.push(event); }

    bool push_midi(const midi::MidiEvent& event) {
        auto live = LiveEvent::from_midi(event);
        return live ? queue_.push(*live) : false;
    }

    std::optional<LiveEvent> poll() override { return queue_.pop(); }

private:
    LockFreeRingBuffer<LiveEvent, kCapacity> queue_;
};

} // namespace keyfall

#endif // KEYFALL_LIVE_INPUT_HPP
