#pragma once

#include <cstdint>

namespace keyfall::midi {

/**
 * @brief One decoded channel message, from the keyboard or from a file track.
 *
 * MidiParser produces these from the live byte stream and StandardMidiFile
 * from track data. Only note messages reach the session: a note-on starts
 * a key, a note-off or a note-on with velocity 0 releases it. Everything
 * else (controllers, pitch bend, aftertouch) passes through unused.
 */
struct MidiEvent {
    uint8_t status; ///< Status byte with the channel in the low nibble
    uint8_t data1;  ///< Key number for note messages
    uint8_t data2;  ///< Velocity for note messages

    bool is_note_on() const {
        return (status & 0xF0) == 0x90 && data2 > 0;
    }

    // Velocity 0 on a note-on is the running-status form of a release.
    bool is_note_off() const {
        const uint8_t kind = status & 0xF0;
        return kind == 0x80 || (kind == 0x90 && data2 == 0);
    }

    int pitch() const { return data1 & 0x7F; }
    int velocity() const { return data2 & 0x7F; }

    /// 0-15; keyfall listens on every channel.
    int channel() const { return status & 0x0F; }
};

} // namespace keyfall::midi
