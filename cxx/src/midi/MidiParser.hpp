#pragma once

#include "MidiEvent.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>

namespace keyfall::midi {

/**
 * @brief State-machine based MIDI 1.0 byte stream parser.
 *
 * Reassembles channel-voice messages split across reads, supports Running
 * Status, skips System Exclusive payloads and ignores System Real-Time bytes
 * wherever they appear.
 */
class MidiParser {
public:
    using EventCallback = std::function<void(const MidiEvent&)>;

    MidiParser() = default;

    /**
     * @brief Parses a chunk of MIDI bytes.
     * @param data Pointer to the MIDI data.
     * @param size Number of bytes to parse.
     * @param callback Function to call for each completed MidiEvent.
     */
    void parse(const uint8_t* data, size_t size, const EventCallback& callback);

    /**
     * @brief Forget any partial message and the running status.
     */
    void reset();

private:
    enum class State {
        WaitingForStatus,
        WaitingForData1,
        WaitingForData2,
        InSysEx
    };

    State m_state = State::WaitingForStatus;
    uint8_t m_runningStatus = 0;
    uint8_t m_pendingStatus = 0;
    uint8_t m_pendingData1 = 0;

    bool isStatusByte(uint8_t byte) const { return byte >= 0x80; }
    int getExpectedDataBytes(uint8_t status) const;
};

} // namespace keyfall::midi
