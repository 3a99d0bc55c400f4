#include "MidiParser.hpp"

namespace keyfall::midi {

void MidiParser::parse(const uint8_t* data, size_t size, const EventCallback& callback) {
    for (size_t i = 0; i < size; ++i) {
        uint8_t byte = data[i];

        if (isStatusByte(byte)) {
            // Real-Time bytes may be interleaved anywhere, even inside SysEx.
            if (byte >= 0xF8) continue;

            if (byte == 0xF0) {
                m_runningStatus = 0;
                m_state = State::InSysEx;
                continue;
            }

            // End of SysEx and System Common messages cancel Running Status.
            if (byte >= 0xF0) {
                m_runningStatus = 0;
                m_state = State::WaitingForStatus;
                continue;
            }

            m_pendingStatus = byte;
            m_runningStatus = byte;
            m_state = State::WaitingForData1;
            continue;
        }

        if (m_state == State::InSysEx) continue;

        // Data byte while waiting for status: Running Status
        if (m_state == State::WaitingForStatus) {
            if (m_runningStatus == 0) continue; // Stray data byte
            m_pendingStatus = m_runningStatus;
            m_state = State::WaitingForData1;
        }

        switch (m_state) {
            case State::WaitingForData1:
                m_pendingData1 = byte;
                if (getExpectedDataBytes(m_pendingStatus) == 1) {
                    callback({m_pendingStatus, m_pendingData1, 0});
                    m_state = State::WaitingForStatus;
                } else {
                    m_state = State::WaitingForData2;
                }
                break;

            case State::WaitingForData2:
                callback({m_pendingStatus, m_pendingData1, byte});
                m_state = State::WaitingForStatus;
                break;

            case State::WaitingForStatus:
            case State::InSysEx:
                break;
        }
    }
}

void MidiParser::reset() {
    m_state = State::WaitingForStatus;
    m_runningStatus = 0;
    m_pendingStatus = 0;
    m_pendingData1 = 0;
}

int MidiParser::getExpectedDataBytes(uint8_t status) const {
    switch (status & 0xF0) {
        case 0x80: // Note Off
        case 0x90: // Note On
        case 0xA0: // Polyphonic Aftertouch
        case 0xB0: // Control Change
        case 0xE0: // Pitch Bend
            return 2;
        case 0xC0: // Program Change
        case 0xD0: // Channel Aftertouch
            return 1;
        default:
            return 0;
    }
}

} // namespace keyfall::midi
