/**
 * @file AlsaMidiInput.hpp
 * @brief Live keyboard input read from an ALSA raw MIDI port.
 */

#ifndef KEYFALL_HAL_ALSA_MIDI_INPUT_HPP
#define KEYFALL_HAL_ALSA_MIDI_INPUT_HPP

#include "core/LiveInput.hpp"
#include "hal/MidiPorts.hpp"
#include "midi/MidiParser.hpp"
#include <alsa/asoundlib.h>
#include <deque>
#include <string>
#include <vector>

namespace keyfall::hal {

/**
 * @brief Non-blocking raw MIDI reader.
 *
 * poll() reads whatever bytes the port has buffered, feeds them through the
 * MidiParser and hands out the resulting note events one at a time.
 */
class AlsaMidiInput : public LiveInputSource {
public:
    /**
     * @param device ALSA raw MIDI device, e.g. "hw:1,0,0".
     */
    explicit AlsaMidiInput(const std::string& device);
    ~AlsaMidiInput() override;

    AlsaMidiInput(const AlsaMidiInput&) = delete;
    AlsaMidiInput& operator=(const AlsaMidiInput&) = delete;

    /**
     * @return false if the port cannot be opened.
     */
    bool open();
    void close();
    bool is_open() const { return handle_ != nullptr; }

    std::optional<LiveEvent> poll() override;

    /**
     * @brief Every raw MIDI input subdevice on every sound card.
     *
     * Cards whose control interface cannot be opened are skipped.
     */
    static std::vector<MidiPortInfo> list_inputs();

private:
    void read_pending();

    std::string device_name_;
    snd_rawmidi_t* handle_ = nullptr;
    midi::MidiParser parser_;
    std::deque<LiveEvent> pending_;
};

} // namespace keyfall::hal

#endif // KEYFALL_HAL_ALSA_MIDI_INPUT_HPP
