/**
 * @file MidiPorts.hpp
 * @brief Raw MIDI input ports found on the system, and picking one by name.
 */

#ifndef KEYFALL_HAL_MIDI_PORTS_HPP
#define KEYFALL_HAL_MIDI_PORTS_HPP

#include <optional>
#include <string>
#include <vector>

namespace keyfall::hal {

struct MidiPortInfo {
    std::string device; ///< Openable name, "hw:card,device,subdevice"
    std::string name;   ///< Human-readable port name reported by the card
};

/**
 * @brief Resolve a configured MIDI input to a device name.
 *
 * An exact device match wins. Otherwise the first port whose name contains
 * `query` is chosen, so a config can name the keyboard ("iCON iKeyboard")
 * instead of its card number.
 *
 * @return std::nullopt when nothing matches or `query` is empty.
 */
inline std::optional<std::string> select_midi_port(const std::vector<MidiPortInfo>& ports,
                                                   const std::string& query) {
    if (query.empty()) return std::nullopt;

    for (const auto& port : ports) {
        if (port.device == query) return port.device;
    }
    for (const auto& port : ports) {
        if (port.name.find(query) != std::string::npos) return port.device;
    }
    return std::nullopt;
}

} // namespace keyfall::hal

#endif // KEYFALL_HAL_MIDI_PORTS_HPP
