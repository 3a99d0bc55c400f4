/**
 * @file SessionConfig.hpp
 * @brief JSON-backed settings for a practice session.
 */

#ifndef KEYFALL_SESSION_CONFIG_HPP
#define KEYFALL_SESSION_CONFIG_HPP

#include "SampleBank.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace keyfall {

using json = nlohmann::json;

/**
 * @brief Everything the executable needs to open devices and load assets.
 *
 * Every key is optional in the JSON file; missing keys keep these defaults.
 */
struct SessionConfig {
    int version = 1;

    // Sample bank
    std::string sample_directory = "samples/2489__jobro__piano-ff";
    int sample_first_pitch = 36;
    int sample_count = 88;

    // Devices
    std::string audio_device = "default";
    int block_size = 512;
    std::string midi_input_device; ///< Raw MIDI device or part of a port name, empty for none

    // Control loop
    double tick_rate_hz = 120.0;
    double rate_step = 0.1;
    bool timeline_audio = true;
    bool live_audio = true;

    SampleLayout sample_layout() const { return {sample_first_pitch, sample_count}; }

    /**
     * @brief Check value ranges.
     * @return Empty string if valid, otherwise a description of the first problem.
     */
    std::string validate() const;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE_WITH_DEFAULT(SessionConfig, version, sample_directory, sample_first_pitch,
                                                sample_count, audio_device, block_size, midi_input_device,
                                                tick_rate_hz, rate_step, timeline_audio, live_audio)
};

/**
 * @brief Manages saving and loading of SessionConfig.
 */
class ConfigStore {
public:
    static bool save_to_file(const SessionConfig& config, const std::string& path);
    static bool load_from_file(SessionConfig& config, const std::string& path);

    /**
     * @brief Convert SessionConfig to a JSON string.
     */
    static std::string serialize(const SessionConfig& config) {
        json j = config;
        return j.dump(4);
    }

    /**
     * @brief Parse and validate a JSON string.
     * @return false on syntax, type or range errors; config is untouched then.
     */
    static bool deserialize(SessionConfig& config, const std::string& data);
};

} // namespace keyfall

#endif // KEYFALL_SESSION_CONFIG_HPP
