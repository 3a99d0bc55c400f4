/**
 * @file LiveInputAdapter.hpp
 * @brief Turns live performance events into mixer commands.
 */

#ifndef KEYFALL_LIVE_INPUT_ADAPTER_HPP
#define KEYFALL_LIVE_INPUT_ADAPTER_HPP

#include "LiveInput.hpp"
#include "VoiceMixer.hpp"
#include <cstddef>
#include <set>

namespace keyfall {

/**
 * @brief Tracks the keys the performer holds and drives their voices.
 *
 * Independent of the timeline. With live audio disabled the held set is
 * still maintained for display, but no voice is started or stopped.
 */
class LiveInputAdapter {
public:
    /// Upper bound on events handled per drain, keeps one tick bounded.
    static constexpr size_t kMaxEventsPerDrain = 256;

    /**
     * @brief Apply every pending event of a source.
     * @return Number of events consumed.
     */
    size_t drain(LiveInputSource& source, VoiceMixer& mixer);

    void apply(const LiveEvent& event, VoiceMixer& mixer);

    /**
     * @brief True if a held live key owns the voice for this pitch.
     */
    bool protects(int pitch) const { return audio_enabled_ && is_held(pitch); }

    bool is_held(int pitch) const { return held_.count(pitch) > 0; }
    const std::set<int>& held() const { return held_; }
    void clear() { held_.clear(); }

    void set_audio_enabled(bool enabled) { audio_enabled_ = enabled; }
    bool audio_enabled() const { return audio_enabled_; }

private:
    std::set<int> held_;
    bool audio_enabled_ = true;
};

} // namespace keyfall

#endif // KEYFALL_LIVE_INPUT_ADAPTER_HPP
