#include "LiveInputAdapter.hpp"

namespace keyfall {

size_t LiveInputAdapter::drain(LiveInputSource& source, VoiceMixer& mixer) {
    size_t count = 0;
    while (count < kMaxEventsPerDrain) {
        auto event = source.poll();
        if (!event) break;
        apply(*event, mixer);
        ++count;
    }
    return count;
}

void LiveInputAdapter::apply(const LiveEvent& event, VoiceMixer& mixer) {
    if (event.on && event.velocity > 0) {
        held_.insert(event.pitch);
        if (audio_enabled_) {
            mixer.start(event.pitch, static_cast<float>(event.velocity) / 127.0f);
        }
    } else {
        held_.erase(event.pitch);
        if (audio_enabled_) {
            mixer.stop(event.pitch);
        }
    }
}

} // namespace keyfall
