#include "Scheduler.hpp"
#include <iostream>
#include <utility>

namespace keyfall {

Scheduler::Scheduler(VoiceMixer& mixer, LiveInputSource* live_source)
    : mixer_(mixer)
    , live_source_(live_source)
{
}

bool Scheduler::load(const std::vector<ScheduledNote>& notes) {
    if (!timeline_.load(notes)) {
        std::cerr << "[Scheduler] Rejected note sequence: invalid note times or pitches" << std::endl;
        return false;
    }
    restart();
    return true;
}

void Scheduler::tick(double delta_seconds) {
    if (transport_.advance(delta_seconds)) {
        timeline_.rewind(*transport_.loop_start(), *transport_.loop_end());
    }

    if (transport_.paused()) {
        return;
    }

    if (live_source_ != nullptr) {
        live_.drain(*live_source_, mixer_);
    }

    Resolution resolution = timeline_.resolve(transport_.current_time());

    if (timeline_audio_enabled_) {
        for (int pitch : resolution.to_start) {
            mixer_.start(pitch);
        }
    }

    for (int pitch : resolution.to_stop) {
        if (live_.protects(pitch)) continue;
        if (timeline_audio_enabled_ && resolution.sounding.count(pitch) > 0) continue;
        mixer_.stop(pitch);
    }

    sounding_ = std::move(resolution.sounding);
}

void Scheduler::restart() {
    transport_.restart();
    timeline_.reset();
    sounding_.clear();
    mixer_.stop_all();
}

void Scheduler::stop() {
    live_.clear();
    sounding_.clear();
    mixer_.stop_all();
}

SessionSnapshot Scheduler::snapshot() const {
    SessionSnapshot snap;
    snap.current_time = transport_.current_time();
    snap.rate = transport_.rate();
    snap.paused = transport_.paused();
    snap.loop_start = transport_.loop_start();
    snap.loop_end = transport_.loop_end();
    snap.sounding = sounding_;
    snap.held = live_.held();
    snap.timeline_audio = timeline_audio_enabled_;
    snap.live_audio = live_.audio_enabled();
    return snap;
}

} // namespace keyfall
