/**
 * @file VoiceMixer.cpp
 * @brief Implementation of the VoiceMixer command queue and render pass.
 */

#include "VoiceMixer.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <iostream>
#include <limits>

namespace keyfall {

VoiceMixer::VoiceMixer(const SampleBank& bank)
    : bank_(bank)
{
    note_to_voice_map_.fill(-1);
    for (auto& flag : sounding_) {
        flag.store(false, std::memory_order_relaxed);
    }
}

bool VoiceMixer::start(int pitch, float /*velocity*/) {
    if (pitch < 0 || pitch >= SampleBank::kPitchCount) {
        return false;
    }

    const Sample* sample = bank_.find(pitch + kSampleTransposition);
    if (sample == nullptr) {
        std::cerr << "[VoiceMixer] No sample for pitch " << pitch << std::endl;
        return false;
    }

    return enqueue({Command::Type::Start, pitch, sample});
}

bool VoiceMixer::stop(int pitch) {
    if (pitch < 0 || pitch >= SampleBank::kPitchCount) {
        return false;
    }
    return enqueue({Command::Type::Stop, pitch, nullptr});
}

bool VoiceMixer::stop_all() {
    return enqueue({Command::Type::StopAll, -1, nullptr});
}

bool VoiceMixer::is_active(int pitch) const {
    if (pitch < 0 || pitch >= SampleBank::kPitchCount) return false;
    return sounding_[pitch].load(std::memory_order_acquire);
}

bool VoiceMixer::enqueue(const Command& command) {
    if (!commands_.push(command)) {
        std::cerr << "[VoiceMixer] Command queue full, command dropped" << std::endl;
        return false;
    }
    return true;
}

void VoiceMixer::render(std::span<float> output) {
    std::fill(output.begin(), output.end(), 0.0f);

    while (auto command = commands_.pop()) {
        apply(*command);
    }

    const size_t frames = output.size() / kChannels;

    for (int i = 0; i < MAX_VOICES; ++i) {
        auto& slot = voices_[i];
        if (!slot.active) continue;

        const size_t total = slot.sample->frames();
        const size_t remaining = total > slot.cursor ? total - slot.cursor : 0;
        const size_t to_write = std::min(frames, remaining);

        const float* src = slot.sample->data.data() + slot.cursor * kChannels;
        for (size_t j = 0; j < to_write * kChannels; ++j) {
            output[j] += src[j] * kVoiceGain;
        }
        slot.cursor += to_write;

        if (slot.cursor >= total) {
            release(i);
        }
    }

    // Master Safety Clamp
    for (float& sample : output) {
        sample = std::clamp(sample, -1.0f, 1.0f);
    }

    int count = 0;
    for (const auto& slot : voices_) {
        if (slot.active) ++count;
    }
    active_count_.store(count, std::memory_order_release);
}

void VoiceMixer::apply(const Command& command) {
    switch (command.type) {
        case Command::Type::Start:
            note_on(command.pitch, command.sample);
            break;
        case Command::Type::Stop:
            note_off(command.pitch);
            break;
        case Command::Type::StopAll:
            release_all();
            break;
    }
}

void VoiceMixer::note_on(int note, const Sample* sample) {
    // 1. Retrigger an existing voice for this pitch
    int existing_idx = note_to_voice_map_[note];
    if (existing_idx != -1) {
        auto& slot = voices_[existing_idx];
        slot.sample = sample;
        slot.cursor = 0;
        slot.last_note_on_time = next_timestamp();
        return;
    }

    // 2. Find an idle voice, otherwise steal the oldest one
    int candidate_idx = -1;
    for (int i = 0; i < MAX_VOICES; ++i) {
        if (!voices_[i].active) {
            candidate_idx = i;
            break;
        }
    }

    if (candidate_idx == -1) {
        uint64_t oldest_time = std::numeric_limits<uint64_t>::max();
        for (int i = 0; i < MAX_VOICES; ++i) {
            if (voices_[i].last_note_on_time < oldest_time) {
                oldest_time = voices_[i].last_note_on_time;
                candidate_idx = i;
            }
        }
        AudioLogger::instance().log_event("VoiceSteal", static_cast<float>(voices_[candidate_idx].current_note));
        release(candidate_idx);
    }

    auto& slot = voices_[candidate_idx];
    slot.sample = sample;
    slot.cursor = 0;
    slot.current_note = note;
    slot.active = true;
    slot.last_note_on_time = next_timestamp();
    note_to_voice_map_[note] = candidate_idx;
    sounding_[note].store(true, std::memory_order_release);
}

void VoiceMixer::note_off(int note) {
    int voice_idx = note_to_voice_map_[note];
    if (voice_idx != -1) {
        release(voice_idx);
    }
}

void VoiceMixer::release(int voice_idx) {
    auto& slot = voices_[voice_idx];
    if (slot.current_note != -1) {
        note_to_voice_map_[slot.current_note] = -1;
        sounding_[slot.current_note].store(false, std::memory_order_release);
    }
    slot.sample = nullptr;
    slot.cursor = 0;
    slot.current_note = -1;
    slot.active = false;
}

void VoiceMixer::release_all() {
    for (int i = 0; i < MAX_VOICES; ++i) {
        if (voices_[i].active) {
            release(i);
        }
    }
}

} // namespace keyfall
