/**
 * @file VoiceMixer.hpp
 * @brief Sample-playback voice pool rendered by the real-time audio thread.
 */

#ifndef KEYFALL_VOICE_MIXER_HPP
#define KEYFALL_VOICE_MIXER_HPP

#include "RingBuffer.hpp"
#include "SampleBank.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <span>

namespace keyfall {

/**
 * @brief Owns the sounding voices and mixes them into output blocks.
 *
 * Threading contract:
 * - start(), stop() and stop_all() are called from ONE control thread. They
 *   never touch voice state directly; they enqueue a command on a lock-free
 *   SPSC queue. Their diagnostics go to stderr, the AudioLogger ring belongs
 *   to the render thread.
 * - render() is called from the real-time audio thread. It applies every
 *   queued command before mixing, so a pass never sees a half-applied change,
 *   and it never allocates, blocks or performs I/O.
 * - is_active() and active_voice_count() read state published by the most
 *   recent render pass and may be called from any thread.
 */
class VoiceMixer {
public:
    static constexpr int MAX_VOICES = 64;

    /// The bank is indexed one octave below the playable pitch.
    static constexpr int kSampleTransposition = 12;

    /// Fixed per-voice gain, keeps common overlaps below clipping.
    static constexpr float kVoiceGain = 0.5f;

    static constexpr int kChannels = Sample::kChannels;

    /**
     * @param bank Sample source. Must outlive the mixer.
     */
    explicit VoiceMixer(const SampleBank& bank);

    /**
     * @brief Start (or retrigger) the voice for a pitch.
     *
     * @param pitch MIDI pitch of the sounding note.
     * @param velocity Accepted for interface symmetry, not used.
     * @return false if no sample exists for the pitch or the command queue is full.
     */
    bool start(int pitch, float velocity = 1.0f);

    /**
     * @brief Remove the voice for a pitch, if any.
     * @return false if the command queue is full.
     */
    bool stop(int pitch);

    /**
     * @brief Remove every voice at the start of the next render pass.
     */
    bool stop_all();

    /**
     * @brief Fill an interleaved stereo block.
     *
     * Exactly output.size() / 2 frames are written, each sample in [-1, 1].
     */
    void render(std::span<float> output);

    bool is_active(int pitch) const;
    int active_voice_count() const { return active_count_.load(std::memory_order_acquire); }

private:
    struct Command {
        enum class Type {
            Start,
            Stop,
            StopAll
        };

        Type type = Type::Stop;
        int pitch = -1;
        const Sample* sample = nullptr;
    };

    struct VoiceSlot {
        const Sample* sample = nullptr;
        size_t cursor = 0;
        int current_note = -1;
        bool active = false;
        uint64_t last_note_on_time = 0; // For LRU stealing
    };

    bool enqueue(const Command& command);
    void apply(const Command& command);
    void note_on(int note, const Sample* sample);
    void note_off(int note);
    void release(int voice_idx);
    void release_all();

    uint64_t next_timestamp() { return ++timestamp_counter_; }

    const SampleBank& bank_;
    LockFreeRingBuffer<Command, 4096> commands_;

    // Render thread only
    std::array<VoiceSlot, MAX_VOICES> voices_{};
    std::array<int, SampleBank::kPitchCount> note_to_voice_map_{};
    uint64_t timestamp_counter_ = 0;

    // Published by render()
    std::array<std::atomic<bool>, SampleBank::kPitchCount> sounding_{};
    std::atomic<int> active_count_{0};
};

} // namespace keyfall

#endif // KEYFALL_VOICE_MIXER_HPP
