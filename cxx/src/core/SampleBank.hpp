/**
 * @file SampleBank.hpp
 * @brief Immutable pitch to decoded stereo sample mapping.
 */

#ifndef KEYFALL_SAMPLE_BANK_HPP
#define KEYFALL_SAMPLE_BANK_HPP

#include <array>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace keyfall {

/**
 * @brief Decoded audio for one pitch: interleaved stereo float32.
 */
struct Sample {
    static constexpr int kChannels = 2;

    std::vector<float> data;

    size_t frames() const { return data.size() / kChannels; }
};

/**
 * @brief Naming convention of a sample directory.
 *
 * Files are numbered "001.wav", "002.wav", ... and file N holds the sample
 * for pitch first_pitch + N - 1.
 */
struct SampleLayout {
    int first_pitch = 36;
    int count = 88;
};

/**
 * @brief Read-only collection of samples, populated once at startup.
 *
 * Lookups are a bounds check and an array index so they are safe to perform
 * from any thread once the bank is built.
 */
class SampleBank {
public:
    static constexpr int kPitchCount = 128;

    SampleBank() = default;
    SampleBank(SampleBank&&) = default;
    SampleBank& operator=(SampleBank&&) = default;
    SampleBank(const SampleBank&) = delete;
    SampleBank& operator=(const SampleBank&) = delete;

    /**
     * @brief Load every sample of a directory.
     *
     * Missing or unreadable files are skipped. The rate of the first file
     * decoded becomes the reference rate; files at any other rate are skipped.
     *
     * @throws std::runtime_error if no sample could be loaded.
     */
    static SampleBank load(const std::string& directory, const SampleLayout& layout = {});

    /**
     * @brief Build a bank from already decoded samples.
     * @throws std::runtime_error if samples is empty or a pitch is out of range.
     */
    static SampleBank from_samples(std::map<int, Sample> samples, int sample_rate);

    /**
     * @brief Sample stored at pitch, or nullptr if none.
     */
    const Sample* find(int pitch) const {
        if (pitch < 0 || pitch >= kPitchCount) return nullptr;
        return samples_[pitch].get();
    }

    int sample_rate() const { return sample_rate_; }
    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

private:
    void insert(int pitch, Sample sample);

    std::array<std::unique_ptr<const Sample>, kPitchCount> samples_{};
    int sample_rate_ = 0;
    size_t count_ = 0;
};

} // namespace keyfall

#endif // KEYFALL_SAMPLE_BANK_HPP
