/**
 * @file SampleBank.cpp
 * @brief Sample directory loading through libsndfile.
 */

#include "SampleBank.hpp"
#include <sndfile.hh>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace keyfall {

namespace {

std::string numbered_file_name(int index) {
    char name[16];
    std::snprintf(name, sizeof(name), "%03d.wav", index);
    return name;
}

// Interleaved stereo copy of any channel layout. Mono is duplicated,
// anything wider keeps its first two channels.
std::vector<float> to_stereo(const std::vector<float>& raw, sf_count_t frames, int channels) {
    std::vector<float> stereo(static_cast<size_t>(frames) * Sample::kChannels);
    for (sf_count_t i = 0; i < frames; ++i) {
        const float* frame = raw.data() + i * channels;
        stereo[i * 2] = frame[0];
        stereo[i * 2 + 1] = channels > 1 ? frame[1] : frame[0];
    }
    return stereo;
}

} // namespace

SampleBank SampleBank::load(const std::string& directory, const SampleLayout& layout) {
    std::cout << "[SampleBank] Loading samples from " << directory << std::endl;

    SampleBank bank;
    for (int i = 1; i <= layout.count; ++i) {
        const std::filesystem::path path = std::filesystem::path(directory) / numbered_file_name(i);
        const int pitch = layout.first_pitch + (i - 1);

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            continue;
        }
        if (pitch < 0 || pitch >= kPitchCount) {
            std::cerr << "[SampleBank] Pitch " << pitch << " out of range, skipping " << path << std::endl;
            continue;
        }

        SndfileHandle file(path.string());
        if (file.error() != SF_ERR_NO_ERROR) {
            std::cerr << "[SampleBank] Cannot read " << path << " (" << file.strError() << ")" << std::endl;
            continue;
        }

        if (bank.sample_rate_ == 0) {
            bank.sample_rate_ = file.samplerate();
            std::cout << "[SampleBank] Reference sample rate set: " << bank.sample_rate_ << " Hz" << std::endl;
        } else if (file.samplerate() != bank.sample_rate_) {
            std::cerr << "[SampleBank] " << path << " is " << file.samplerate()
                      << " Hz, expected " << bank.sample_rate_ << " Hz, skipping" << std::endl;
            continue;
        }

        const int channels = file.channels();
        const sf_count_t frames = file.frames();
        if (channels < 1 || frames <= 0) {
            std::cerr << "[SampleBank] " << path << " holds no audio, skipping" << std::endl;
            continue;
        }

        std::vector<float> raw(static_cast<size_t>(frames) * channels);
        const sf_count_t read = file.readf(raw.data(), frames);
        if (read <= 0) {
            std::cerr << "[SampleBank] Short read on " << path << ", skipping" << std::endl;
            continue;
        }

        Sample sample;
        sample.data = to_stereo(raw, read, channels);
        bank.insert(pitch, std::move(sample));
    }

    std::cout << "[SampleBank] Loaded " << bank.size() << " piano samples." << std::endl;

    if (bank.empty()) {
        throw std::runtime_error("no samples could be loaded from " + directory);
    }
    return bank;
}

SampleBank SampleBank::from_samples(std::map<int, Sample> samples, int sample_rate) {
    if (samples.empty()) {
        throw std::runtime_error("sample bank requires at least one sample");
    }

    SampleBank bank;
    bank.sample_rate_ = sample_rate;
    for (auto& [pitch, sample] : samples) {
        if (pitch < 0 || pitch >= kPitchCount) {
            throw std::runtime_error("sample pitch out of range: " + std::to_string(pitch));
        }
        bank.insert(pitch, std::move(sample));
    }
    return bank;
}

void SampleBank::insert(int pitch, Sample sample) {
    if (!samples_[pitch]) ++count_;
    samples_[pitch] = std::make_unique<const Sample>(std::move(sample));
}

} // namespace keyfall
