/**
 * @file AlsaDriver.cpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#include "AlsaDriver.hpp"
#include "core/Logger.hpp"
#include "hal/PeriodWriter.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iostream>
#include <memory>
#include <pthread.h>

namespace keyfall::hal {

namespace {

constexpr int kStereo = 2;

struct HwParamsDeleter {
    void operator()(snd_pcm_hw_params_t* params) const { snd_pcm_hw_params_free(params); }
};

using HwParamsPtr = std::unique_ptr<snd_pcm_hw_params_t, HwParamsDeleter>;

} // namespace

AlsaDriver::AlsaDriver(int sample_rate, int block_size, const std::string& device)
    : pcm_handle_(nullptr)
    , format_(SND_PCM_FORMAT_S32_LE)
    , device_name_(device)
    , sample_rate_(sample_rate)
    , block_size_(block_size)
    , num_channels_(kStereo)
    , running_(false)
{
    // Buffers are sized after PCM setup
}

AlsaDriver::~AlsaDriver() {
    stop();
}

bool AlsaDriver::start() {
    if (running_) return true;

    if (!setup_pcm()) {
        close_pcm();
        return false;
    }

    running_ = true;
    processing_thread_ = std::thread(&AlsaDriver::thread_loop, this);

    return true;
}

void AlsaDriver::stop() {
    running_ = false;
    if (processing_thread_.joinable()) {
        processing_thread_.join();
    }
    close_pcm();
}

void AlsaDriver::close_pcm() {
    if (pcm_handle_) {
        snd_pcm_drop(pcm_handle_);
        snd_pcm_close(pcm_handle_);
        pcm_handle_ = nullptr;
    }
}

bool AlsaDriver::setup_pcm() {
    int err;

    if ((err = snd_pcm_open(&pcm_handle_, device_name_.c_str(), SND_PCM_STREAM_PLAYBACK, 0)) < 0) {
        std::cerr << "ALSA: Cannot open audio device " << device_name_ << " (" << snd_strerror(err) << ")" << std::endl;
        pcm_handle_ = nullptr;
        return false;
    }

    snd_pcm_hw_params_t* raw_params = nullptr;
    if ((err = snd_pcm_hw_params_malloc(&raw_params)) < 0) {
        std::cerr << "ALSA: Cannot allocate hardware parameter structure (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    HwParamsPtr hw_params(raw_params);

    if ((err = snd_pcm_hw_params_any(pcm_handle_, hw_params.get())) < 0) {
        std::cerr << "ALSA: Cannot initialize hardware parameter structure (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    if ((err = snd_pcm_hw_params_set_access(pcm_handle_, hw_params.get(), SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) {
        std::cerr << "ALSA: Cannot set access type (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    format_ = SND_PCM_FORMAT_S32_LE;
    if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params.get(), format_)) < 0) {
        std::cerr << "ALSA: Cannot set S32_LE, falling back to S16_LE" << std::endl;
        format_ = SND_PCM_FORMAT_S16_LE;
        if ((err = snd_pcm_hw_params_set_format(pcm_handle_, hw_params.get(), format_)) < 0) {
            std::cerr << "ALSA: Cannot set sample format (" << snd_strerror(err) << ")" << std::endl;
            return false;
        }
    }

    unsigned int rate = static_cast<unsigned int>(sample_rate_);
    if ((err = snd_pcm_hw_params_set_rate_near(pcm_handle_, hw_params.get(), &rate, nullptr)) < 0) {
        std::cerr << "ALSA: Cannot set sample rate (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    sample_rate_ = static_cast<int>(rate);

    if ((err = snd_pcm_hw_params_set_channels(pcm_handle_, hw_params.get(), kStereo)) < 0) {
        std::cerr << "ALSA: Device does not accept stereo output (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    snd_pcm_uframes_t frames = static_cast<snd_pcm_uframes_t>(block_size_);
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm_handle_, hw_params.get(), &frames, nullptr)) < 0) {
        std::cerr << "ALSA: Cannot set period size (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }
    block_size_ = static_cast<int>(frames);

    unsigned int periods = 4;
    if ((err = snd_pcm_hw_params_set_periods_near(pcm_handle_, hw_params.get(), &periods, nullptr)) < 0) {
        std::cerr << "ALSA: Cannot set period count, using driver default (" << snd_strerror(err) << ")" << std::endl;
    }

    if ((err = snd_pcm_hw_params(pcm_handle_, hw_params.get())) < 0) {
        std::cerr << "ALSA: Cannot set parameters (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    const size_t bytes_per_sample = format_ == SND_PCM_FORMAT_S32_LE ? 4 : 2;
    interleaved_buffer_.assign(static_cast<size_t>(block_size_) * num_channels_ * bytes_per_sample, 0);

    if ((err = snd_pcm_prepare(pcm_handle_)) < 0) {
        std::cerr << "ALSA: Cannot prepare audio interface for use (" << snd_strerror(err) << ")" << std::endl;
        return false;
    }

    std::cout << "ALSA: " << device_name_ << " open at " << sample_rate_ << " Hz, "
              << block_size_ << " frames/period, " << snd_pcm_format_name(format_) << std::endl;
    return true;
}

void AlsaDriver::thread_loop() {
    // Set Real-Time Priority (SCHED_FIFO, Priority 80)
    struct sched_param param;
    param.sched_priority = 80;
    int res = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    if (res != 0) {
        if (res == EPERM) {
            AudioLogger::instance().log_message("ALSA", "Priority Failed: EPERM (Need ulimit -r 80+)");
        } else {
            AudioLogger::instance().log_message("ALSA", "Priority Failed: Unknown Error");
        }
    } else {
        AudioLogger::instance().log_message("ALSA", "Real-Time Priority Set (SCHED_FIFO, 80)");
    }

    // RT-Safe: Pre-allocate the float block handed to the render callback
    std::vector<float> float_interleaved(static_cast<size_t>(block_size_) * num_channels_, 0.0f);
    const auto period = std::chrono::microseconds(static_cast<int64_t>(block_size_) * 1000000 / sample_rate_);

    while (running_) {
        if (!callback_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }

        auto start_time = std::chrono::steady_clock::now();
        callback_(std::span<float>(float_interleaved));
        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time).count();
        AudioLogger::instance().log_event("PROC_US", static_cast<float>(duration));

        convert(float_interleaved);

        const size_t frame_bytes = interleaved_buffer_.size() / static_cast<size_t>(block_size_);
        const WriteOutcome outcome = write_period(
            static_cast<size_t>(block_size_), running_,
            [this, frame_bytes](size_t offset, size_t frames) {
                return snd_pcm_writei(pcm_handle_, interleaved_buffer_.data() + offset * frame_bytes, frames);
            },
            [this](int err) { return recover_pcm(err); });

        if (outcome == WriteOutcome::Dropped) {
            AudioLogger::instance().log_message("ALSA", "Period dropped");
            std::this_thread::sleep_for(period);
        }
    }
}

void AlsaDriver::convert(const std::vector<float>& source) {
    if (format_ == SND_PCM_FORMAT_S32_LE) {
        int32_t* s32_ptr = reinterpret_cast<int32_t*>(interleaved_buffer_.data());
        for (size_t i = 0; i < source.size(); ++i) {
            float sample = std::clamp(source[i], -1.0f, 1.0f);
            s32_ptr[i] = static_cast<int32_t>(static_cast<double>(sample) * 2147483647.0);
        }
    } else {
        int16_t* s16_ptr = reinterpret_cast<int16_t*>(interleaved_buffer_.data());
        for (size_t i = 0; i < source.size(); ++i) {
            float sample = std::clamp(source[i], -1.0f, 1.0f);
            s16_ptr[i] = static_cast<int16_t>(sample * 32767.0f);
        }
    }
}

bool AlsaDriver::recover_pcm(int err) {
    if (err == -EAGAIN) return true;

    if (err == -EPIPE) {
        AudioLogger::instance().log_message("ALSA", "Underrun");
        err = snd_pcm_prepare(pcm_handle_);
    } else if (err == -ESTRPIPE) {
        while (running_ && (err = snd_pcm_resume(pcm_handle_)) == -EAGAIN)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        if (err < 0) {
            err = snd_pcm_prepare(pcm_handle_);
        }
    } else {
        AudioLogger::instance().log_event("ALSA_ERR", static_cast<float>(err));
        err = snd_pcm_recover(pcm_handle_, err, 1);
    }

    if (err < 0) {
        // Device gone or in a state prepare cannot fix (-ENODEV, -EBADFD)
        AudioLogger::instance().log_event("ALSA_ERR", static_cast<float>(err));
        return false;
    }
    return true;
}

} // namespace keyfall::hal
