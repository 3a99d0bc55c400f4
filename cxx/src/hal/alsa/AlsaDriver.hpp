/**
 * @file AlsaDriver.hpp
 * @brief Linux ALSA implementation of the AudioDriver interface.
 */

#ifndef KEYFALL_HAL_ALSA_DRIVER_HPP
#define KEYFALL_HAL_ALSA_DRIVER_HPP

#include "hal/AudioDriver.hpp"
#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace keyfall::hal {

/**
 * @brief ALSA playback driver.
 *
 * Opens the device for interleaved stereo, preferring S32_LE and falling
 * back to S16_LE, then runs a SCHED_FIFO thread that renders one period at
 * a time and writes it with snd_pcm_writei(). A period the device cannot
 * take after recovery is dropped and the thread waits one period before
 * rendering the next.
 */
class AlsaDriver : public AudioDriver {
public:
    /**
     * @param sample_rate Requested sample rate.
     * @param block_size Requested period size (frames per interrupt).
     * @param device ALSA device name.
     */
    AlsaDriver(int sample_rate = 44100, int block_size = 512, const std::string& device = "default");
    ~AlsaDriver() override;

    AlsaDriver(const AlsaDriver&) = delete;
    AlsaDriver& operator=(const AlsaDriver&) = delete;

    bool start() override;
    void stop() override;
    void set_render_callback(RenderCallback callback) override { callback_ = std::move(callback); }

    int sample_rate() const override { return sample_rate_; }
    int block_size() const override { return block_size_; }
    int channels() const override { return num_channels_; }

private:
    void thread_loop();
    bool setup_pcm();
    void close_pcm();
    bool recover_pcm(int err);
    void convert(const std::vector<float>& source);

    snd_pcm_t* pcm_handle_;
    snd_pcm_format_t format_;
    std::string device_name_;
    int sample_rate_;
    int block_size_;
    int num_channels_;
    RenderCallback callback_;
    std::atomic<bool> running_;
    std::thread processing_thread_;

    std::vector<uint8_t> interleaved_buffer_;
};

} // namespace keyfall::hal

#endif // KEYFALL_HAL_ALSA_DRIVER_HPP
