/**
 * @file AudioDriver.hpp
 * @brief Abstract base class for platform-specific audio output drivers.
 *
 * Hardware/OS audio code stays behind this interface, separate from the
 * mixing and scheduling core.
 */

#ifndef KEYFALL_AUDIO_DRIVER_HPP
#define KEYFALL_AUDIO_DRIVER_HPP

#include <functional>
#include <span>

namespace keyfall::hal {

/**
 * @brief Abstract base class for audio output drivers.
 *
 * The driver owns the real-time thread and calls the render callback once
 * per period with an interleaved float block of block_size() * channels()
 * samples. The callback must fill it with values in [-1, 1].
 */
class AudioDriver {
public:
    using RenderCallback = std::function<void(std::span<float> interleaved)>;

    virtual ~AudioDriver() = default;

    /**
     * @brief Open the device and start the real-time thread.
     *
     * @return true if successfully started, false otherwise.
     */
    virtual bool start() = 0;

    /**
     * @brief Stop the real-time thread and close the device.
     */
    virtual void stop() = 0;

    /**
     * @brief Set the render callback. Call before start().
     */
    virtual void set_render_callback(RenderCallback callback) = 0;

    /**
     * @brief Negotiated sample rate in Hz (requested rate before start()).
     */
    virtual int sample_rate() const = 0;

    /**
     * @brief Negotiated number of frames per period.
     */
    virtual int block_size() const = 0;

    virtual int channels() const = 0;
};

} // namespace keyfall::hal

#endif // KEYFALL_AUDIO_DRIVER_HPP
