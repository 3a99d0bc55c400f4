/**
 * @file PeriodWriter.hpp
 * @brief Device-independent write loop for one rendered period.
 */

#ifndef KEYFALL_HAL_PERIOD_WRITER_HPP
#define KEYFALL_HAL_PERIOD_WRITER_HPP

#include <atomic>
#include <cstddef>

namespace keyfall::hal {

enum class WriteOutcome {
    Written,  ///< Every frame reached the device.
    Stopped,  ///< The running flag was cleared before the period finished.
    Dropped   ///< The device failed; the rest of the period is discarded.
};

/**
 * @brief Push one period to the device, resuming after short writes.
 *
 * `write(offset, count)` hands frames [offset, offset + count) to the device
 * and returns the number accepted or a negative errno. `recover(err)` tries
 * to bring the device back and returns false when it cannot. A period is
 * dropped on a failed recovery or after `max_failures` consecutive writes
 * that made no progress.
 */
template<typename WriteFn, typename RecoverFn>
WriteOutcome write_period(size_t frames, const std::atomic<bool>& running,
                          WriteFn&& write, RecoverFn&& recover, int max_failures = 8) {
    size_t written = 0;
    int failures = 0;

    while (written < frames) {
        if (!running) return WriteOutcome::Stopped;

        const auto n = write(written, frames - written);
        if (n < 0) {
            if (!recover(static_cast<int>(n))) return WriteOutcome::Dropped;
            if (++failures >= max_failures) return WriteOutcome::Dropped;
            continue;
        }
        if (n == 0) {
            if (++failures >= max_failures) return WriteOutcome::Dropped;
            continue;
        }

        failures = 0;
        written += static_cast<size_t>(n);
    }
    return WriteOutcome::Written;
}

} // namespace keyfall::hal

#endif // KEYFALL_HAL_PERIOD_WRITER_HPP
