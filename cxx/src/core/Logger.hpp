/**
 * @file Logger.hpp
 * @brief RT-safe telemetry logger shared by the render and control threads.
 */

#ifndef KEYFALL_LOGGER_HPP
#define KEYFALL_LOGGER_HPP

#include "RingBuffer.hpp"
#include <chrono>
#include <cstdint>
#include <cstring>
#include <optional>
#include <ostream>

namespace keyfall {

/**
 * @brief Represents a single telemetry event.
 * Fixed-size to ensure RT-safety (no allocations).
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    Type type = Type::Message;
    char tag[32] = {};      // Category or Tag
    float value = 0.0f;     // Numeric value (for Type::Event)
    char message[64] = {};  // Static message (for Type::Message)
    uint64_t timestamp = 0; // steady_clock nanoseconds
};

/**
 * @brief Process-wide logger for real-time telemetry.
 *
 * Producers on the render thread call log_message()/log_event(); a single
 * background consumer (the control loop) drains entries with pop_entry()
 * or flush(). Entries are dropped when the ring is full.
 */
class AudioLogger {
public:
    static AudioLogger& instance() {
        static AudioLogger inst;
        return inst;
    }

    // Audio Thread Methods (RT-Safe)
    void log_message(const char* tag, const char* msg) {
        LogEntry entry;
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        entry.timestamp = now_ns();
        ring_buffer_.push(entry);
    }

    void log_event(const char* tag, float value) {
        LogEntry entry;
        entry.type = LogEntry::Type::Event;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        entry.value = value;
        entry.timestamp = now_ns();
        ring_buffer_.push(entry);
    }

    // Background Thread Methods
    std::optional<LogEntry> pop_entry() {
        return ring_buffer_.pop();
    }

    /**
     * @brief Drain every pending entry to a stream.
     * @return Number of entries written.
     */
    size_t flush(std::ostream& out) {
        size_t count = 0;
        while (auto entry = ring_buffer_.pop()) {
            out << "[" << entry->tag << "] ";
            if (entry->type == LogEntry::Type::Message) {
                out << entry->message;
            } else {
                out << entry->value;
            }
            out << '\n';
            ++count;
        }
        if (count > 0) out.flush();
        return count;
    }

private:
    AudioLogger() = default;

    static uint64_t now_ns() {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count());
    }

    LockFreeRingBuffer<LogEntry, 1024> ring_buffer_;
};

} // namespace keyfall

#endif // KEYFALL_LOGGER_HPP
