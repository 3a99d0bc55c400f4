#include "StandardMidiFile.hpp"
#include "MidiEvent.hpp"
#include <algorithm>
#include <array>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace keyfall::midi {

namespace {

constexpr uint32_t kDefaultTempo = 500000; // microseconds per quarter note

struct TimedMessage {
    enum class Kind {
        Tempo,
        NoteOn,
        NoteOff
    };

    uint64_t tick;
    Kind kind;
    int pitch;
    uint32_t tempo;
};

/**
 * @brief Bounds-checked big-endian cursor over the file image.
 */
class ByteReader {
public:
    ByteReader(const std::vector<uint8_t>& bytes, size_t begin, size_t end)
        : bytes_(bytes), pos_(begin), end_(end) {}

    bool at_end() const { return pos_ >= end_; }
    size_t position() const { return pos_; }

    uint8_t u8() {
        if (pos_ >= end_) throw std::runtime_error("unexpected end of data");
        return bytes_[pos_++];
    }

    uint8_t peek() const {
        if (pos_ >= end_) throw std::runtime_error("unexpected end of data");
        return bytes_[pos_];
    }

    uint16_t u16() {
        uint16_t hi = u8();
        return static_cast<uint16_t>((hi << 8) | u8());
    }

    uint32_t u32() {
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) value = (value << 8) | u8();
        return value;
    }

    // Variable-length quantity, at most four bytes.
    uint32_t vlq() {
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            uint8_t byte = u8();
            value = (value << 7) | (byte & 0x7F);
            if ((byte & 0x80) == 0) return value;
        }
        throw std::runtime_error("variable-length quantity too long");
    }

    void skip(size_t count) {
        if (count > end_ - pos_) throw std::runtime_error("chunk overruns its length");
        pos_ += count;
    }

    std::array<char, 4> tag() {
        std::array<char, 4> id{};
        for (auto& c : id) c = static_cast<char>(u8());
        return id;
    }

private:
    const std::vector<uint8_t>& bytes_;
    size_t pos_;
    size_t end_;
};

bool tag_is(const std::array<char, 4>& id, const char* expected) {
    return std::equal(id.begin(), id.end(), expected);
}

void read_track(ByteReader& track, std::vector<TimedMessage>& out) {
    uint64_t tick = 0;
    uint8_t running_status = 0;

    while (!track.at_end()) {
        tick += track.vlq();

        uint8_t status = track.peek();
        if (status >= 0x80) {
            track.u8();
        } else if (running_status != 0) {
            status = running_status;
        } else {
            throw std::runtime_error("data byte without running status");
        }

        // Meta and SysEx events cancel running status.
        if (status == 0xFF) {
            running_status = 0;
            const uint8_t type = track.u8();
            const uint32_t length = track.vlq();
            if (type == 0x51 && length == 3) {
                uint32_t tempo = track.u8();
                tempo = (tempo << 8) | track.u8();
                tempo = (tempo << 8) | track.u8();
                out.push_back({tick, TimedMessage::Kind::Tempo, 0, tempo});
            } else if (type == 0x2F) {
                track.skip(length);
                return;
            } else {
                track.skip(length);
            }
            continue;
        }

        if (status == 0xF0 || status == 0xF7) {
            running_status = 0;
            track.skip(track.vlq());
            continue;
        }

        if (status >= 0xF0) {
            throw std::runtime_error("unsupported system message in track");
        }

        running_status = status;
        const uint8_t type = status & 0xF0;
        const uint8_t data1 = track.u8();
        if (type == 0xC0 || type == 0xD0) {
            continue;
        }
        const uint8_t data2 = track.u8();

        const MidiEvent event{status, data1, data2};
        if (event.is_note_on()) {
            out.push_back({tick, TimedMessage::Kind::NoteOn, event.pitch(), 0});
        } else if (event.is_note_off()) {
            out.push_back({tick, TimedMessage::Kind::NoteOff, event.pitch(), 0});
        }
    }
}

} // namespace

bool StandardMidiFile::load_from_file(const std::string& path, std::vector<ScheduledNote>& notes) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[StandardMidiFile] Failed to open file: " << path << std::endl;
        return false;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());

    Summary summary;
    if (!parse(bytes, notes, summary)) {
        std::cerr << "[StandardMidiFile] Error loading MIDI file: " << path << std::endl;
        return false;
    }
    std::cout << "[StandardMidiFile] Loaded " << summary.note_count << " notes. (Total length: "
              << summary.length_seconds << "s)" << std::endl;
    return true;
}

bool StandardMidiFile::parse(const std::vector<uint8_t>& bytes, std::vector<ScheduledNote>& notes) {
    Summary summary;
    return parse(bytes, notes, summary);
}

bool StandardMidiFile::parse(const std::vector<uint8_t>& bytes, std::vector<ScheduledNote>& notes, Summary& summary) {
    try {
        ByteReader file(bytes, 0, bytes.size());

        if (!tag_is(file.tag(), "MThd")) {
            throw std::runtime_error("missing MThd header");
        }
        const uint32_t header_length = file.u32();
        if (header_length < 6) {
            throw std::runtime_error("header chunk too short");
        }
        const uint16_t format = file.u16();
        const uint16_t track_count = file.u16();
        const uint16_t division = file.u16();
        file.skip(header_length - 6);

        if (format > 1) {
            throw std::runtime_error("only format 0 and 1 files are supported");
        }
        if (division == 0) {
            throw std::runtime_error("zero time division");
        }

        std::vector<TimedMessage> messages;
        uint16_t tracks_read = 0;
        while (!file.at_end() && tracks_read < track_count) {
            const auto id = file.tag();
            const uint32_t length = file.u32();
            const size_t begin = file.position();
            file.skip(length);
            if (!tag_is(id, "MTrk")) {
                continue; // Unknown chunk types are skipped
            }
            ByteReader track(bytes, begin, begin + length);
            read_track(track, messages);
            ++tracks_read;
        }
        if (tracks_read < track_count) {
            throw std::runtime_error("file holds fewer tracks than its header declares");
        }

        // Merge tracks; ties keep track order.
        std::stable_sort(messages.begin(), messages.end(),
                         [](const TimedMessage& a, const TimedMessage& b) { return a.tick < b.tick; });

        // SMPTE divisions have a fixed tick length, metrical ones follow the tempo map.
        const bool smpte = (division & 0x8000) != 0;
        double smpte_seconds_per_tick = 0.0;
        if (smpte) {
            const int fps = -static_cast<int8_t>(division >> 8);
            const int ticks_per_frame = division & 0xFF;
            if (fps <= 0 || ticks_per_frame == 0) {
                throw std::runtime_error("invalid SMPTE division");
            }
            smpte_seconds_per_tick = 1.0 / (static_cast<double>(fps) * ticks_per_frame);
        }

        std::vector<ScheduledNote> decoded;
        std::array<double, 128> open_since{};
        std::array<bool, 128> open{};

        uint32_t tempo = kDefaultTempo;
        uint64_t last_tick = 0;
        double seconds = 0.0;

        for (const auto& message : messages) {
            const double ticks = static_cast<double>(message.tick - last_tick);
            seconds += smpte ? ticks * smpte_seconds_per_tick
                             : ticks * (tempo / 1e6) / division;
            last_tick = message.tick;

            switch (message.kind) {
                case TimedMessage::Kind::Tempo:
                    if (message.tempo > 0) tempo = message.tempo;
                    break;
                case TimedMessage::Kind::NoteOn:
                    open[message.pitch] = true;
                    open_since[message.pitch] = seconds;
                    break;
                case TimedMessage::Kind::NoteOff:
                    if (open[message.pitch]) {
                        open[message.pitch] = false;
                        if (seconds > open_since[message.pitch]) {
                            decoded.push_back({message.pitch, open_since[message.pitch], seconds});
                        }
                    }
                    break;
            }
        }

        summary.note_count = decoded.size();
        summary.length_seconds = seconds;
        notes = std::move(decoded);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[StandardMidiFile] Malformed MIDI data: " << e.what() << std::endl;
        return false;
    }
}

} // namespace keyfall::midi
