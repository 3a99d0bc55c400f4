/**
 * @file StandardMidiFile.hpp
 * @brief Decodes a Standard MIDI File into timed notes.
 */

#ifndef KEYFALL_STANDARD_MIDI_FILE_HPP
#define KEYFALL_STANDARD_MIDI_FILE_HPP

#include "core/NoteTimeline.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace keyfall::midi {

/**
 * @brief Reader for format 0 and format 1 Standard MIDI Files.
 *
 * All tracks are merged, delta ticks are converted to seconds through the
 * tempo map (Set Tempo meta events, default 120 BPM) and note-on/note-off
 * pairs become ScheduledNote entries in the order they close. A note-on for
 * a pitch that is already open restarts it; note-ons never closed and
 * zero-length notes are dropped.
 */
class StandardMidiFile {
public:
    struct Summary {
        size_t note_count = 0;
        double length_seconds = 0.0; ///< Time of the last note or tempo event
    };

    /**
     * @brief Read and decode a file.
     * @return false if the file cannot be read or is malformed; notes is
     *         left untouched in that case.
     */
    static bool load_from_file(const std::string& path, std::vector<ScheduledNote>& notes);

    /**
     * @brief Decode an in-memory file image.
     */
    static bool parse(const std::vector<uint8_t>& bytes, std::vector<ScheduledNote>& notes);
    static bool parse(const std::vector<uint8_t>& bytes, std::vector<ScheduledNote>& notes, Summary& summary);
};

} // namespace keyfall::midi

#endif // KEYFALL_STANDARD_MIDI_FILE_HPP
