#include "NoteTimeline.hpp"
#include <algorithm>
#include <cmath>

namespace keyfall {

bool NoteTimeline::is_valid(const ScheduledNote& note) {
    return note.pitch >= 0 && note.pitch <= 127
        && std::isfinite(note.start_time) && std::isfinite(note.end_time)
        && note.start_time >= 0.0
        && note.end_time > note.start_time;
}

bool NoteTimeline::load(const std::vector<ScheduledNote>& notes) {
    if (!std::all_of(notes.begin(), notes.end(), is_valid)) {
        return false;
    }

    std::vector<NoteEvent> events;
    events.reserve(notes.size());
    for (const auto& note : notes) {
        events.push_back({note, NoteEvent::State::Pending});
    }
    events_ = std::move(events);
    return true;
}

Resolution NoteTimeline::resolve(double current_time) {
    Resolution result;

    for (auto& event : events_) {
        const auto& note = event.note;

        if (event.state == NoteEvent::State::Pending && current_time >= note.start_time) {
            event.state = NoteEvent::State::Started;
            result.to_start.insert(note.pitch);
        }
        if (event.state == NoteEvent::State::Started && current_time >= note.end_time) {
            event.state = NoteEvent::State::Stopped;
            result.to_stop.insert(note.pitch);
        }
        if (note.start_time <= current_time && current_time < note.end_time) {
            result.sounding.insert(note.pitch);
        }
    }
    return result;
}

void NoteTimeline::reset() {
    for (auto& event : events_) {
        event.state = NoteEvent::State::Pending;
    }
}

void NoteTimeline::rewind(double loop_start, double loop_end) {
    for (auto& event : events_) {
        if (loop_start <= event.note.start_time && event.note.start_time < loop_end) {
            event.state = NoteEvent::State::Pending;
        }
    }
}

double NoteTimeline::duration() const {
    double end = 0.0;
    for (const auto& event : events_) {
        end = std::max(end, event.note.end_time);
    }
    return end;
}

} // namespace keyfall
