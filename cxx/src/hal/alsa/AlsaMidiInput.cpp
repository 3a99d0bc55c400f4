#include "AlsaMidiInput.hpp"
#include <cerrno>
#include <cstdint>
#include <iostream>
#include <memory>

namespace keyfall::hal {

namespace {

struct CtlCloser {
    void operator()(snd_ctl_t* ctl) const { snd_ctl_close(ctl); }
};

struct RawmidiInfoDeleter {
    void operator()(snd_rawmidi_info_t* info) const { snd_rawmidi_info_free(info); }
};

using CtlPtr = std::unique_ptr<snd_ctl_t, CtlCloser>;
using RawmidiInfoPtr = std::unique_ptr<snd_rawmidi_info_t, RawmidiInfoDeleter>;

void list_card_inputs(int card, std::vector<MidiPortInfo>& ports) {
    const std::string ctl_name = "hw:" + std::to_string(card);
    snd_ctl_t* raw_ctl = nullptr;
    int err = snd_ctl_open(&raw_ctl, ctl_name.c_str(), 0);
    if (err < 0) {
        std::cerr << "ALSA: Cannot open control " << ctl_name << " (" << snd_strerror(err) << ")" << std::endl;
        return;
    }
    CtlPtr ctl(raw_ctl);

    snd_rawmidi_info_t* raw_info = nullptr;
    if ((err = snd_rawmidi_info_malloc(&raw_info)) < 0) {
        std::cerr << "ALSA: Cannot allocate rawmidi info (" << snd_strerror(err) << ")" << std::endl;
        return;
    }
    RawmidiInfoPtr info(raw_info);

    int device = -1;
    while (snd_ctl_rawmidi_next_device(ctl.get(), &device) == 0 && device >= 0) {
        snd_rawmidi_info_set_device(info.get(), static_cast<unsigned int>(device));
        snd_rawmidi_info_set_stream(info.get(), SND_RAWMIDI_STREAM_INPUT);
        snd_rawmidi_info_set_subdevice(info.get(), 0);
        if (snd_ctl_rawmidi_info(ctl.get(), info.get()) < 0) {
            continue; // output-only device
        }

        const unsigned int subdevices = snd_rawmidi_info_get_subdevices_count(info.get());
        for (unsigned int sub = 0; sub < subdevices; ++sub) {
            snd_rawmidi_info_set_subdevice(info.get(), sub);
            if (snd_ctl_rawmidi_info(ctl.get(), info.get()) < 0) continue;

            std::string name = snd_rawmidi_info_get_name(info.get());
            const char* sub_name = snd_rawmidi_info_get_subdevice_name(info.get());
            if (subdevices > 1 && sub_name != nullptr && sub_name[0] != '\0') {
                name = sub_name;
            }
            ports.push_back({"hw:" + std::to_string(card) + "," + std::to_string(device) + "," + std::to_string(sub),
                             name});
        }
    }
}

} // namespace

AlsaMidiInput::AlsaMidiInput(const std::string& device)
    : device_name_(device)
{
}

AlsaMidiInput::~AlsaMidiInput() {
    close();
}

bool AlsaMidiInput::open() {
    if (handle_) return true;

    int err = snd_rawmidi_open(&handle_, nullptr, device_name_.c_str(), SND_RAWMIDI_NONBLOCK);
    if (err < 0) {
        std::cerr << "ALSA: Cannot open MIDI input " << device_name_ << " (" << snd_strerror(err) << ")" << std::endl;
        handle_ = nullptr;
        return false;
    }
    parser_.reset();
    std::cout << "ALSA: Connected to MIDI port '" << device_name_ << "'" << std::endl;
    return true;
}

void AlsaMidiInput::close() {
    if (handle_) {
        snd_rawmidi_close(handle_);
        handle_ = nullptr;
    }
    pending_.clear();
}

std::optional<LiveEvent> AlsaMidiInput::poll() {
    if (pending_.empty()) {
        read_pending();
    }
    if (pending_.empty()) {
        return std::nullopt;
    }
    LiveEvent event = pending_.front();
    pending_.pop_front();
    return event;
}

std::vector<MidiPortInfo> AlsaMidiInput::list_inputs() {
    std::vector<MidiPortInfo> ports;
    int card = -1;
    while (snd_card_next(&card) == 0 && card >= 0) {
        list_card_inputs(card, ports);
    }
    return ports;
}

void AlsaMidiInput::read_pending() {
    if (!handle_) return;

    uint8_t buffer[256];
    while (true) {
        ssize_t n = snd_rawmidi_read(handle_, buffer, sizeof(buffer));
        if (n == -EAGAIN || n == 0) {
            return;
        }
        if (n < 0) {
            std::cerr << "ALSA: MIDI read failed on " << device_name_ << " ("
                      << snd_strerror(static_cast<int>(n)) << "), closing port" << std::endl;
            close();
            return;
        }
        parser_.parse(buffer, static_cast<size_t>(n), [this](const midi::MidiEvent& event) {
            if (auto live = LiveEvent::from_midi(event)) {
                pending_.push_back(*live);
            }
        });
        if (static_cast<size_t>(n) < sizeof(buffer)) {
            return;
        }
    }
}

} // namespace keyfall::hal
