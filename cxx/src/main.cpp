/**
 * @file main.cpp
 * @brief Practice session: plays a MIDI file from samples while a live
 *        keyboard plays along, both mixed into one ALSA output.
 */

#include "core/Logger.hpp"
#include "core/SampleBank.hpp"
#include "core/Scheduler.hpp"
#include "core/SessionConfig.hpp"
#include "core/VoiceMixer.hpp"
#include "hal/alsa/AlsaDriver.hpp"
#include "hal/alsa/AlsaMidiInput.hpp"
#include "midi/StandardMidiFile.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace keyfall;

namespace {

// Silence left after the last note before the session ends on its own.
constexpr double kTailSeconds = 3.0;

std::atomic<bool> g_keep_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_keep_running = false;
    }
}

void print_status(const SessionSnapshot& snap) {
    std::cout << std::fixed << std::setprecision(1)
              << "t=" << snap.current_time << "s  rate=" << snap.rate << "x";
    if (snap.loop_start) {
        std::cout << "  loop=" << *snap.loop_start << "s";
        if (snap.loop_end) std::cout << "-" << *snap.loop_end << "s";
    }
    std::cout << "  sounding=" << snap.sounding.size()
              << "  held=" << snap.held.size();
    if (snap.paused) std::cout << "  [ PAUSED ]";
    std::cout << std::endl;
}

void print_controls() {
    std::cout << "Controls (type a letter, then Enter):\n"
              << "  p pause/resume   r restart   q quit\n"
              << "  + faster   - slower\n"
              << "  [ loop start   ] loop end   c clear loop\n"
              << "  m timeline audio on/off   u live audio on/off" << std::endl;
}

// Returns false when the user asked to quit.
bool handle_command(char command, Scheduler& scheduler, const SessionConfig& config) {
    auto& transport = scheduler.transport();
    switch (command) {
        case 'q':
            return false;
        case 'p':
            transport.toggle_pause();
            break;
        case 'r':
            scheduler.restart();
            std::cout << "Playback restarted." << std::endl;
            break;
        case '+':
        case '=':
            transport.adjust_rate(config.rate_step);
            break;
        case '-':
            transport.adjust_rate(-config.rate_step);
            break;
        case '[':
            transport.set_loop_start();
            break;
        case ']':
            if (!transport.set_loop_end()) {
                std::cout << "Loop end must come after the loop start." << std::endl;
            }
            break;
        case 'c':
            transport.clear_loop();
            break;
        case 'm':
            scheduler.set_timeline_audio_enabled(!scheduler.timeline_audio_enabled());
            std::cout << "MIDI Audio: " << (scheduler.timeline_audio_enabled() ? "ON" : "OFF") << std::endl;
            break;
        case 'u':
            scheduler.set_live_audio_enabled(!scheduler.live_audio_enabled());
            std::cout << "User Audio: " << (scheduler.live_audio_enabled() ? "ON" : "OFF") << std::endl;
            break;
        default:
            break;
    }
    return true;
}

// Non-blocking: handles whatever is buffered on stdin and returns.
bool poll_console(Scheduler& scheduler, const SessionConfig& config) {
    pollfd fd{STDIN_FILENO, POLLIN, 0};
    while (::poll(&fd, 1, 0) > 0 && (fd.revents & POLLIN)) {
        char buffer[64];
        ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
        if (n <= 0) return true; // stdin closed, keep playing
        for (ssize_t i = 0; i < n; ++i) {
            if (!handle_command(buffer[i], scheduler, config)) return false;
        }
    }
    return true;
}

int list_midi_inputs() {
    const auto ports = hal::AlsaMidiInput::list_inputs();
    if (ports.empty()) {
        std::cout << "No MIDI input ports found." << std::endl;
        return 0;
    }
    std::cout << "MIDI input ports:" << std::endl;
    for (const auto& port : ports) {
        std::cout << "  " << std::left << std::setw(12) << port.device << " " << port.name << std::endl;
    }
    return 0;
}

// The configured value may be a device ("hw:1,0,0") or part of a port name.
std::unique_ptr<hal::AlsaMidiInput> open_midi_input(const std::string& configured) {
    std::string device = configured;
    if (auto match = hal::select_midi_port(hal::AlsaMidiInput::list_inputs(), configured)) {
        device = *match;
    }

    auto input = std::make_unique<hal::AlsaMidiInput>(device);
    if (!input->open()) {
        std::cerr << "Warning: Could not open MIDI device '" << configured
                  << "', continuing without live input." << std::endl;
        return nullptr;
    }
    return input;
}

int run(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "--list-midi") {
        return list_midi_inputs();
    }
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file.mid> [config.json]\n"
                  << "       " << argv[0] << " --list-midi" << std::endl;
        return 2;
    }

    SessionConfig config;
    if (argc >= 3 && !ConfigStore::load_from_file(config, argv[2])) {
        return 1;
    }

    std::vector<ScheduledNote> notes;
    if (!midi::StandardMidiFile::load_from_file(argv[1], notes)) {
        return 1;
    }

    // Startup-fatal: throws when the directory yields no sample at all.
    SampleBank bank = SampleBank::load(config.sample_directory, config.sample_layout());

    VoiceMixer mixer(bank);

    hal::AlsaDriver driver(bank.sample_rate(), config.block_size, config.audio_device);
    driver.set_render_callback([&mixer](std::span<float> block) {
        mixer.render(block);
    });
    if (!driver.start()) {
        throw std::runtime_error("cannot open audio output " + config.audio_device);
    }
    if (driver.sample_rate() != bank.sample_rate()) {
        driver.stop();
        throw std::runtime_error("audio device runs at " + std::to_string(driver.sample_rate())
                                 + " Hz but samples are " + std::to_string(bank.sample_rate()) + " Hz");
    }
    std::cout << "Low-latency audio stream started." << std::endl;

    std::unique_ptr<hal::AlsaMidiInput> midi_input;
    if (!config.midi_input_device.empty()) {
        midi_input = open_midi_input(config.midi_input_device);
    }

    Scheduler scheduler(mixer, midi_input.get());
    scheduler.set_timeline_audio_enabled(config.timeline_audio);
    scheduler.set_live_audio_enabled(config.live_audio);
    if (!scheduler.load(notes)) {
        driver.stop();
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    using clock = std::chrono::steady_clock;
    const auto period = std::chrono::duration_cast<clock::duration>(
        std::chrono::duration<double>(1.0 / config.tick_rate_hz));
    const double end_time = scheduler.timeline().duration() + kTailSeconds;

    print_controls();

    auto last = clock::now();
    auto next_tick = last + period;
    auto next_status = last;

    while (g_keep_running) {
        std::this_thread::sleep_until(next_tick);
        next_tick += period;

        const auto now = clock::now();
        const double dt = std::chrono::duration<double>(now - last).count();
        last = now;

        if (!poll_console(scheduler, config)) {
            break;
        }
        scheduler.tick(dt);
        AudioLogger::instance().flush(std::cerr);

        const auto& transport = scheduler.transport();
        if (now >= next_status) {
            print_status(scheduler.snapshot());
            next_status = now + std::chrono::seconds(1);
        }
        if (!transport.has_loop() && transport.current_time() >= end_time) {
            break;
        }
    }

    scheduler.stop();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    driver.stop();
    AudioLogger::instance().flush(std::cerr);
    std::cout << "Playback finished." << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
}
