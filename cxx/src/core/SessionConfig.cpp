#include "SessionConfig.hpp"
#include <fstream>
#include <iostream>
#include <iterator>

namespace keyfall {

std::string SessionConfig::validate() const {
    if (sample_directory.empty()) return "sample_directory must not be empty";
    if (sample_count <= 0) return "sample_count must be positive";
    if (sample_first_pitch < 0 || sample_first_pitch + sample_count > SampleBank::kPitchCount) {
        return "sample pitches must stay within 0..127";
    }
    if (block_size <= 0) return "block_size must be positive";
    if (!(tick_rate_hz > 0.0)) return "tick_rate_hz must be positive";
    if (!(rate_step > 0.0)) return "rate_step must be positive";
    return {};
}

bool ConfigStore::deserialize(SessionConfig& config, const std::string& data) {
    try {
        json j = json::parse(data);
        SessionConfig parsed = j.get<SessionConfig>();
        const std::string problem = parsed.validate();
        if (!problem.empty()) {
            std::cerr << "[ConfigStore] Invalid configuration: " << problem << std::endl;
            return false;
        }
        config = parsed;
        return true;
    } catch (const json::exception& e) {
        std::cerr << "[ConfigStore] " << e.what() << std::endl;
        return false;
    }
}

bool ConfigStore::save_to_file(const SessionConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file for writing: " << path << std::endl;
        return false;
    }
    file << serialize(config);
    return static_cast<bool>(file);
}

bool ConfigStore::load_from_file(SessionConfig& config, const std::string& path) {
    std::cout << "[ConfigStore] Attempting to load: " << path << std::endl;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file: " << path << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (!deserialize(config, content)) {
        std::cerr << "[ConfigStore] Failed to deserialize configuration from: " << path << std::endl;
        return false;
    }
    return true;
}

} // namespace keyfall
