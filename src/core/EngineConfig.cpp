#include "EngineConfig.hpp"
#include <cmath>
#include <fstream>
#include <iostream>

namespace handtone {

std::vector<std::string> EngineConfig::validate() const {
    std::vector<std::string> problems;
    if (sample_rate <= 0) problems.push_back("sample_rate must be positive");
    if (block_size <= 0) problems.push_back("block_size must be positive");
    if (channels < 1 || channels > 2) problems.push_back("channels must be 1 or 2");
    if (device.empty()) problems.push_back("device must not be empty");
    if (periods < 2) problems.push_back("periods must be at least 2");
    if (!(smoothing_alpha > 0.0f && smoothing_alpha <= 1.0f)) {
        problems.push_back("smoothing_alpha must be in (0, 1]");
    }
    if (!(min_frequency > 0.0f)) problems.push_back("min_frequency must be positive");
    if (!(max_room_size > 0.0f)) problems.push_back("max_room_size must be positive");
    if (!(reverb_decay >= 0.0f && reverb_decay < 1.0f)) {
        problems.push_back("reverb_decay must be in [0, 1)");
    }
    if (reverb_echoes < 0) problems.push_back("reverb_echoes must not be negative");
    if (!std::isfinite(initial_frequency) || initial_frequency <= 0.0f) {
        problems.push_back("initial_frequency must be positive");
    }
    if (!std::isfinite(initial_amplitude)) problems.push_back("initial_amplitude must be finite");
    if (!std::isfinite(initial_room_size) || initial_room_size < 0.0f) {
        problems.push_back("initial_room_size must not be negative");
    }
    return problems;
}

bool ConfigStore::deserialize(EngineConfig& config, const std::string& data) {
    EngineConfig candidate = config;
    try {
        json j = json::parse(data);
        if (!j.is_object()) {
            std::cerr << "[ConfigStore] Expected a JSON object" << std::endl;
            return false;
        }
        from_json(j, candidate);
    } catch (const json::exception& e) {
        std::cerr << "[ConfigStore] Invalid config: " << e.what() << std::endl;
        return false;
    }

    const auto problems = candidate.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "[ConfigStore] " << problem << std::endl;
        }
        return false;
    }

    config = candidate;
    return true;
}

bool ConfigStore::save_to_file(const EngineConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file for writing: " << path << std::endl;
        return false;
    }
    file << serialize(config);
    return static_cast<bool>(file);
}

bool ConfigStore::load_from_file(EngineConfig& config, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigStore] Failed to open file: " << path << std::endl;
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    bool success = deserialize(config, content);
    if (success) {
        std::cout << "[ConfigStore] Loaded config: " << path << std::endl;
    } else {
        std::cerr << "[ConfigStore] Failed to load config from: " << path << std::endl;
    }
    return success;
}

} // namespace handtone
