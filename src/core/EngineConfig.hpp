/**
 * @file EngineConfig.hpp
 * @brief Engine configuration and its JSON persistence.
 */

#ifndef HANDTONE_ENGINE_CONFIG_HPP
#define HANDTONE_ENGINE_CONFIG_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace handtone {

using json = nlohmann::json;

/**
 * @brief Everything needed to open the stream and run the synthesis loop.
 *
 * Stream values are requests; the driver may negotiate different ones.
 */
struct EngineConfig {
    // Stream
    int sample_rate = 16000;
    int block_size = 1024;
    int channels = 1;
    std::string device = "default";
    int periods = 4;
    int realtime_priority = 80;

    // Control
    float smoothing_alpha = 0.2f;
    float min_frequency = 20.0f;
    float max_room_size = 10.0f;

    // Reverb
    float reverb_decay = 0.6f;
    int reverb_echoes = 5;

    // Parameter values before the first update
    float initial_frequency = 440.0f;
    float initial_amplitude = 0.2f;
    float initial_room_size = 0.3f;

    /**
     * @brief List configuration problems. Empty means valid.
     */
    std::vector<std::string> validate() const;
};

inline void to_json(json& j, const EngineConfig& c) {
    j = json{
        {"sample_rate", c.sample_rate},
        {"block_size", c.block_size},
        {"channels", c.channels},
        {"device", c.device},
        {"periods", c.periods},
        {"realtime_priority", c.realtime_priority},
        {"smoothing_alpha", c.smoothing_alpha},
        {"min_frequency", c.min_frequency},
        {"max_room_size", c.max_room_size},
        {"reverb_decay", c.reverb_decay},
        {"reverb_echoes", c.reverb_echoes},
        {"initial_frequency", c.initial_frequency},
        {"initial_amplitude", c.initial_amplitude},
        {"initial_room_size", c.initial_room_size}
    };
}

// Missing keys keep the value already held by c.
inline void from_json(const json& j, EngineConfig& c) {
    c.sample_rate = j.value("sample_rate", c.sample_rate);
    c.block_size = j.value("block_size", c.block_size);
    c.channels = j.value("channels", c.channels);
    c.device = j.value("device", c.device);
    c.periods = j.value("periods", c.periods);
    c.realtime_priority = j.value("realtime_priority", c.realtime_priority);
    c.smoothing_alpha = j.value("smoothing_alpha", c.smoothing_alpha);
    c.min_frequency = j.value("min_frequency", c.min_frequency);
    c.max_room_size = j.value("max_room_size", c.max_room_size);
    c.reverb_decay = j.value("reverb_decay", c.reverb_decay);
    c.reverb_echoes = j.value("reverb_echoes", c.reverb_echoes);
    c.initial_frequency = j.value("initial_frequency", c.initial_frequency);
    c.initial_amplitude = j.value("initial_amplitude", c.initial_amplitude);
    c.initial_room_size = j.value("initial_room_size", c.initial_room_size);
}

/**
 * @brief Saves and loads EngineConfig as JSON.
 */
class ConfigStore {
public:
    static bool save_to_file(const EngineConfig& config, const std::string& path);
    static bool load_from_file(EngineConfig& config, const std::string& path);

    static std::string serialize(const EngineConfig& config) {
        json j = config;
        return j.dump(4);
    }

    /**
     * @brief Parse and validate a JSON document on top of the current config.
     *
     * On failure the config is left untouched.
     */
    static bool deserialize(EngineConfig& config, const std::string& data);
};

} // namespace handtone

#endif // HANDTONE_ENGINE_CONFIG_HPP
