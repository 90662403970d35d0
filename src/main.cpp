/**
 * @file main.cpp
 * @brief Demo controller: plays a scripted gesture sweep through the engine.
 *
 * Stands in for the camera front end. Each "video frame" carries targets in
 * the ranges the hand mapping produces (220-880 Hz, amplitude 0.1-0.5,
 * room size 0.1-1.0 s).
 */

#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include "EngineConfig.hpp"
#include "EngineError.hpp"
#include "GestureSession.hpp"
#include "Logger.hpp"
#include "SynthesisEngine.hpp"

namespace {

std::atomic<bool> g_keep_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_keep_running = false;
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--config <path>] [--seconds <n>] [--device <name>]\n"
              << "  --config   JSON engine configuration\n"
              << "  --seconds  How long to play the sweep (default 5)\n"
              << "  --device   ALSA output device (overrides the config)\n";
}

} // namespace

int main(int argc, char* argv[]) {
    handtone::EngineConfig config;
    double seconds = 5.0;
    std::string device_override;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        }
        const std::string value = argv[++i];
        if (arg == "--config") {
            if (!handtone::ConfigStore::load_from_file(config, value)) {
                return 2;
            }
        } else if (arg == "--seconds") {
            char* end = nullptr;
            seconds = std::strtod(value.c_str(), &end);
            if (end == value.c_str() || *end != '\0' || !(seconds > 0.0)) {
                std::cerr << "Invalid --seconds value: " << value << std::endl;
                return 2;
            }
        } else if (arg == "--device") {
            device_override = value;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }
    if (!device_override.empty()) {
        config.device = device_override;
    }

    std::signal(SIGINT, signal_handler);

    handtone::SynthesisEngine engine(config);
    handtone::GestureSession session(engine);
    auto& logger = handtone::AudioLogger::instance();

    constexpr auto frame_period = std::chrono::milliseconds(33);
    const auto start_time = std::chrono::steady_clock::now();
    int exit_code = 0;

    try {
        while (g_keep_running) {
            const double t = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
            if (t >= seconds) break;

            // Slow figure-of-eight of both hands
            const double x = 0.5 + 0.5 * std::sin(2.0 * M_PI * 0.2 * t);
            const double y = 0.5 + 0.5 * std::sin(2.0 * M_PI * 0.1 * t);
            const double pinch = 0.5 + 0.5 * std::cos(2.0 * M_PI * 0.15 * t);

            handtone::GestureFrame frame;
            frame.left_hand_present = true;
            frame.right_hand_present = true;
            frame.frequency = static_cast<float>(220.0 + (880.0 - 220.0) * x);
            frame.amplitude = static_cast<float>(0.1 + 0.4 * y);
            frame.room_size = static_cast<float>(0.1 + 0.9 * pinch);

            if (session.on_frame(frame)) {
                const auto params = engine.parameters().snapshot();
                std::cout << "freq " << params.frequency << " Hz, amp " << params.amplitude
                          << ", room " << params.room_size << " s" << std::endl;
            }

            logger.flush(std::cerr);
            std::this_thread::sleep_for(frame_period);
        }

        // Hands gone
        session.on_frame(handtone::GestureFrame{});
    } catch (const handtone::DeviceUnavailable& e) {
        std::cerr << "Cannot start audio: " << e.what() << std::endl;
        exit_code = 1;
    } catch (const handtone::StreamFault& e) {
        std::cerr << "Audio stream failed: " << e.what() << std::endl;
        exit_code = 1;
    }

    logger.flush(std::cerr);
    std::cout << "Rendered " << engine.blocks_rendered() << " blocks" << std::endl;
    return exit_code;
}
