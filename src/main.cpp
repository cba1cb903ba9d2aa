/**
 * @file main.cpp
 * @brief masterhand_replay: replays a landmark recording through the gesture
 *        state machine and forwards each frame result over UDP
 */

#include "masterhand/masterhand.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace masterhand;

namespace {

std::atomic<bool> stop_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        stop_requested = true;
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " <recording.jsonl> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE       YAML configuration file\n"
              << "  --policy NAME       Snap policy: edge | velocity\n"
              << "  --host ADDR         Event sink IPv4 address (default 127.0.0.1)\n"
              << "  --port N            Event sink UDP port (default 5005)\n"
              << "  --landmarks-only    Relay landmarks without gesture/snap fields\n"
              << "  --log-dir DIR       Also write a timestamped log file into DIR\n"
              << "  --help              Show this message\n";
}

void print_statistics(const io::PipelineStats& stats) {
    std::cout << "\n";
    std::cout << "=======================================" << std::endl;
    std::cout << "           REPLAY STATISTICS           " << std::endl;
    std::cout << "=======================================" << std::endl;
    std::cout << std::left;
    std::cout << std::setw(22) << "Frames processed:" << stats.frames_read << std::endl;
    std::cout << std::setw(22) << "Frames skipped:" << stats.frames_skipped << std::endl;
    std::cout << std::setw(22) << "Empty frames:" << stats.empty_frames << std::endl;
    std::cout << std::setw(22) << "Payloads published:" << stats.payloads_published << std::endl;
    std::cout << std::setw(22) << "Publish failures:" << stats.publish_failures << std::endl;
    std::cout << std::setw(22) << "Snap frames:" << stats.snaps << std::endl;
    std::cout << "=======================================" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);

    auto& config = core::Config::getInstance();
    config.initializeDefaults();

    std::string recording_path;
    std::string config_path;
    std::string policy_override;
    std::string host_override;
    std::string log_dir_override;
    long port_override = -1;
    bool landmarks_only = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto need_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << flag << std::endl;
                std::exit(1);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            config_path = need_value(arg);
        } else if (arg == "--policy") {
            policy_override = need_value(arg);
        } else if (arg == "--host") {
            host_override = need_value(arg);
        } else if (arg == "--port") {
            const std::string value = need_value(arg);
            char* end = nullptr;
            port_override = std::strtol(value.c_str(), &end, 10);
            if (end == value.c_str() || *end != '\0' || port_override <= 0 || port_override > 65535) {
                std::cerr << "Invalid port: " << value << std::endl;
                return 1;
            }
        } else if (arg == "--landmarks-only") {
            landmarks_only = true;
        } else if (arg == "--log-dir") {
            log_dir_override = need_value(arg);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else if (recording_path.empty()) {
            recording_path = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return 1;
        }
    }

    if (recording_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    if (!config_path.empty()) {
        core::ResultCode rc = config.loadFromFile(config_path);
        if (rc != core::ResultCode::SUCCESS) {
            std::cerr << "Failed to load config " << config_path << ": "
                      << core::resultCodeToString(rc) << std::endl;
            return 1;
        }
    }

    // Command line wins over the file
    if (!policy_override.empty()) {
        config.setValue(core::config_keys::SNAP_POLICY, policy_override);
    }
    if (!host_override.empty()) {
        config.setValue(core::config_keys::SINK_HOST, host_override);
    }
    if (port_override > 0) {
        config.setValue(core::config_keys::SINK_PORT, static_cast<uint32_t>(port_override));
    }
    if (landmarks_only) {
        config.setValue(core::config_keys::GESTURE_CLASSIFY, false);
        config.setValue(core::config_keys::SNAP_ENABLED, false);
    }
    if (!log_dir_override.empty()) {
        config.setValue(core::config_keys::SYSTEM_LOG_DIRECTORY, log_dir_override);
    }

    auto& logger = core::Logger::getInstance();
    core::LogLevel level = core::LogLevel::INFO;
    const std::string level_name = config.getValue<std::string>(core::config_keys::SYSTEM_LOG_LEVEL, "info");
    if (!core::parseLogLevel(level_name, level)) {
        std::cerr << "Unknown log level '" << level_name << "', using info" << std::endl;
    }
    logger.setLevel(level);

    const std::string log_dir = config.getValue<std::string>(core::config_keys::SYSTEM_LOG_DIRECTORY, "");
    if (!log_dir.empty()) {
        if (logger.initializeWithTimestamp(log_dir, level)) {
            logger.info("Log file: " + logger.getCurrentLogFile());
        } else {
            std::cerr << "[LOGGING] Warning: File logging initialization failed, using console only" << std::endl;
        }
    }

    gesture::EngineConfig engine_config;
    try {
        engine_config = gesture::make_engine_config(config);
    } catch (const core::ConfigException& e) {
        MASTERHAND_LOG_CRITICAL(e.what());
        return 1;
    }

    const int64_t port = config.getInt(core::config_keys::SINK_PORT, io::UdpEventSink::DEFAULT_PORT);
    if (port <= 0 || port > 65535) {
        MASTERHAND_LOG_CRITICAL("Invalid sink port " + std::to_string(port));
        return 1;
    }
    io::UdpEventSink sink(config.getValue<std::string>(core::config_keys::SINK_HOST, io::UdpEventSink::DEFAULT_HOST),
                          static_cast<uint16_t>(port));
    core::ResultCode rc = sink.open();
    if (rc != core::ResultCode::SUCCESS) {
        MASTERHAND_LOG_CRITICAL("Failed to open event sink: " + core::resultCodeToString(rc));
        return 1;
    }

    try {
        io::ReplayFrameSource source(recording_path);

        gesture::GestureStateMachine machine(engine_config);
        machine.set_snap_callback([](const gesture::SnapEvent& event, void*) {
            std::ostringstream oss;
            oss << "Snap detected! Hand: " << gesture::hand_side_to_string(event.side)
                << ", velocity: " << std::fixed << std::setprecision(4) << event.middle_tip_velocity
                << ", frame: " << event.frame_index;
            MASTERHAND_LOG_INFO(oss.str());
        });

        MASTERHAND_LOG_INFO("Replaying " + recording_path + " (policy " +
                            gesture::snap_policy_to_string(engine_config.snap.policy) + ")");

        io::GesturePipeline pipeline(source, machine, sink, io::payload_options_for(engine_config));
        io::PipelineStats stats = pipeline.run(&stop_requested);
        print_statistics(stats);
    } catch (const core::Exception& e) {
        MASTERHAND_LOG_CRITICAL(e.what());
        return 1;
    }

    logger.flush();
    return 0;
}
