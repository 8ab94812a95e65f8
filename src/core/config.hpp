#pragma once
#include "pacing.hpp"
#include "../control/limits.hpp"
#include "../hw/servo_map.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Daemon configuration
 *
 * Loaded from a JSON file; every key is optional and falls back to the
 * defaults below. Example:
 *
 *   {
 *     "serial": {"port": "/dev/ttyACM0", "baud": 9600, "simulate": false},
 *     "limits": {"min": 0, "max": 180},
 *     "servos": {"pan": {"channel": 2, "rest": 90}},
 *     "pacing": {"command_settle_ms": 50, "ack_timeout_ms": 100,
 *                "handshake_timeout_ms": 2000, "discrete_step_delay_ms": 150,
 *                "smooth_step_delay_ms": 20, "time_scale": 1.0},
 *     "ipc": {"command_endpoint": "tcp://127.0.0.1:5555",
 *             "event_endpoint": "tcp://127.0.0.1:5556"}
 *   }
 */
struct RobotConfig {
  std::string serial_port{"/dev/ttyACM0"};
  int baud{9600};
  bool simulate{false};          ///< Drive the built-in simulated controller instead of a port
  AngleLimits limits;
  ServoMap servos;
  PacingConfig pacing;
  std::string command_endpoint{"tcp://127.0.0.1:5555"};
  std::string event_endpoint{"tcp://127.0.0.1:5556"};
};

namespace config_detail {

inline std::chrono::milliseconds read_ms(const nlohmann::json& j, const char* key, std::chrono::milliseconds def) {
  if (!j.contains(key)) return def;
  long long v = j.at(key).get<long long>();
  return v < 0 ? def : std::chrono::milliseconds(v);
}

}  // namespace config_detail

/**
 * @brief Build a configuration from parsed JSON
 * @param j Parsed document (non-objects yield defaults)
 * @param warnings Receives one message per ignored or corrected value
 */
inline RobotConfig config_from_json(const nlohmann::json& j, std::vector<std::string>& warnings) {
  using nlohmann::json;
  RobotConfig cfg;
  if (!j.is_object()) {
    warnings.push_back("configuration root is not an object; using defaults");
    return cfg;
  }

  try {
    if (j.contains("serial")) {
      const json& s = j.at("serial");
      cfg.serial_port = s.value("port", cfg.serial_port);
      cfg.baud = s.value("baud", cfg.baud);
      cfg.simulate = s.value("simulate", cfg.simulate);
    }
  } catch (const json::exception& e) {
    warnings.push_back(std::string("serial section ignored: ") + e.what());
    cfg.serial_port = RobotConfig{}.serial_port;
    cfg.baud = RobotConfig{}.baud;
    cfg.simulate = false;
  }

  try {
    if (j.contains("limits")) {
      AngleLimits lim;
      lim.angle_min = j.at("limits").value("min", lim.angle_min);
      lim.angle_max = j.at("limits").value("max", lim.angle_max);
      if (lim.valid()) {
        cfg.limits = lim;
      } else {
        warnings.push_back("limits.min > limits.max; using 0..180");
      }
    }
  } catch (const json::exception& e) {
    warnings.push_back(std::string("limits section ignored: ") + e.what());
  }

  try {
    if (j.contains("pacing")) {
      const json& p = j.at("pacing");
      PacingConfig pc;
      pc.command_settle = config_detail::read_ms(p, "command_settle_ms", pc.command_settle);
      pc.ack_timeout = config_detail::read_ms(p, "ack_timeout_ms", pc.ack_timeout);
      pc.handshake_timeout = config_detail::read_ms(p, "handshake_timeout_ms", pc.handshake_timeout);
      pc.discrete_step_delay = config_detail::read_ms(p, "discrete_step_delay_ms", pc.discrete_step_delay);
      pc.smooth_step_delay = config_detail::read_ms(p, "smooth_step_delay_ms", pc.smooth_step_delay);
      pc.time_scale = p.value("time_scale", pc.time_scale);
      if (pc.time_scale < 0.0) {
        warnings.push_back("pacing.time_scale < 0; using 1.0");
        pc.time_scale = 1.0;
      }
      cfg.pacing = pc;
    }
  } catch (const json::exception& e) {
    warnings.push_back(std::string("pacing section ignored: ") + e.what());
  }

  if (j.contains("servos") && j.at("servos").is_object()) {
    for (auto it = j.at("servos").begin(); it != j.at("servos").end(); ++it) {
      auto servo = cfg.servos.resolve(it.key());
      if (!servo) {
        warnings.push_back("unknown servo in configuration: " + it.key());
        continue;
      }
      try {
        int channel = it.value().value("channel", cfg.servos.channel(*servo));
        auto owner = cfg.servos.by_channel(channel);
        if (owner && *owner != *servo) {
          warnings.push_back("channel " + std::to_string(channel) + " already used by " +
                             cfg.servos.name(*owner) + "; keeping " + it.key() + " on " +
                             std::to_string(cfg.servos.channel(*servo)));
        } else {
          cfg.servos.set_channel(*servo, channel);
        }
        cfg.servos.set_rest_angle(*servo, it.value().value("rest", cfg.servos.rest_angle(*servo)));
      } catch (const json::exception& e) {
        warnings.push_back("servo " + it.key() + " ignored: " + e.what());
      }
    }
  }

  for (const auto& spec : cfg.servos.all()) {
    if (!cfg.limits.contains(spec.rest_angle)) {
      int clamped = cfg.limits.clamp(spec.rest_angle);
      warnings.push_back("rest angle of " + spec.name + " clamped to " + std::to_string(clamped));
      cfg.servos.set_rest_angle(spec.id, clamped);
    }
  }

  try {
    if (j.contains("ipc")) {
      cfg.command_endpoint = j.at("ipc").value("command_endpoint", cfg.command_endpoint);
      cfg.event_endpoint = j.at("ipc").value("event_endpoint", cfg.event_endpoint);
    }
  } catch (const json::exception& e) {
    warnings.push_back(std::string("ipc section ignored: ") + e.what());
  }

  return cfg;
}

/**
 * @brief Load configuration from a file
 *
 * A missing file is not an error (defaults are used). A malformed file
 * yields defaults plus a warning.
 */
inline RobotConfig load_config(const std::string& path, std::vector<std::string>& warnings) {
  std::ifstream in(path);
  if (!in) {
    warnings.push_back("no configuration at " + path + "; using defaults");
    return RobotConfig{};
  }
  std::stringstream ss;
  ss << in.rdbuf();

  auto j = nlohmann::json::parse(ss.str(), nullptr, false);
  if (j.is_discarded()) {
    warnings.push_back("malformed configuration " + path + "; using defaults");
    return RobotConfig{};
  }
  return config_from_json(j, warnings);
}

/**
 * @brief Apply RUFUS_SERIAL_PORT and RUFUS_SIMULATE from the environment
 */
inline void apply_env_overrides(RobotConfig& cfg) {
  if (const char* port = std::getenv("RUFUS_SERIAL_PORT")) {
    if (*port) cfg.serial_port = port;
  }
  if (const char* sim = std::getenv("RUFUS_SIMULATE")) {
    std::string v(sim);
    cfg.simulate = (v == "1" || v == "true" || v == "yes");
  }
}
