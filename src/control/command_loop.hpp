#pragma once
#include "api.hpp"
#include "gestures.hpp"
#include <atomic>
#include <cctype>
#include <cstdint>
#include <chrono>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Command front end: JSON requests and console lines into motion calls
 *
 * handle_cmd() implements the request/response contract of the remote
 * surface; handle_line() implements the interactive console. run() serves
 * handle_cmd() from a REP-style socket and publishes an event per request.
 * Both surfaces may be active at once; the executor serializes playback.
 */
struct CommandLoop {
  CompanionAPI& api;                        ///< Motion entry points
  std::atomic<bool> running{true};          ///< Cleared by stop()
  std::atomic<uint64_t> commands_handled{0};
  std::atomic<uint64_t> commands_rejected{0};  ///< Malformed or unknown requests
  std::chrono::steady_clock::time_point t0{std::chrono::steady_clock::now()};

  explicit CommandLoop(CompanionAPI& a) : api(a) {}

  /**
   * @brief Serve requests until stop()
   * @param pub Event publisher (needs send(string))
   * @param rep Request socket (needs wait_for_request(int), recv(), reply(string))
   * @param poll_ms How long each poll may block before re-checking running
   */
  template<class Pub, class Rep>
  void run(Pub& pub, Rep& rep, int poll_ms = 100) {
    while (running.load(std::memory_order_relaxed)) {
      if (!rep.wait_for_request(poll_ms)) continue;

      std::string request = rep.recv();
      std::string response = handle_cmd(request);
      rep.reply(response);

      pub.send(make_event(request, response));
    }
  }

  void stop() { running.store(false); }

  /**
   * @brief Build the event published after a request
   */
  std::string make_event(const std::string& request, const std::string& response) const {
    auto req = json::parse(request, nullptr, false);
    auto resp = json::parse(response, nullptr, false);
    double t = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    json ev = {
      {"t", t},
      {"cmd", (req.is_object() && req.contains("cmd") && req["cmd"].is_string()) ? req["cmd"].get<std::string>() : std::string("invalid")},
      {"success", resp.is_object() && resp.value("success", resp.contains("status"))},
      {"link_state", state_to_string(api.link.state())}
    };
    return ev.dump();
  }

  /**
   * @brief Handle one JSON request
   * @param s Request text
   * @return JSON response text
   */
  std::string handle_cmd(const std::string& s) {
    auto j = json::parse(s, nullptr, false);
    if (!j.is_object() || !j.contains("cmd") || !j["cmd"].is_string()) {
      return reject("malformed request");
    }
    try {
      return dispatch(j["cmd"].get<std::string>(), j);
    } catch (const json::exception& e) {
      return reject(std::string("bad request field: ") + e.what());
    }
  }

  /**
   * @brief Route a parsed request by its "cmd"
   */
  std::string dispatch(const std::string& cmd, const json& j) {
    if (cmd == "set_servo") {
      if (!j.contains("servo") || !j["servo"].is_string() ||
          !j.contains("angle") || !j["angle"].is_number_integer()) {
        return reject("servo (string) and angle (integer) required");
      }
      commands_handled.fetch_add(1);
      auto angle = angle_field(j["angle"]);
      if (!angle) return json{{"success", false}, {"error", error_to_string(LinkError::OUT_OF_RANGE)}}.dump();
      auto r = api.set_servo(j["servo"].get<std::string>(), *angle);
      if (r.success) return json{{"success", true}}.dump();
      if (r.error == LinkError::UNKNOWN_ACTUATOR) return json{{"success", false}, {"error", "Unknown servo"}}.dump();
      return json{{"success", false}, {"error", error_to_string(r.error)}}.dump();
    } else if (cmd == "gesture") {
      std::string name = j.value("gesture", std::string());
      commands_handled.fetch_add(1);
      return gesture_response(api.trigger_gesture(name));
    } else if (cmd == "smooth_gesture") {
      std::string name = j.value("gesture", std::string());
      commands_handled.fetch_add(1);
      return gesture_response(api.smooth_gesture(name));
    } else if (cmd == "mood") {
      std::string name = j.value("mood", std::string());
      commands_handled.fetch_add(1);
      return gesture_response(api.mood(name));
    } else if (cmd == "react") {
      std::string tag = j.value("tag", std::string("neutral"));
      commands_handled.fetch_add(1);
      return gesture_response(api.react(tag));
    } else if (cmd == "health") {
      commands_handled.fetch_add(1);
      return json{
        {"status", "healthy"},
        {"arduino_connected", api.arduino_connected()},
        {"link_state", state_to_string(api.link.state())}
      }.dump();
    } else if (cmd == "get_status") {
      commands_handled.fetch_add(1);
      return status().dump();
    } else if (cmd == "list_gestures") {
      commands_handled.fetch_add(1);
      json gestures = json::array();
      json moods = json::array();
      for (Gesture g : all_gestures()) {
        gestures.push_back(gesture_name(g));
        if (is_mood(g)) moods.push_back(gesture_name(g));
      }
      json servos = json::array();
      for (const auto& spec : api.link.servos().all()) servos.push_back(spec.name);
      return json{{"success", true}, {"gestures", gestures}, {"moods", moods}, {"servos", servos}}.dump();
    }
    return reject("unknown command: " + cmd);
  }

  /**
   * @brief Link statistics and last known angles
   */
  json status() const {
    auto st = api.link.get_statistics();
    json angles = json::object();
    for (const auto& spec : api.link.servos().all()) {
      auto last = api.link.last_angle(spec.id);
      angles[spec.name] = last ? json(*last) : json(nullptr);
    }
    return json{
      {"success", true},
      {"link_state", state_to_string(api.link.state())},
      {"handshake_received", api.link.handshake_received()},
      {"port", api.link.port_path()},
      {"gestures_performed", api.executor.performed_count()},
      {"commands_handled", commands_handled.load()},
      {"commands_rejected", commands_rejected.load()},
      {"last_angles", angles},
      {"link_stats", {
        {"total", st.total_commands},
        {"successful", st.successful_commands},
        {"errors", st.error_count},
        {"not_connected", st.not_connected},
        {"range_violations", st.range_violations},
        {"ack_failures", st.ack_failures},
        {"write_failures", st.write_failures},
        {"mean_command_time_us", st.mean_command_time_us}
      }}
    };
  }

  /**
   * @brief Handle one console line
   *
   * Accepted forms: "<gesture>", "mood <name>", "servo <name> <angle>",
   * "react <yes|no|neutral>", "health", "status", "help", "exit".
   *
   * @param line Input line
   * @param quit Set to true on "exit"/"quit"
   * @return Text to show the operator
   */
  std::string handle_line(const std::string& line, bool& quit) {
    std::istringstream in(line);
    std::string word;
    if (!(in >> word)) return "";

    for (auto& c : word) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (word == "exit" || word == "quit") {
      quit = true;
      return "Goodbye! Powering down servos.";
    }
    if (word == "help") {
      return "commands: <gesture> | mood <name> | servo <name> <angle> | react <yes|no|neutral> | health | status | exit";
    }
    if (word == "health") {
      return api.arduino_connected() ? "servo controller connected" : "servo controller not connected";
    }
    if (word == "status") {
      return status().dump(2);
    }
    if (word == "servo") {
      std::string name;
      int angle = 0;
      if (!(in >> name >> angle)) return "usage: servo <name> <angle>";
      auto r = api.set_servo(name, angle);
      return r.success ? "ok" : "failed: " + error_to_string(r.error);
    }
    if (word == "mood" || word == "react") {
      std::string arg;
      in >> arg;
      auto r = (word == "mood") ? api.mood(arg) : api.react(arg);
      return describe(r);
    }
    if (parse_gesture(word)) {
      return describe(api.smooth_gesture(word));
    }
    commands_rejected.fetch_add(1);
    return "unknown command: " + word + " (try help)";
  }

private:
  // Integer angle that fits in an int; nullopt for anything wider.
  static std::optional<int> angle_field(const json& v) {
    if (v.is_number_unsigned()) {
      auto u = v.get<uint64_t>();
      if (u > static_cast<uint64_t>(std::numeric_limits<int>::max())) return std::nullopt;
      return static_cast<int>(u);
    }
    auto n = v.get<int64_t>();
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) return std::nullopt;
    return static_cast<int>(n);
  }

  std::string reject(const std::string& why) {
    commands_rejected.fetch_add(1);
    return json{{"success", false}, {"error", why}}.dump();
  }

  static std::string gesture_response(const GestureResult& r) {
    if (!r.recognized) return json{{"success", false}, {"error", "Unknown gesture"}}.dump();
    return json{{"success", r.success}, {"steps_sent", r.steps_sent}, {"steps_failed", r.steps_failed}}.dump();
  }

  static std::string describe(const GestureResult& r) {
    if (!r.recognized) return "unknown gesture: " + r.name;
    std::string out = r.name + " complete";
    if (r.steps_failed > 0) {
      out += " (" + std::to_string(r.steps_failed) + "/" + std::to_string(r.steps_sent) +
             " steps failed: " + error_to_string(r.error) + ")";
    }
    return out;
  }
};
