#pragma once
#include "iserial_port.hpp"
#include "servo_map.hpp"
#include "../control/limits.hpp"
#include "../core/diagnostics.hpp"
#include "../core/history.hpp"
#include "../core/pacing.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Connection state of the actuator link
 */
enum class LinkState {
    Disconnected = 0,   ///< No open port (initial state, or after an I/O error)
    Connected,          ///< Port open, waiting for the READY handshake
    Ready               ///< Commands may be sent
};

/**
 * @brief Outcome codes for link, motion and gesture operations
 */
enum class LinkError {
    OK = 0,                ///< Command acknowledged
    NOT_CONNECTED,         ///< No open link; nothing was written
    PORT_OPEN_FAILED,      ///< Serial device could not be opened
    INVALID_BAUD,          ///< Requested baud rate is not a standard UART rate
    WRITE_FAILURE,         ///< I/O error on the port; the link is now disconnected
    ACK_TIMEOUT,           ///< Command written, no reply within the ack window
    NACK,                  ///< Device replied with something other than OK
    OUT_OF_RANGE,          ///< Angle outside the configured limits; nothing was written
    UNKNOWN_ACTUATOR,      ///< Servo name or channel not in the actuator table
    UNKNOWN_GESTURE        ///< Gesture or mood name not in the catalog
};

inline std::string error_to_string(LinkError error) {
    switch (error) {
        case LinkError::OK: return "OK";
        case LinkError::NOT_CONNECTED: return "NOT_CONNECTED";
        case LinkError::PORT_OPEN_FAILED: return "PORT_OPEN_FAILED";
        case LinkError::INVALID_BAUD: return "INVALID_BAUD";
        case LinkError::WRITE_FAILURE: return "WRITE_FAILURE";
        case LinkError::ACK_TIMEOUT: return "ACK_TIMEOUT";
        case LinkError::NACK: return "NACK";
        case LinkError::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case LinkError::UNKNOWN_ACTUATOR: return "UNKNOWN_ACTUATOR";
        case LinkError::UNKNOWN_GESTURE: return "UNKNOWN_GESTURE";
        default: return "INVALID_ERROR";
    }
}

inline std::string state_to_string(LinkState state) {
    switch (state) {
        case LinkState::Disconnected: return "disconnected";
        case LinkState::Connected: return "connected";
        case LinkState::Ready: return "ready";
        default: return "invalid";
    }
}

/**
 * @brief Result of a single servo command
 */
struct CommandResult {
    bool success{false};
    int channel{-1};
    int angle{0};
    LinkError error{LinkError::OK};
    std::string reply;                                   ///< Raw acknowledgment line, if any
    std::chrono::steady_clock::time_point timestamp;

    CommandResult() : timestamp(std::chrono::steady_clock::now()) {}

    CommandResult(bool succ, int ch, int ang, LinkError err, std::string rep = {})
        : success(succ), channel(ch), angle(ang), error(err)
        , reply(std::move(rep)), timestamp(std::chrono::steady_clock::now()) {}

    explicit operator bool() const { return success; }
};

/**
 * @brief Owner of the serial channel to the servo microcontroller
 *
 * Every command is a write of "<channel>:<angle>\n", a short settle pause and
 * a wait for one acknowledgment line starting with "OK". The whole exchange
 * runs under the link mutex, so concurrent callers never interleave bytes on
 * the wire and never steal each other's acknowledgments.
 *
 * Failures never throw. An I/O error drops the link to Disconnected and every
 * later command reports NOT_CONNECTED until connect() is called again; the
 * link does not reconnect on its own.
 */
class ActuatorLink {
public:
    /**
     * @brief Command counters since construction (or the last reset)
     */
    struct Statistics {
        uint64_t total_commands{0};
        uint64_t successful_commands{0};
        uint64_t error_count{0};
        uint64_t not_connected{0};        ///< Commands dropped because the link was down
        uint64_t range_violations{0};
        uint64_t unknown_actuators{0};
        uint64_t ack_failures{0};         ///< ACK_TIMEOUT + NACK
        uint64_t write_failures{0};
        double mean_command_time_us{0.0};
        double max_command_time_us{0.0};

        void update_on_success(double execution_time_us) {
            total_commands++;
            successful_commands++;
            mean_command_time_us = ((mean_command_time_us * (successful_commands - 1)) + execution_time_us) / successful_commands;
            if (execution_time_us > max_command_time_us) {
                max_command_time_us = execution_time_us;
            }
        }

        void update_on_error(LinkError error) {
            total_commands++;
            error_count++;
            switch (error) {
                case LinkError::NOT_CONNECTED: not_connected++; break;
                case LinkError::OUT_OF_RANGE: range_violations++; break;
                case LinkError::UNKNOWN_ACTUATOR: unknown_actuators++; break;
                case LinkError::ACK_TIMEOUT:
                case LinkError::NACK: ack_failures++; break;
                case LinkError::WRITE_FAILURE: write_failures++; break;
                default: break;
            }
        }
    };

private:
    std::unique_ptr<ISerialPort> port_;
    ServoMap servos_;
    AngleLimits limits_;
    PacingConfig pacing_;

    mutable std::mutex mtx_;
    LinkState state_{LinkState::Disconnected};
    bool handshake_received_{false};
    std::string port_path_;
    std::array<std::optional<int>, ServoMap::count> last_angle_{};
    Statistics stats_;
    BoundedHistory<CommandResult> journal_{32};
    DiagnosticSink sink_;

    void log(Severity s, const std::string& msg) const {
        if (sink_) sink_(s, msg);
    }

    CommandResult fail(int channel, int angle, LinkError error, std::string reply = {}) {
        stats_.update_on_error(error);
        CommandResult r(false, channel, angle, error, std::move(reply));
        journal_.push(r);
        return r;
    }

    void drop_link() {
        try {
            port_->close();
        } catch (const std::exception& e) {
            log(Severity::Warning, std::string("error while closing port: ") + e.what());
        }
        state_ = LinkState::Disconnected;
    }

    // Discard replies that arrived after an earlier ack window closed.
    void drain_input() {
        for (int i = 0; i < 16; ++i) {
            if (!port_->read_line(std::chrono::milliseconds(0))) break;
        }
    }

public:
    /**
     * @brief Construct a disconnected link
     * @param port Serial transport (real device or simulator)
     * @param servos Actuator table used for name/channel resolution
     * @param limits Accepted angle range
     * @param pacing Settle and acknowledgment timing
     */
    explicit ActuatorLink(std::unique_ptr<ISerialPort> port,
                          ServoMap servos = ServoMap{},
                          AngleLimits limits = AngleLimits{},
                          PacingConfig pacing = PacingConfig{})
        : port_(std::move(port))
        , servos_(std::move(servos))
        , limits_(limits)
        , pacing_(pacing)
        , sink_(console_sink("link")) {
        if (!port_) throw std::invalid_argument("ActuatorLink requires a serial port");
    }

    ~ActuatorLink() { close(); }

    ActuatorLink(const ActuatorLink&) = delete;
    ActuatorLink& operator=(const ActuatorLink&) = delete;

    /**
     * @brief Open the port and wait for the READY handshake
     *
     * A missing READY line is not an error: after handshake_timeout the link
     * is used optimistically. Only a port that cannot be opened fails.
     *
     * @param path Serial device path
     * @param baud Baud rate
     * @param handshake_timeout Maximum wait for READY
     * @return OK, INVALID_BAUD, PORT_OPEN_FAILED or WRITE_FAILURE
     */
    LinkError connect(const std::string& path, int baud, std::chrono::milliseconds handshake_timeout) {
        std::lock_guard<std::mutex> lock(mtx_);

        if (state_ != LinkState::Disconnected) {
            drop_link();
        }
        handshake_received_ = false;
        port_path_ = path;

        if (!is_standard_baud(baud)) {
            log(Severity::Error, "unsupported baud rate " + std::to_string(baud));
            return LinkError::INVALID_BAUD;
        }

        if (!port_->open(path, baud)) {
            log(Severity::Warning, "actuator link not connected (" + path + "); continuing without servo control");
            return LinkError::PORT_OPEN_FAILED;
        }
        state_ = LinkState::Connected;

        auto deadline = std::chrono::steady_clock::now() + handshake_timeout;
        try {
            while (!handshake_received_) {
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) break;
                auto line = port_->read_line(remaining);
                if (!line) break;
                if (*line == "READY") handshake_received_ = true;
            }
        } catch (const std::exception& e) {
            log(Severity::Error, std::string("handshake failed: ") + e.what());
            drop_link();
            return LinkError::WRITE_FAILURE;
        }

        state_ = LinkState::Ready;
        if (handshake_received_) {
            log(Severity::Info, "actuator link ready on " + path);
        } else {
            log(Severity::Warning, "no READY from controller on " + path + " within " +
                std::to_string(handshake_timeout.count()) + " ms; using link anyway");
        }
        return LinkError::OK;
    }

    /**
     * @brief Connect using the configured handshake timeout
     */
    LinkError connect(const std::string& path, int baud) {
        return connect(path, baud, pacing_.handshake_timeout);
    }

    /**
     * @brief Command one servo channel to an angle
     *
     * Checks run in order: channel known, angle in range, link open. A failed
     * check returns without touching the port.
     */
    CommandResult send(int channel, int angle) {
        std::lock_guard<std::mutex> lock(mtx_);

        auto servo = servos_.by_channel(channel);
        if (!servo) {
            log(Severity::Warning, "unknown servo channel " + std::to_string(channel));
            return fail(channel, angle, LinkError::UNKNOWN_ACTUATOR);
        }
        if (!limits_.contains(angle)) {
            log(Severity::Warning, "angle " + std::to_string(angle) + " outside [" +
                std::to_string(limits_.angle_min) + ", " + std::to_string(limits_.angle_max) +
                "] for " + servos_.name(*servo));
            return fail(channel, angle, LinkError::OUT_OF_RANGE);
        }
        if (state_ == LinkState::Disconnected || !port_->is_open()) {
            return fail(channel, angle, LinkError::NOT_CONNECTED);
        }

        auto start = std::chrono::steady_clock::now();
        std::optional<std::string> reply;
        try {
            drain_input();
            port_->write_line(std::to_string(channel) + ":" + std::to_string(angle));
            pacing_.pause(pacing_.command_settle);
            reply = port_->read_line(pacing_.ack_timeout);
        } catch (const std::exception& e) {
            log(Severity::Error, "servo command failed: " + std::string(e.what()));
            drop_link();
            return fail(channel, angle, LinkError::WRITE_FAILURE);
        }

        if (!reply) {
            log(Severity::Warning, "no acknowledgment for " + std::to_string(channel) + ":" + std::to_string(angle));
            return fail(channel, angle, LinkError::ACK_TIMEOUT);
        }
        if (reply->compare(0, 2, "OK") != 0) {
            log(Severity::Warning, "controller rejected " + std::to_string(channel) + ":" +
                std::to_string(angle) + " (" + *reply + ")");
            return fail(channel, angle, LinkError::NACK, *reply);
        }

        auto end = std::chrono::steady_clock::now();
        stats_.update_on_success(std::chrono::duration<double, std::micro>(end - start).count());
        last_angle_[static_cast<size_t>(*servo)] = angle;

        CommandResult r(true, channel, angle, LinkError::OK, *reply);
        journal_.push(r);
        return r;
    }

    CommandResult send(Servo servo, int angle) {
        return send(servos_.channel(servo), angle);
    }

    /**
     * @brief Command a servo by name; unknown names do no I/O
     */
    CommandResult send(const std::string& name, int angle) {
        auto servo = servos_.resolve(name);
        if (!servo) {
            std::lock_guard<std::mutex> lock(mtx_);
            log(Severity::Warning, "unknown servo: " + name);
            return fail(-1, angle, LinkError::UNKNOWN_ACTUATOR);
        }
        return send(*servo, angle);
    }

    /**
     * @brief Release the port (idempotent)
     */
    void close() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != LinkState::Disconnected || port_->is_open()) {
            drop_link();
        }
    }

    LinkState state() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return state_;
    }

    bool is_ready() const { return state() == LinkState::Ready; }

    bool handshake_received() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return handshake_received_;
    }

    std::string port_path() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return port_path_;
    }

    /**
     * @brief Last successfully acknowledged angle of a servo
     */
    std::optional<int> last_angle(Servo servo) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return last_angle_[static_cast<size_t>(servo)];
    }

    /**
     * @brief Angle the servo is assumed to be at: last commanded, else rest
     */
    int assumed_angle(Servo servo) const {
        auto last = last_angle(servo);
        return last ? *last : servos_.rest_angle(servo);
    }

    const ServoMap& servos() const { return servos_; }
    const AngleLimits& limits() const { return limits_; }
    const PacingConfig& pacing() const { return pacing_; }

    Statistics get_statistics() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return stats_;
    }

    /**
     * @brief Most recent commands, oldest first
     */
    std::vector<CommandResult> recent_commands() const {
        return journal_.snapshot();
    }

    void set_diagnostic_sink(DiagnosticSink sink) {
        std::lock_guard<std::mutex> lock(mtx_);
        sink_ = std::move(sink);
    }
};
