#pragma once
#include "iserial_port.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <stdexcept>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

/**
 * @brief Simulated servo microcontroller speaking the "<channel>:<angle>" protocol
 *
 * Behaves like the companion's firmware: prints READY after open, parses each
 * command line, moves the simulated servo and answers OK. Every byte the host
 * writes is recorded so tests can inspect the exact wire traffic. Also used
 * by the daemon when no hardware is attached and simulation is requested.
 */
class SimSerialDevice : public ISerialPort {
public:
    /**
     * @brief How the device answers a command line
     */
    enum class AckMode {
        OK,       ///< "OK" after every well-formed command
        ERROR,    ///< "ERR" after every command
        SILENT    ///< No reply (acknowledgment timeout on the host)
    };

    struct Options {
        bool fail_open{false};          ///< open() reports failure (no such port)
        bool announce_ready{true};      ///< Send READY after open
        std::vector<std::string> boot_banner;  ///< Lines sent before READY
        AckMode ack{AckMode::OK};
        int fail_write_after{-1};       ///< Throw on the write after N successful ones (-1 = never)
    };

private:
    Options opts_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool open_{false};
    int open_count_{0};
    int writes_ok_{0};
    std::string wire_;                 ///< Everything the host wrote
    std::vector<std::string> lines_;   ///< Host lines without '\n'
    std::deque<std::string> tx_;       ///< Pending device -> host lines
    std::map<int, int> positions_;     ///< Simulated servo angle per channel

    bool apply(const std::string& line) {
        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= line.size()) return false;
        try {
            size_t used = 0;
            int channel = std::stoi(line.substr(0, colon), &used);
            if (used != colon) return false;
            std::string angle_text = line.substr(colon + 1);
            int angle = std::stoi(angle_text, &used);
            if (used != angle_text.size()) return false;
            positions_[channel] = angle;
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }

public:
    SimSerialDevice() = default;
    explicit SimSerialDevice(Options opts) : opts_(std::move(opts)) {}

    bool open(const std::string&, int baud) override {
        std::lock_guard<std::mutex> lock(mtx_);
        if (opts_.fail_open || !is_standard_baud(baud)) return false;
        open_ = true;
        open_count_++;
        tx_.clear();
        for (const auto& l : opts_.boot_banner) tx_.push_back(l);
        if (opts_.announce_ready) tx_.push_back("READY");
        cv_.notify_all();
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mtx_);
        open_ = false;
        tx_.clear();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return open_;
    }

    void write_line(const std::string& line) override {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!open_) {
            throw std::system_error(std::make_error_code(std::errc::bad_file_descriptor), "sim write");
        }
        if (opts_.fail_write_after >= 0 && writes_ok_ >= opts_.fail_write_after) {
            open_ = false;
            throw std::system_error(std::make_error_code(std::errc::io_error), "sim device unplugged");
        }
        writes_ok_++;
        wire_ += line + "\n";
        lines_.push_back(line);

        bool parsed = apply(line);
        switch (opts_.ack) {
            case AckMode::OK: tx_.push_back(parsed ? "OK" : "ERR:PARSE"); break;
            case AckMode::ERROR: tx_.push_back("ERR"); break;
            case AckMode::SILENT: break;
        }
        cv_.notify_all();
    }

    std::optional<std::string> read_line(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!open_) {
            throw std::system_error(std::make_error_code(std::errc::bad_file_descriptor), "sim read");
        }
        cv_.wait_for(lock, timeout, [this] { return !tx_.empty() || !open_; });
        if (tx_.empty()) return std::nullopt;
        std::string line = tx_.front();
        tx_.pop_front();
        return line;
    }

    /**
     * @brief Queue an unsolicited device -> host line
     */
    void inject_line(const std::string& line) {
        std::lock_guard<std::mutex> lock(mtx_);
        tx_.push_back(line);
        cv_.notify_all();
    }

    void set_ack_mode(AckMode mode) {
        std::lock_guard<std::mutex> lock(mtx_);
        opts_.ack = mode;
    }

    std::string wire() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return wire_;
    }

    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return lines_;
    }

    void clear_wire() {
        std::lock_guard<std::mutex> lock(mtx_);
        wire_.clear();
        lines_.clear();
    }

    std::optional<int> position(int channel) const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = positions_.find(channel);
        if (it == positions_.end()) return std::nullopt;
        return it->second;
    }

    int open_count() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return open_count_;
    }
};
