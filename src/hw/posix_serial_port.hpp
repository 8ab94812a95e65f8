#pragma once
#include "iserial_port.hpp"
#include <cerrno>
#include <chrono>
#include <optional>
#include <string>
#include <system_error>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

/**
 * @brief termios-backed serial port (8N1, raw mode, no flow control)
 *
 * Opening an Arduino-class board over USB resets it; the caller is expected
 * to wait for the board's READY line before sending commands.
 */
class PosixSerialPort : public ISerialPort {
private:
    int fd_{-1};
    std::string rx_;   ///< Bytes received but not yet returned as a line
    std::chrono::milliseconds write_timeout_;   ///< Longest a write_line may wait for room

    static speed_t to_speed(int baud) {
        switch (baud) {
            case 1200: return B1200;
            case 2400: return B2400;
            case 4800: return B4800;
            case 9600: return B9600;
            case 19200: return B19200;
            case 38400: return B38400;
            case 57600: return B57600;
            case 115200: return B115200;
            case 230400: return B230400;
            default: return B0;
        }
    }

    [[noreturn]] static void throw_errno(const char* what) {
        throw std::system_error(errno, std::generic_category(), what);
    }

    std::optional<std::string> pop_line() {
        auto pos = rx_.find('\n');
        if (pos == std::string::npos) return std::nullopt;
        std::string line = rx_.substr(0, pos);
        rx_.erase(0, pos + 1);
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
            line.pop_back();
        }
        return line;
    }

public:
    explicit PosixSerialPort(std::chrono::milliseconds write_timeout = std::chrono::milliseconds(1000))
        : write_timeout_(write_timeout) {}
    PosixSerialPort(const PosixSerialPort&) = delete;
    PosixSerialPort& operator=(const PosixSerialPort&) = delete;

    ~PosixSerialPort() override { close(); }

    bool open(const std::string& path, int baud) override {
        close();

        speed_t speed = to_speed(baud);
        if (speed == B0) return false;

        int fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd < 0) return false;

        termios tty{};
        if (tcgetattr(fd, &tty) != 0) {
            ::close(fd);
            return false;
        }

        cfmakeraw(&tty);
        cfsetispeed(&tty, speed);
        cfsetospeed(&tty, speed);
        tty.c_cflag |= (CLOCAL | CREAD);
        tty.c_cflag &= ~CSTOPB;
        tty.c_cflag &= ~CRTSCTS;
        tty.c_cc[VMIN] = 0;
        tty.c_cc[VTIME] = 0;

        if (tcsetattr(fd, TCSANOW, &tty) != 0) {
            ::close(fd);
            return false;
        }
        tcflush(fd, TCIOFLUSH);

        fd_ = fd;
        rx_.clear();
        return true;
    }

    void close() override {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        rx_.clear();
    }

    bool is_open() const override { return fd_ >= 0; }

    void write_line(const std::string& line) override {
        if (fd_ < 0) {
            errno = EBADF;
            throw_errno("serial write");
        }

        std::string out = line + "\n";
        size_t written = 0;
        auto deadline = std::chrono::steady_clock::now() + write_timeout_;
        while (written < out.size()) {
            ssize_t n = ::write(fd_, out.data() + written, out.size() - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno != EAGAIN) throw_errno("serial write");

                // Output queue full: wait for room, but not past the deadline
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (remaining.count() <= 0) {
                    errno = ETIMEDOUT;
                    throw_errno("serial write");
                }
                pollfd pfd{fd_, POLLOUT, 0};
                if (::poll(&pfd, 1, static_cast<int>(remaining.count())) < 0 && errno != EINTR) {
                    throw_errno("serial poll");
                }
                continue;
            }
            written += static_cast<size_t>(n);
        }
        tcdrain(fd_);
    }

    std::optional<std::string> read_line(std::chrono::milliseconds timeout) override {
        if (fd_ < 0) {
            errno = EBADF;
            throw_errno("serial read");
        }

        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            if (auto line = pop_line()) return line;

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() < 0) return std::nullopt;

            pollfd pfd{fd_, POLLIN, 0};
            int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (rc < 0) {
                if (errno == EINTR) continue;
                throw_errno("serial poll");
            }
            if (rc == 0) {
                if (remaining.count() == 0) return std::nullopt;
                continue;
            }
            if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
                errno = EIO;
                throw_errno("serial device lost");
            }

            char buf[256];
            ssize_t n = ::read(fd_, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EAGAIN || errno == EINTR) continue;
                throw_errno("serial read");
            }
            if (n == 0) {
                errno = EIO;
                throw_errno("serial device lost");
            }
            rx_.append(buf, static_cast<size_t>(n));
        }
    }
};
