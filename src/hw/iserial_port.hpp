#pragma once
#include <chrono>
#include <optional>
#include <string>

/**
 * @brief Line-oriented serial transport interface
 *
 * The actuator link only ever needs to open a device, push one
 * newline-terminated command and pull back at most one reply line.
 * Implementations may throw std::system_error from write_line/read_line;
 * the link converts those into result codes.
 */
struct ISerialPort {
  virtual ~ISerialPort() = default;

  /**
   * @brief Open the device
   * @param path Device path (e.g. /dev/ttyACM0)
   * @param baud Baud rate
   * @return true if the device is open and configured
   */
  virtual bool open(const std::string& path, int baud) = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  /**
   * @brief Write a line; a trailing '\n' is appended
   */
  virtual void write_line(const std::string& line) = 0;

  /**
   * @brief Read one line, stripped of "\r\n"
   * @param timeout Maximum time to wait for a complete line
   * @return The line, or nullopt on timeout
   */
  virtual std::optional<std::string> read_line(std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Check for one of the standard UART rates
 */
inline bool is_standard_baud(int baud) {
  switch (baud) {
    case 1200: case 2400: case 4800: case 9600: case 19200:
    case 38400: case 57600: case 115200: case 230400:
      return true;
    default:
      return false;
  }
}
