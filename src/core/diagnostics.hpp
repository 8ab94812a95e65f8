#pragma once
#include <functional>
#include <iostream>
#include <string>

/**
 * @brief Severity of an operator-facing diagnostic
 */
enum class Severity {
  Info,
  Warning,
  Error
};

/**
 * @brief Receiver for diagnostics raised by the link and the executor
 *
 * Components never print directly; they hand messages to a sink so the
 * daemon can route them to the console and tests can capture them.
 */
using DiagnosticSink = std::function<void(Severity, const std::string&)>;

inline const char* severity_to_string(Severity s) {
  switch (s) {
    case Severity::Info: return "INFO";
    case Severity::Warning: return "WARN";
    case Severity::Error: return "ERROR";
    default: return "UNKNOWN";
  }
}

/**
 * @brief Default sink: info to stdout, warnings and errors to stderr
 */
inline DiagnosticSink console_sink(const std::string& component) {
  return [component](Severity s, const std::string& msg) {
    if (s == Severity::Info) {
      std::cout << "[" << component << "] " << msg << std::endl;
    } else {
      std::cerr << "[" << component << "] " << severity_to_string(s) << ": " << msg << std::endl;
    }
  };
}
