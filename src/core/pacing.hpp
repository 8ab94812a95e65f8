#pragma once
#include <chrono>
#include <thread>

/**
 * @brief Timing parameters for serial commands and gesture playback
 *
 * All motion pacing is an explicit blocking sleep on the caller's thread.
 * time_scale multiplies every motion delay (settle, step delays and the
 * pauses stored in choreographies) so tests can run the full catalog with
 * near-zero wall time. I/O waits (handshake, acknowledgment) are not scaled.
 */
struct PacingConfig {
  std::chrono::milliseconds command_settle{50};        ///< Pause after each write before reading the ack
  std::chrono::milliseconds ack_timeout{100};          ///< Wait for the "OK" line
  std::chrono::milliseconds handshake_timeout{2000};   ///< Wait for "READY" (covers the board reset)
  std::chrono::milliseconds discrete_step_delay{150};  ///< Between steps of a discrete gesture
  std::chrono::milliseconds smooth_step_delay{20};     ///< Between interpolation steps
  double time_scale{1.0};

  std::chrono::milliseconds scaled(std::chrono::milliseconds d) const {
    if (time_scale <= 0.0) return std::chrono::milliseconds::zero();
    return std::chrono::milliseconds(static_cast<long long>(d.count() * time_scale));
  }

  /**
   * @brief Sleep for a scaled motion delay (no-op for zero)
   */
  void pause(std::chrono::milliseconds d) const {
    auto s = scaled(d);
    if (s.count() > 0) std::this_thread::sleep_for(s);
  }
};
