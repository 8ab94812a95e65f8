#pragma once

/**
 * @brief Servo angle bounds
 *
 * Commands outside [angle_min, angle_max] are rejected before they reach
 * the wire; the firmware does no range checking of its own.
 */
struct AngleLimits {
  int angle_min{0};    ///< Minimum servo angle in degrees
  int angle_max{180};  ///< Maximum servo angle in degrees

  /**
   * @brief Check an angle against the bounds
   * @param a Angle in degrees
   * @return true if angle_min <= a <= angle_max
   */
  bool contains(int a) const {
    return a >= angle_min && a <= angle_max;
  }

  /**
   * @brief Clamp an angle into the bounds
   */
  int clamp(int a) const {
    if (a < angle_min) return angle_min;
    if (a > angle_max) return angle_max;
    return a;
  }

  bool valid() const { return angle_min <= angle_max; }
};
