#pragma once
#include "executor.hpp"
#include "../hw/actuator_link.hpp"

/**
 * @brief Entry points offered to the front ends
 *
 * Front ends only pass names and angles in and get results back; transcripts,
 * audio and language-model payloads never reach the motion core.
 */
struct CompanionAPI {
  ActuatorLink& link;          ///< Serial link to the servo controller
  GestureExecutor& executor;   ///< Gesture playback

  /**
   * @brief Move one servo directly
   * @param servo Servo name ("pan", "head", "left_arm", "right_arm")
   * @param angle Angle in degrees
   */
  CommandResult set_servo(const std::string& servo, int angle) { return executor.set_servo(servo, angle); }

  /**
   * @brief Play a gesture from the discrete table
   */
  GestureResult trigger_gesture(const std::string& name) { return executor.perform(name); }

  GestureResult smooth_gesture(const std::string& name) { return executor.perform_smooth(name); }

  GestureResult mood(const std::string& name) { return executor.perform_mood(name); }

  /**
   * @brief React to the yes/no/neutral tag of a generated reply
   */
  GestureResult react(const std::string& tag) { return executor.react(tag); }

  /**
   * @brief true while a serial port is held open
   */
  bool arduino_connected() const { return link.state() != LinkState::Disconnected; }
};
