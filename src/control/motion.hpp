#pragma once
#include "../hw/actuator_link.hpp"
#include <chrono>
#include <string>
#include <vector>

/**
 * @brief Outcome of a smooth move (one target, many commands)
 */
struct MotionResult {
    bool success{false};
    LinkError error{LinkError::OK};   ///< First error seen, OK if every step was acknowledged
    int start_angle{0};
    int target_angle{0};
    int steps_sent{0};                ///< send() calls issued to the link
    int steps_failed{0};

    explicit operator bool() const { return success; }
};

/**
 * @brief Open-loop interpolated servo moves on top of the actuator link
 *
 * No position feedback exists: the start of every move is the servo's last
 * acknowledged angle (or its rest angle), and a commanded angle is assumed
 * to be reached.
 */
class MotionController {
private:
    ActuatorLink& link_;

public:
    explicit MotionController(ActuatorLink& link) : link_(link) {}

    /**
     * @brief Intermediate angles from start to target
     *
     * Step i (1-based) is start + (target - start) * i / steps, truncated
     * toward zero. The last step lands exactly on target.
     */
    static std::vector<int> interpolate(int start, int target, int steps) {
        if (steps < 1) steps = 1;
        std::vector<int> angles;
        angles.reserve(static_cast<size_t>(steps));
        const int delta = target - start;
        for (int i = 1; i <= steps; ++i) {
            angles.push_back(static_cast<int>(start + static_cast<double>(delta * i) / steps));
        }
        return angles;
    }

    /**
     * @brief Move a servo to target in `steps` increments
     * @param servo Servo to move
     * @param target Target angle in degrees
     * @param steps Number of commands to issue (values below 1 mean 1)
     * @param step_delay Pause after each command (scaled by pacing time_scale)
     * @return MotionResult; NOT_CONNECTED with zero sends if the link is down
     */
    MotionResult smooth_move(Servo servo, int target, int steps, std::chrono::milliseconds step_delay) {
        MotionResult r;
        r.target_angle = target;
        r.start_angle = link_.assumed_angle(servo);

        if (!link_.limits().contains(target)) {
            r.error = LinkError::OUT_OF_RANGE;
            return r;
        }
        if (!link_.is_ready()) {
            r.error = LinkError::NOT_CONNECTED;
            return r;
        }

        for (int angle : interpolate(r.start_angle, target, steps)) {
            auto cr = link_.send(servo, angle);
            r.steps_sent++;
            if (!cr.success) {
                r.steps_failed++;
                if (r.error == LinkError::OK) r.error = cr.error;
            }
            link_.pacing().pause(step_delay);
        }

        r.success = (r.steps_failed == 0);
        return r;
    }

    MotionResult smooth_move(Servo servo, int target, int steps = 10) {
        return smooth_move(servo, target, steps, link_.pacing().smooth_step_delay);
    }

    /**
     * @brief Smooth move by servo name; unknown names are a no-op
     */
    MotionResult smooth_move(const std::string& name, int target, int steps = 10) {
        auto servo = link_.servos().resolve(name);
        if (!servo) {
            MotionResult r;
            r.target_angle = target;
            r.error = LinkError::UNKNOWN_ACTUATOR;
            return r;
        }
        return smooth_move(*servo, target, steps);
    }

    /**
     * @brief Single raw command, no interpolation
     */
    CommandResult move_to(const std::string& name, int angle) {
        return link_.send(name, angle);
    }

    /**
     * @brief Bring every servo back to its rest angle (pan first, then arms)
     * @return true if every servo got there without a failed step
     */
    bool return_to_rest() {
        bool ok = true;
        for (const auto& spec : link_.servos().all()) {
            ok = smooth_move(spec.id, spec.rest_angle).success && ok;
        }
        return ok;
    }

    ActuatorLink& link() { return link_; }
};
