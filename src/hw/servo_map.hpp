#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <string>

/**
 * @brief Physical servos on the companion
 */
enum class Servo {
    Pan = 0,    ///< Head pan (alias "head")
    LeftArm,
    RightArm
};

/**
 * @brief Wiring of one servo: logical name, controller pin and rest angle
 */
struct ServoSpec {
    Servo id;
    std::string name;
    int channel;       ///< Pin number on the microcontroller
    int rest_angle;    ///< Neutral angle in degrees
};

/**
 * @brief Fixed actuator table, resolved by name
 *
 * The set of servos is fixed at compile time; only channel numbers and
 * rest angles may be overridden from configuration before use.
 */
class ServoMap {
private:
    std::array<ServoSpec, 3> specs_;

public:
    static constexpr size_t count = 3;

    ServoMap()
        : specs_{{
            {Servo::Pan,      "pan",       2, 90},
            {Servo::LeftArm,  "left_arm",  4, 90},
            {Servo::RightArm, "right_arm", 5, 90},
        }} {}

    /**
     * @brief Resolve a servo name ("head" is accepted for "pan")
     * @return The servo, or nullopt for an unknown name
     */
    std::optional<Servo> resolve(const std::string& name) const {
        if (name == "head") return Servo::Pan;
        for (const auto& s : specs_) {
            if (s.name == name) return s.id;
        }
        return std::nullopt;
    }

    std::optional<Servo> by_channel(int channel) const {
        for (const auto& s : specs_) {
            if (s.channel == channel) return s.id;
        }
        return std::nullopt;
    }

    const ServoSpec& spec(Servo s) const { return specs_[static_cast<size_t>(s)]; }
    int channel(Servo s) const { return spec(s).channel; }
    int rest_angle(Servo s) const { return spec(s).rest_angle; }
    const std::string& name(Servo s) const { return spec(s).name; }

    void set_channel(Servo s, int channel) { specs_[static_cast<size_t>(s)].channel = channel; }
    void set_rest_angle(Servo s, int angle) { specs_[static_cast<size_t>(s)].rest_angle = angle; }

    const std::array<ServoSpec, 3>& all() const { return specs_; }
};
