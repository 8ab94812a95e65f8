#pragma once
#include "../hw/servo_map.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Every named motion the companion knows
 *
 * Wave/Nod/Shake/Rest are plain gestures; Happy/Sad/Excited/Curious are
 * moods and can also be played through perform_mood().
 */
enum class Gesture {
    Wave = 0,
    Nod,
    Shake,
    Rest,
    Happy,
    Sad,
    Excited,
    Curious
};

/**
 * @brief One step of a discrete gesture: command a servo, then wait the fixed step delay
 */
struct DiscreteStep {
    static constexpr int REST = -1;   ///< Use the servo's configured rest angle

    Servo servo;
    int angle;
};

/**
 * @brief One interpolated move of a choreography
 */
struct SmoothStep {
    Servo servo;
    int angle;
    int steps;       ///< Interpolation commands for this move
    int pause_ms;    ///< Hold after the move (scaled by pacing)
};

/**
 * @brief Smoothed version of a gesture
 */
struct Choreography {
    std::vector<SmoothStep> moves;
    bool end_at_rest;   ///< Finish with every servo back at its rest angle
};

inline const std::array<Gesture, 8>& all_gestures() {
    static const std::array<Gesture, 8> gestures{
        Gesture::Wave, Gesture::Nod, Gesture::Shake, Gesture::Rest,
        Gesture::Happy, Gesture::Sad, Gesture::Excited, Gesture::Curious};
    return gestures;
}

inline bool is_mood(Gesture g) {
    switch (g) {
        case Gesture::Happy:
        case Gesture::Sad:
        case Gesture::Excited:
        case Gesture::Curious:
            return true;
        case Gesture::Wave:
        case Gesture::Nod:
        case Gesture::Shake:
        case Gesture::Rest:
            return false;
    }
    return false;
}

inline std::string gesture_name(Gesture g) {
    switch (g) {
        case Gesture::Wave: return "wave";
        case Gesture::Nod: return "nod";
        case Gesture::Shake: return "shake";
        case Gesture::Rest: return "rest";
        case Gesture::Happy: return "happy";
        case Gesture::Sad: return "sad";
        case Gesture::Excited: return "excited";
        case Gesture::Curious: return "curious";
    }
    return "unknown";
}

/**
 * @brief Look up any catalog entry by name (exact, lowercase)
 */
inline std::optional<Gesture> parse_gesture(const std::string& name) {
    for (Gesture g : all_gestures()) {
        if (gesture_name(g) == name) return g;
    }
    return std::nullopt;
}

/**
 * @brief Look up a mood by name; plain gestures are not moods
 */
inline std::optional<Gesture> parse_mood(const std::string& name) {
    auto g = parse_gesture(name);
    if (g && is_mood(*g)) return g;
    return std::nullopt;
}

/**
 * @brief Raw step table of a gesture, played without interpolation
 */
inline const std::vector<DiscreteStep>& discrete_sequence(Gesture g) {
    using S = Servo;
    constexpr int R = DiscreteStep::REST;

    static const std::vector<DiscreteStep> wave{
        {S::Pan, R}, {S::RightArm, 70}, {S::RightArm, 40},
        {S::RightArm, 70}, {S::RightArm, 40}, {S::RightArm, 70},
        {S::RightArm, 40}, {S::LeftArm, R}, {S::RightArm, R}};
    static const std::vector<DiscreteStep> nod{
        {S::Pan, 105}, {S::Pan, 75}, {S::Pan, 105}, {S::Pan, 75}, {S::Pan, R}};
    static const std::vector<DiscreteStep> shake{
        {S::Pan, 65}, {S::Pan, 115}, {S::Pan, 65}, {S::Pan, 115}, {S::Pan, R}};
    static const std::vector<DiscreteStep> rest{
        {S::Pan, R}, {S::LeftArm, R}, {S::RightArm, R}};
    static const std::vector<DiscreteStep> happy{
        {S::LeftArm, 170}, {S::RightArm, 170}, {S::Pan, 75},
        {S::Pan, 105}, {S::Pan, 75}, {S::Pan, 105},
        {S::LeftArm, R}, {S::RightArm, R}, {S::Pan, R}};
    static const std::vector<DiscreteStep> sad{
        {S::Pan, 50}, {S::LeftArm, 60}, {S::RightArm, 60},
        {S::Pan, 50}, {S::LeftArm, R}, {S::RightArm, R}, {S::Pan, R}};
    static const std::vector<DiscreteStep> excited{
        {S::LeftArm, 170}, {S::RightArm, 170}, {S::Pan, 60},
        {S::Pan, 120}, {S::LeftArm, R}, {S::RightArm, R}, {S::Pan, R}};
    static const std::vector<DiscreteStep> curious{
        {S::Pan, 70}, {S::LeftArm, 110}, {S::RightArm, 110},
        {S::Pan, 70}, {S::LeftArm, R}, {S::RightArm, R}, {S::Pan, R}};

    switch (g) {
        case Gesture::Wave: return wave;
        case Gesture::Nod: return nod;
        case Gesture::Shake: return shake;
        case Gesture::Rest: return rest;
        case Gesture::Happy: return happy;
        case Gesture::Sad: return sad;
        case Gesture::Excited: return excited;
        case Gesture::Curious: return curious;
    }
    return rest;
}

/**
 * @brief Interpolated version of a gesture, repeats unrolled
 */
inline const Choreography& choreography(Gesture g) {
    using S = Servo;

    static const Choreography wave{{
        {S::Pan, 90, 10, 200},
        {S::RightArm, 70, 5, 150}, {S::RightArm, 40, 5, 150},
        {S::RightArm, 70, 5, 150}, {S::RightArm, 40, 5, 150},
        {S::RightArm, 70, 5, 150}, {S::RightArm, 40, 5, 150}}, true};
    static const Choreography nod{{
        {S::Pan, 105, 5, 150}, {S::Pan, 75, 5, 150},
        {S::Pan, 105, 5, 150}, {S::Pan, 75, 5, 150},
        {S::Pan, 90, 10, 0}}, false};
    static const Choreography shake{{
        {S::Pan, 65, 5, 150}, {S::Pan, 115, 5, 150},
        {S::Pan, 65, 5, 150}, {S::Pan, 115, 5, 150},
        {S::Pan, 90, 10, 0}}, false};
    static const Choreography rest{{}, true};
    static const Choreography happy{{
        {S::LeftArm, 170, 5, 0}, {S::RightArm, 170, 5, 300},
        {S::Pan, 75, 3, 100}, {S::Pan, 105, 3, 100},
        {S::Pan, 75, 3, 100}, {S::Pan, 105, 3, 100},
        {S::Pan, 75, 3, 100}, {S::Pan, 105, 3, 100}}, true};
    static const Choreography sad{{
        {S::Pan, 50, 10, 300},
        {S::LeftArm, 60, 10, 0}, {S::RightArm, 60, 10, 1500}}, true};
    static const Choreography excited{{
        {S::LeftArm, 170, 3, 0}, {S::RightArm, 170, 3, 200},
        {S::Pan, 60, 4, 0}, {S::Pan, 120, 4, 0},
        {S::Pan, 60, 4, 0}, {S::Pan, 120, 4, 0}}, true};
    static const Choreography curious{{
        {S::Pan, 70, 10, 200},
        {S::LeftArm, 110, 10, 0}, {S::RightArm, 110, 10, 1000}}, true};

    switch (g) {
        case Gesture::Wave: return wave;
        case Gesture::Nod: return nod;
        case Gesture::Shake: return shake;
        case Gesture::Rest: return rest;
        case Gesture::Happy: return happy;
        case Gesture::Sad: return sad;
        case Gesture::Excited: return excited;
        case Gesture::Curious: return curious;
    }
    return rest;
}
