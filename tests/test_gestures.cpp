#include "../src/control/gestures.hpp"
#include <cassert>
#include <iostream>
#include <set>
#include <string>

/**
 * @brief Test the gesture catalog and servo name table
 */
int main() {
    std::cout << "Testing gesture catalog..." << std::endl;

    // Test 1: Servo names and channels
    {
        std::cout << "Test 1: Servo map" << std::endl;

        ServoMap m;
        assert(m.resolve("pan").value() == Servo::Pan);
        assert(m.resolve("head").value() == Servo::Pan);
        assert(m.resolve("left_arm").value() == Servo::LeftArm);
        assert(m.resolve("right_arm").value() == Servo::RightArm);
        assert(!m.resolve("Head").has_value());
        assert(!m.resolve("tail").has_value());

        assert(m.channel(Servo::Pan) == 2);
        assert(m.channel(Servo::LeftArm) == 4);
        assert(m.channel(Servo::RightArm) == 5);
        assert(m.by_channel(5).value() == Servo::RightArm);
        assert(!m.by_channel(3).has_value());
        for (const auto& spec : m.all()) assert(spec.rest_angle == 90);

        m.set_channel(Servo::Pan, 9);
        m.set_rest_angle(Servo::Pan, 80);
        assert(m.by_channel(9).value() == Servo::Pan);
        assert(!m.by_channel(2).has_value());
        assert(m.rest_angle(Servo::Pan) == 80);

        std::cout << "  Servo map test passed" << std::endl;
    }

    // Test 2: Names round-trip and moods are a subset
    {
        std::cout << "Test 2: Names and moods" << std::endl;

        std::set<std::string> names;
        for (Gesture g : all_gestures()) {
            auto n = gesture_name(g);
            assert(names.insert(n).second);
            assert(parse_gesture(n).value() == g);
            assert(parse_mood(n).has_value() == is_mood(g));
        }
        assert(names.size() == 8);
        assert((names == std::set<std::string>{"wave", "nod", "shake", "rest",
                                               "happy", "sad", "excited", "curious"}));

        assert(!parse_gesture("dance").has_value());
        assert(!parse_gesture("Wave").has_value());
        assert(!parse_mood("nod").has_value());
        assert(parse_mood("curious").value() == Gesture::Curious);

        std::cout << "  Names and moods test passed" << std::endl;
    }

    // Test 3: Step tables stay in range and end at rest
    {
        std::cout << "Test 3: Step tables" << std::endl;

        for (Gesture g : all_gestures()) {
            const auto& seq = discrete_sequence(g);
            assert(!seq.empty());
            std::set<Servo> touched;
            for (const auto& step : seq) {
                assert(step.angle == DiscreteStep::REST || (step.angle >= 0 && step.angle <= 180));
                touched.insert(step.servo);
            }
            // The last command to each servo touched is its rest position
            for (Servo s : touched) {
                for (auto it = seq.rbegin(); it != seq.rend(); ++it) {
                    if (it->servo == s) {
                        assert(it->angle == DiscreteStep::REST);
                        break;
                    }
                }
            }
        }

        assert(discrete_sequence(Gesture::Nod).size() == 5);
        assert(discrete_sequence(Gesture::Nod)[0].angle == 105);
        assert(discrete_sequence(Gesture::Shake)[0].angle == 65);
        assert(discrete_sequence(Gesture::Wave)[1].servo == Servo::RightArm);
        assert(discrete_sequence(Gesture::Rest).size() == 3);

        std::cout << "  Step tables test passed" << std::endl;
    }

    // Test 4: Choreographies
    {
        std::cout << "Test 4: Choreographies" << std::endl;

        for (Gesture g : all_gestures()) {
            const auto& c = choreography(g);
            for (const auto& m : c.moves) {
                assert(m.angle >= 0 && m.angle <= 180);
                assert(m.steps >= 1);
                assert(m.pause_ms >= 0);
            }
            if (!c.end_at_rest) {
                // Pan-only gestures recentre on their own
                assert(!c.moves.empty());
                assert(c.moves.back().servo == Servo::Pan);
                assert(c.moves.back().angle == 90);
            }
        }
        assert(choreography(Gesture::Rest).moves.empty());
        assert(choreography(Gesture::Rest).end_at_rest);
        assert(choreography(Gesture::Nod).moves.size() == 5);

        std::cout << "  Choreographies test passed" << std::endl;
    }

    std::cout << "✅ All gesture catalog tests passed!" << std::endl;
    return 0;
}
