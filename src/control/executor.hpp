#pragma once
#include "gestures.hpp"
#include "motion.hpp"
#include "../core/diagnostics.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>

/**
 * @brief Outcome of playing one gesture
 *
 * recognized is false only for names missing from the catalog, in which case
 * nothing was sent. A recognized gesture reports success even when individual
 * steps failed; the failed steps are counted and the first error is kept.
 */
struct GestureResult {
    std::string name;
    bool recognized{false};
    bool success{false};
    LinkError error{LinkError::OK};
    int steps_sent{0};
    int steps_failed{0};

    explicit operator bool() const { return success; }
};

/**
 * @brief Plays catalog gestures through the motion layer or the raw link
 *
 * Playback holds a single mutex for the whole gesture, so two front ends
 * triggering gestures at the same time get them one after the other instead
 * of interleaved servo commands. There is no cancellation: a started gesture
 * runs to its last step. Failed steps are not retried.
 */
class GestureExecutor {
private:
    ActuatorLink& link_;
    MotionController motion_;
    std::mutex playback_mtx_;
    std::atomic<uint64_t> performed_{0};
    DiagnosticSink sink_;
    std::function<void(const GestureResult&)> completion_callback_;

    void log(Severity s, const std::string& msg) const {
        if (sink_) sink_(s, msg);
    }

    GestureResult unknown(const std::string& name) {
        log(Severity::Warning, "unknown gesture: " + name);
        GestureResult r;
        r.name = name;
        r.error = LinkError::UNKNOWN_GESTURE;
        return r;
    }

    void finish(GestureResult& r) {
        r.recognized = true;
        r.success = true;
        performed_.fetch_add(1);
        if (r.steps_failed > 0) {
            log(Severity::Warning, r.name + ": " + std::to_string(r.steps_failed) + " of " +
                std::to_string(r.steps_sent) + " steps failed (" + error_to_string(r.error) + ")");
        }
    }

    // Runs after the playback lock is released so a callback may start another gesture.
    GestureResult notify(GestureResult r) {
        if (completion_callback_) completion_callback_(r);
        return r;
    }

    void absorb(GestureResult& r, const MotionResult& m) {
        r.steps_sent += m.steps_sent;
        r.steps_failed += m.steps_failed;
        if (r.error == LinkError::OK && m.error != LinkError::OK) r.error = m.error;
    }

public:
    explicit GestureExecutor(ActuatorLink& link)
        : link_(link), motion_(link), sink_(console_sink("gesture")) {}

    /**
     * @brief Play a gesture from its discrete step table
     *
     * Each step is a direct send followed by the fixed discrete step delay,
     * whether or not the send succeeded.
     */
    GestureResult perform(Gesture g) {
        GestureResult r;
        r.name = gesture_name(g);
        {
            std::lock_guard<std::mutex> lock(playback_mtx_);
            const auto& pacing = link_.pacing();
            for (const auto& step : discrete_sequence(g)) {
                int angle = step.angle == DiscreteStep::REST
                    ? link_.servos().rest_angle(step.servo)
                    : step.angle;
                auto cr = link_.send(step.servo, angle);
                r.steps_sent++;
                if (!cr.success) {
                    r.steps_failed++;
                    if (r.error == LinkError::OK) r.error = cr.error;
                }
                pacing.pause(pacing.discrete_step_delay);
            }
            finish(r);
        }
        return notify(r);
    }

    GestureResult perform(const std::string& name) {
        auto g = parse_gesture(name);
        if (!g) return unknown(name);
        return perform(*g);
    }

    /**
     * @brief Play the interpolated choreography of a gesture
     */
    GestureResult perform_smooth(Gesture g) {
        GestureResult r;
        r.name = gesture_name(g);
        {
            std::lock_guard<std::mutex> lock(playback_mtx_);
            const auto& c = choreography(g);
            for (const auto& move : c.moves) {
                absorb(r, motion_.smooth_move(move.servo, move.angle, move.steps));
                link_.pacing().pause(std::chrono::milliseconds(move.pause_ms));
            }
            if (c.end_at_rest) {
                for (const auto& spec : link_.servos().all()) {
                    absorb(r, motion_.smooth_move(spec.id, spec.rest_angle));
                }
            }
            finish(r);
        }
        return notify(r);
    }

    GestureResult perform_smooth(const std::string& name) {
        auto g = parse_gesture(name);
        if (!g) return unknown(name);
        return perform_smooth(*g);
    }

    /**
     * @brief Play a mood (happy, sad, excited, curious); other names are unknown
     */
    GestureResult perform_mood(const std::string& name) {
        auto g = parse_mood(name);
        if (!g) return unknown(name);
        log(Severity::Info, "mood: " + name);
        return perform_smooth(*g);
    }

    /**
     * @brief React to a reply tag: yes nods, no shakes, neutral stays still
     */
    GestureResult react(const std::string& tag) {
        std::string t = tag;
        std::transform(t.begin(), t.end(), t.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (t == "yes") return perform_smooth(Gesture::Nod);
        if (t == "no") return perform_smooth(Gesture::Shake);
        if (t.empty() || t == "neutral") {
            GestureResult r;
            r.name = "neutral";
            r.recognized = true;
            r.success = true;
            return r;
        }
        return unknown(tag);
    }

    /**
     * @brief Raw single-servo command, queued behind any gesture in progress
     */
    CommandResult set_servo(const std::string& name, int angle) {
        std::lock_guard<std::mutex> lock(playback_mtx_);
        return motion_.move_to(name, angle);
    }

    uint64_t performed_count() const { return performed_.load(); }

    void set_diagnostic_sink(DiagnosticSink sink) { sink_ = std::move(sink); }

    /**
     * @brief Called after every recognized gesture finishes (on the caller's thread)
     *
     * The playback lock is already released, so the callback may trigger
     * further gestures.
     */
    void set_completion_callback(std::function<void(const GestureResult&)> callback) {
        completion_callback_ = callback;
    }
};
