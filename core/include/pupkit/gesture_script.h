#pragma once

/**
 * @file gesture_script.h
 * @brief Timed gesture and mood events replayed into a companion
 *
 * @code
 * {
 *   "events": [
 *     { "time": 0.5, "type": "tap" },
 *     { "time": 1.0, "type": "pan", "dx": -4 },
 *     { "time": 2.5, "type": "pan_end" },
 *     { "time": 3.0, "type": "long_press_start" },
 *     { "time": 4.0, "type": "long_press_end" },
 *     { "time": 5.0, "type": "mood", "key": "zoomies" }
 *   ]
 * }
 * @endcode
 */

#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace pupkit {

class Companion;
class DogInteractionController;

enum class GestureType {
    Tap,
    LongPressStart,
    LongPressEnd,
    Pan,
    PanEnd,
    Mood
};

/// @brief Script name of a gesture type ("tap", "long_press_start", ...)
const char* gestureTypeName(GestureType type);

struct GestureEvent {
    double time = 0.0;        ///< Seconds from script start
    GestureType type = GestureType::Tap;
    float dx = 0.0f;          ///< Pan only
    std::string key;          ///< Mood only
};

/**
 * @brief Time-sorted event list with a playback clock
 */
class GestureScript {
public:
    GestureScript() = default;

    /**
     * @brief Parse a script document
     * @throw std::runtime_error naming the offending event index
     */
    static GestureScript fromJson(const nlohmann::json& doc);

    /**
     * @brief Load a script file
     * @param path Path to JSON file
     * @param out Receives the script on success
     * @param error Receives the failure reason
     * @return false if the file cannot be read, parsed or validated
     */
    static bool loadFile(const std::string& path, GestureScript& out, std::string& error);

    /**
     * @brief Insert an event after any events with the same time
     *
     * Once playback has started, an event timed at or before the clock
     * counts as already played and is never dispatched.
     */
    void add(const GestureEvent& event);

    /**
     * @brief Advance the playback clock and dispatch every event it passes
     * @return Number of events dispatched
     */
    size_t advance(double dt, DogInteractionController& target);

    /// @brief As above; mood events go through Companion::applyMood
    size_t advance(double dt, Companion& target);

    /// @brief Rewind to the start
    void reset();

    double clock() const { return m_clock; }
    bool finished() const { return m_next >= m_events.size(); }
    double duration() const { return m_events.empty() ? 0.0 : m_events.back().time; }
    const std::vector<GestureEvent>& events() const { return m_events; }

private:
    template <typename Dispatch>
    size_t advanceWith(double dt, Dispatch&& dispatch);

    std::vector<GestureEvent> m_events;
    size_t m_next = 0;
    double m_clock = 0.0;
};

} // namespace pupkit
