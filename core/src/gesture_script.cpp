// Gesture Script
// JSON gesture timelines for headless playback

#include <pupkit/gesture_script.h>
#include <pupkit/companion.h>
#include <pupkit/dog_interaction_controller.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace pupkit {

namespace {

struct TypeEntry {
    const char* name;
    GestureType type;
};

const TypeEntry kTypes[] = {
    {"tap", GestureType::Tap},
    {"long_press_start", GestureType::LongPressStart},
    {"long_press_end", GestureType::LongPressEnd},
    {"pan", GestureType::Pan},
    {"pan_end", GestureType::PanEnd},
    {"mood", GestureType::Mood},
};

void dispatchGesture(const GestureEvent& e, DogInteractionController& target) {
    switch (e.type) {
        case GestureType::Tap:            target.onTap(); break;
        case GestureType::LongPressStart: target.onLongPressStart(); break;
        case GestureType::LongPressEnd:   target.onLongPressEnd(); break;
        case GestureType::Pan:            target.onPanUpdate(e.dx); break;
        case GestureType::PanEnd:         target.onPanEnd(); break;
        case GestureType::Mood:           target.applyMoodState(e.key); break;
    }
}

} // namespace

const char* gestureTypeName(GestureType type) {
    for (const auto& entry : kTypes) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "tap";
}

GestureScript GestureScript::fromJson(const json& doc) {
    if (!doc.is_object() || !doc.contains("events") || !doc["events"].is_array()) {
        throw std::runtime_error("Gesture script must be an object with an 'events' array");
    }

    GestureScript script;
    const json& events = doc["events"];
    for (size_t i = 0; i < events.size(); ++i) {
        const json& item = events[i];
        std::string where = "events[" + std::to_string(i) + "]";
        if (!item.is_object()) {
            throw std::runtime_error(where + ": expected an object");
        }

        GestureEvent event;
        if (!item.contains("time") || !item["time"].is_number()) {
            throw std::runtime_error(where + ": 'time' must be a number");
        }
        event.time = item["time"].get<double>();
        if (!std::isfinite(event.time) || event.time < 0.0) {
            throw std::runtime_error(where + ": 'time' must be >= 0");
        }

        if (!item.contains("type") || !item["type"].is_string()) {
            throw std::runtime_error(where + ": 'type' must be a string");
        }
        std::string typeName = item["type"].get<std::string>();
        bool known = false;
        for (const auto& entry : kTypes) {
            if (typeName == entry.name) {
                event.type = entry.type;
                known = true;
                break;
            }
        }
        if (!known) {
            throw std::runtime_error(where + ": unknown type '" + typeName + "'");
        }

        if (event.type == GestureType::Pan) {
            if (!item.contains("dx") || !item["dx"].is_number()) {
                throw std::runtime_error(where + ": pan requires a numeric 'dx'");
            }
            event.dx = item["dx"].get<float>();
        } else if (event.type == GestureType::Mood) {
            if (!item.contains("key") || !item["key"].is_string()) {
                throw std::runtime_error(where + ": mood requires a string 'key'");
            }
            event.key = item["key"].get<std::string>();
        }

        script.add(event);
    }
    return script;
}

bool GestureScript::loadFile(const std::string& path, GestureScript& out, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Cannot open gesture script: " + path;
        return false;
    }

    try {
        json doc;
        file >> doc;
        out = fromJson(doc);
    } catch (const json::exception& e) {
        error = "Failed to parse " + path + ": " + e.what();
        return false;
    } catch (const std::runtime_error& e) {
        error = path + ": " + e.what();
        return false;
    }

    std::cout << "[pupkit] Loaded " << out.events().size() << " gesture event(s) from " << path << "\n";
    return true;
}

void GestureScript::add(const GestureEvent& event) {
    auto it = std::upper_bound(m_events.begin(), m_events.end(), event,
        [](const GestureEvent& a, const GestureEvent& b) { return a.time < b.time; });
    // Everything at or before a running clock has fired, so a late event
    // lands behind the cursor
    bool passed = m_clock > 0.0 && event.time <= m_clock;
    m_events.insert(it, event);
    if (passed) {
        ++m_next;
    }
}

template <typename Dispatch>
size_t GestureScript::advanceWith(double dt, Dispatch&& dispatch) {
    if (std::isfinite(dt) && dt > 0.0) {
        m_clock += dt;
    }
    size_t fired = 0;
    while (m_next < m_events.size() && m_events[m_next].time <= m_clock) {
        dispatch(m_events[m_next]);
        ++m_next;
        ++fired;
    }
    return fired;
}

size_t GestureScript::advance(double dt, DogInteractionController& target) {
    return advanceWith(dt, [&target](const GestureEvent& e) { dispatchGesture(e, target); });
}

size_t GestureScript::advance(double dt, Companion& target) {
    return advanceWith(dt, [&target](const GestureEvent& e) {
        if (e.type == GestureType::Mood) {
            target.applyMood(e.key);
        } else {
            dispatchGesture(e, target.interaction());
        }
    });
}

void GestureScript::reset() {
    m_next = 0;
    m_clock = 0.0;
}

} // namespace pupkit
