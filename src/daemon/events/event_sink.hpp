#pragma once

#include <nlohmann/json.hpp>
#include <string_view>

enum class EngineEvent { SessionAdded, SessionRemoved, GitStatsUpdated, SessionStateChanged };

inline std::string_view to_string(EngineEvent event) {
    switch (event) {
        case EngineEvent::SessionAdded: return "session_added";
        case EngineEvent::SessionRemoved: return "session_removed";
        case EngineEvent::GitStatsUpdated: return "git_stats_updated";
        case EngineEvent::SessionStateChanged: return "session_state_changed";
    }
    return "unknown";
}

// Fire-and-forget notifications for observers. Delivery failures never
// affect the operation that emitted the event.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(EngineEvent event, const nlohmann::json& payload) = 0;
};
