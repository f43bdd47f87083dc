#include <psyche/events.hpp>
#include <stdexcept>

namespace psyche {

namespace {

constexpr EventKind ALL_KINDS[] = {
    EventKind::QuantumStateInitialized,
    EventKind::SuperpositionAdded,
    EventKind::QuantumBondFormed,
    EventKind::StateCollapsed,
    EventKind::MemeMutated,
    EventKind::MemePropagated,
    EventKind::ConsciousnessInitialized,
    EventKind::ConsciousnessEvolved,
    EventKind::DecisionMade,
    EventKind::BreakthroughAchieved,
    EventKind::GoalAdded,
    EventKind::BeliefAdded,
    EventKind::ValueAdded,
};

} // namespace

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::QuantumStateInitialized: return "QuantumStateInitialized";
        case EventKind::SuperpositionAdded: return "SuperpositionAdded";
        case EventKind::QuantumBondFormed: return "QuantumBondFormed";
        case EventKind::StateCollapsed: return "StateCollapsed";
        case EventKind::MemeMutated: return "MemeMutated";
        case EventKind::MemePropagated: return "MemePropagated";
        case EventKind::ConsciousnessInitialized: return "ConsciousnessInitialized";
        case EventKind::ConsciousnessEvolved: return "ConsciousnessEvolved";
        case EventKind::DecisionMade: return "DecisionMade";
        case EventKind::BreakthroughAchieved: return "BreakthroughAchieved";
        case EventKind::GoalAdded: return "GoalAdded";
        case EventKind::BeliefAdded: return "BeliefAdded";
        case EventKind::ValueAdded: return "ValueAdded";
    }
    return "Unknown";
}

std::optional<EventKind> event_kind_from_name(const std::string& name) {
    for (EventKind kind : ALL_KINDS) {
        if (name == event_kind_name(kind)) return kind;
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const Event& e) {
    j = {
        {"kind", event_kind_name(e.kind)},
        {"character", e.character},
        {"text", e.text},
        {"value", e.value},
        {"timestamp", e.timestamp}
    };
    if (e.peer) {
        j["peer"] = *e.peer;
    }
}

void from_json(const nlohmann::json& j, Event& e) {
    auto kind = event_kind_from_name(j.at("kind").get<std::string>());
    if (!kind) {
        throw std::runtime_error("Unknown event kind: " + j.at("kind").get<std::string>());
    }
    e.kind = *kind;
    e.character = j.at("character").get<CharacterId>();
    e.text = j.value("text", "");
    e.value = j.value("value", uint64_t{0});
    e.timestamp = j.value("timestamp", Timestamp{0});
    if (j.contains("peer")) {
        e.peer = j["peer"].get<CharacterId>();
    } else {
        e.peer.reset();
    }
}

std::vector<Event> EventLog::events_for(CharacterId character) const {
    std::vector<Event> out;
    for (const auto& e : events_) {
        if (e.character == character) out.push_back(e);
    }
    return out;
}

size_t EventLog::count(EventKind kind) const {
    size_t n = 0;
    for (const auto& e : events_) {
        if (e.kind == kind) ++n;
    }
    return n;
}

nlohmann::json EventLog::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : events_) {
        arr.push_back(e);
    }
    return arr;
}

} // namespace psyche
