#pragma once
// Event log: the public notification stream
//
// Append-only. Events emitted by a reverted operation are discarded with it.

#include "types.hpp"
#include "store.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace psyche {

enum class EventKind : uint8_t {
    QuantumStateInitialized,
    SuperpositionAdded,
    QuantumBondFormed,
    StateCollapsed,
    MemeMutated,
    MemePropagated,
    ConsciousnessInitialized,
    ConsciousnessEvolved,
    DecisionMade,
    BreakthroughAchieved,
    GoalAdded,
    BeliefAdded,
    ValueAdded,
};

const char* event_kind_name(EventKind kind);
std::optional<EventKind> event_kind_from_name(const std::string& name);

struct Event {
    EventKind kind;
    CharacterId character = 0;
    std::optional<CharacterId> peer;  // bond partner or propagation target
    std::string text;                 // meme, experience, goal, ...
    uint64_t value = 0;               // factor, bond strength, awareness, priority
    Timestamp timestamp = 0;
};

void to_json(nlohmann::json& j, const Event& e);
void from_json(const nlohmann::json& j, Event& e);

class EventLog : public Journaled {
public:
    void emit(Event event) { events_.push_back(std::move(event)); }

    size_t size() const { return events_.size(); }
    bool empty() const { return events_.empty(); }
    const Event& at(size_t i) const { return events_.at(i); }
    const std::vector<Event>& all() const { return events_; }

    std::vector<Event> events_for(CharacterId character) const;
    size_t count(EventKind kind) const;

    nlohmann::json to_json() const;
    void restore(std::vector<Event> events) { events_ = std::move(events); }

    void begin() override { mark_ = events_.size(); }
    void commit() override {}
    void rollback() override { events_.resize(mark_); }

private:
    std::vector<Event> events_;
    size_t mark_ = 0;
};

} // namespace psyche
