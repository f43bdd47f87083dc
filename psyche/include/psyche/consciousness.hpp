#pragma once
// Consciousness Engine: bounded-score evolution of a character's mind
//
// Uninitialized -> Initialized (one-way). Evolution is cooldown-gated,
// raises awareness (capped) and evolution points, logs a decision, and may
// trigger a one-time breakthrough for the experience.

#include "types.hpp"
#include "config.hpp"
#include "context.hpp"
#include "events.hpp"
#include "store.hpp"
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace psyche {

struct Decision {
    std::string context;
    std::string reasoning;
    std::string outcome;
    Timestamp timestamp = 0;
    uint64_t confidence = 0;  // 0-95
    bool success = true;
};

struct ConsciousnessRecord {
    std::vector<std::string> beliefs;
    std::vector<std::string> values;
    std::vector<std::string> goals;
    std::map<std::string, uint64_t> priorities;  // last write wins
    std::vector<Decision> decision_history;
    uint64_t awareness_level = 0;   // 0-100
    uint64_t coherence_level = 0;   // 0-100, inert after init
    uint64_t evolution_points = 0;
    std::set<std::string> achieved_breakthroughs;
    Timestamp last_update_time = 0;
    bool is_initialized = false;
};

// Seed content for a newly initialized character
namespace defaults {
inline const char* const BELIEF = "I think, therefore I am";
inline const char* const VALUE = "curiosity";
inline const char* const GOAL = "understand the world";
inline const char* const REASONING = "Processed through conscious evaluation";
} // namespace defaults

// Outcome of one evolve_consciousness call
struct EvolutionReport {
    uint64_t impact = 0;
    uint64_t confidence = 0;
    uint64_t awareness = 0;
    uint64_t breakthrough_probability = 0;
    bool breakthrough = false;
};

class ConsciousnessEngine {
public:
    ConsciousnessEngine(EventLog& events, const EngineConfig& config,
                        std::shared_ptr<SeedSource> seeds);

    // awareness must be in (0, 100]
    void initialize_consciousness(const BlockContext& ctx, CharacterId id, uint64_t awareness);

    EvolutionReport evolve_consciousness(const BlockContext& ctx, CharacterId id,
                                         const std::string& experience,
                                         const std::string& outcome);

    void add_goal(const BlockContext& ctx, CharacterId id, const std::string& goal);
    void add_belief(const BlockContext& ctx, CharacterId id, const std::string& belief);
    void add_value(const BlockContext& ctx, CharacterId id, const std::string& value,
                   uint64_t priority);

    bool is_initialized(CharacterId id) const;
    uint64_t awareness_level(CharacterId id) const;
    uint64_t coherence_level(CharacterId id) const;
    uint64_t evolution_points(CharacterId id) const;
    Timestamp last_update_time(CharacterId id) const;

    std::vector<std::string> beliefs(CharacterId id) const;
    std::vector<std::string> values(CharacterId id) const;
    std::vector<std::string> goals(CharacterId id) const;
    std::vector<Decision> decision_history(CharacterId id) const;
    size_t belief_count(CharacterId id) const;
    size_t value_count(CharacterId id) const;
    size_t goal_count(CharacterId id) const;
    size_t decision_count(CharacterId id) const;

    bool has_breakthrough(CharacterId id, const std::string& experience) const;
    std::vector<std::string> breakthroughs(CharacterId id) const;

    // Throws NotInitialized; unknown keys read as 0
    uint64_t priority(CharacterId id, const std::string& key) const;

    Store<ConsciousnessRecord>& records() { return records_; }
    const Store<ConsciousnessRecord>& records() const { return records_; }

private:
    [[noreturn]] void reject(ErrorCode code, CharacterId id, const char* op) const;
    const ConsciousnessRecord& require_initialized(CharacterId id, const char* op) const;
    bool check_breakthrough(const BlockContext& ctx, CharacterId id, ConsciousnessRecord& record,
                            const std::string& experience, EvolutionReport& report);

    EventLog& events_;
    const EngineConfig& config_;
    std::shared_ptr<SeedSource> seeds_;
    Store<ConsciousnessRecord> records_;
};

} // namespace psyche
