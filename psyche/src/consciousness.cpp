#include <psyche/consciousness.hpp>
#include <psyche/log.hpp>
#include <algorithm>

namespace psyche {

ConsciousnessEngine::ConsciousnessEngine(EventLog& events, const EngineConfig& config,
                                         std::shared_ptr<SeedSource> seeds)
    : events_(events)
    , config_(config)
    , seeds_(std::move(seeds)) {}

void ConsciousnessEngine::reject(ErrorCode code, CharacterId id, const char* op) const {
    log_debug("consciousness", "%s rejected for %llu: %s",
              op, static_cast<unsigned long long>(id), error_name(code));
    throw ContractError(code, id);
}

const ConsciousnessRecord& ConsciousnessEngine::require_initialized(CharacterId id,
                                                                    const char* op) const {
    const ConsciousnessRecord* record = records_.find(id);
    if (!record || !record->is_initialized) {
        reject(ErrorCode::NotInitialized, id, op);
    }
    return *record;
}

void ConsciousnessEngine::initialize_consciousness(const BlockContext& ctx, CharacterId id,
                                                   uint64_t awareness) {
    Transaction tx({&records_, &events_});

    if (is_initialized(id)) {
        reject(ErrorCode::AlreadyInitialized, id, "initialize_consciousness");
    }
    if (awareness == 0 || awareness > config_.max_awareness) {
        reject(ErrorCode::InvalidAwarenessLevel, id, "initialize_consciousness");
    }

    ConsciousnessRecord& record = records_.modify(id);
    record.beliefs.push_back(defaults::BELIEF);
    record.values.push_back(defaults::VALUE);
    record.goals.push_back(defaults::GOAL);
    record.priorities["survival"] = 90;
    record.priorities["learning"] = 80;
    record.priorities["connection"] = 70;
    record.awareness_level = awareness;
    record.coherence_level = config_.initial_coherence;
    record.evolution_points = 0;
    record.last_update_time = ctx.timestamp;
    record.is_initialized = true;

    events_.emit({EventKind::ConsciousnessInitialized, id, std::nullopt, "", awareness, ctx.timestamp});
    tx.commit();

    log_debug("consciousness", "initialized %llu with awareness %llu",
              static_cast<unsigned long long>(id), static_cast<unsigned long long>(awareness));
}

EvolutionReport ConsciousnessEngine::evolve_consciousness(const BlockContext& ctx, CharacterId id,
                                                          const std::string& experience,
                                                          const std::string& outcome) {
    Transaction tx({&records_, &events_});

    const ConsciousnessRecord& current = require_initialized(id, "evolve_consciousness");
    if (ctx.timestamp < current.last_update_time ||
        ctx.timestamp - current.last_update_time < config_.cooldown_seconds) {
        reject(ErrorCode::CooldownNotElapsed, id, "evolve_consciousness");
    }

    ConsciousnessRecord& record = records_.modify(id);
    EvolutionReport report;

    // Every experience becomes a belief, duplicates included
    record.beliefs.push_back(experience);

    report.confidence = std::min(config_.max_confidence,
                                 (record.awareness_level + record.coherence_level) / 2);
    record.decision_history.push_back(
        {experience, defaults::REASONING, outcome, ctx.timestamp, report.confidence, true});
    events_.emit({EventKind::DecisionMade, id, std::nullopt, experience, report.confidence, ctx.timestamp});

    report.impact = 1 + record.coherence_level / 20;
    auto goal = std::find(record.goals.begin(), record.goals.end(), experience);
    if (goal != record.goals.end()) {
        report.impact += 2;
    }

    record.awareness_level = std::min(config_.max_awareness, record.awareness_level + report.impact);
    record.evolution_points = checked_add(record.evolution_points, report.impact, id);
    record.last_update_time = ctx.timestamp;

    check_breakthrough(ctx, id, record, experience, report);
    report.awareness = record.awareness_level;

    events_.emit({EventKind::ConsciousnessEvolved, id, std::nullopt, experience,
                  record.awareness_level, ctx.timestamp});
    tx.commit();

    log_debug("consciousness", "%llu evolved: impact %llu awareness %llu points %llu%s",
              static_cast<unsigned long long>(id),
              static_cast<unsigned long long>(report.impact),
              static_cast<unsigned long long>(record.awareness_level),
              static_cast<unsigned long long>(record.evolution_points),
              report.breakthrough ? " (breakthrough)" : "");
    return report;
}

bool ConsciousnessEngine::check_breakthrough(const BlockContext& ctx, CharacterId id,
                                             ConsciousnessRecord& record,
                                             const std::string& experience,
                                             EvolutionReport& report) {
    if (record.achieved_breakthroughs.count(experience) > 0) {
        return false;
    }

    // Unclamped: above 100 the breakthrough is certain
    report.breakthrough_probability =
        (record.awareness_level * record.coherence_level) / 100 + record.evolution_points / 100;

    uint64_t draw = digest_mod(seeds_->evolution_seed(ctx, id, experience), 100);
    if (draw >= report.breakthrough_probability) {
        return false;
    }

    record.achieved_breakthroughs.insert(experience);
    record.evolution_points = checked_add(record.evolution_points, config_.breakthrough_bonus, id);
    report.breakthrough = true;

    events_.emit({EventKind::BreakthroughAchieved, id, std::nullopt, experience,
                  record.evolution_points, ctx.timestamp});
    return true;
}

void ConsciousnessEngine::add_goal(const BlockContext& ctx, CharacterId id, const std::string& goal) {
    Transaction tx({&records_, &events_});
    require_initialized(id, "add_goal");

    records_.modify(id).goals.push_back(goal);
    events_.emit({EventKind::GoalAdded, id, std::nullopt, goal, 0, ctx.timestamp});
    tx.commit();
}

void ConsciousnessEngine::add_belief(const BlockContext& ctx, CharacterId id,
                                     const std::string& belief) {
    Transaction tx({&records_, &events_});
    require_initialized(id, "add_belief");

    records_.modify(id).beliefs.push_back(belief);
    events_.emit({EventKind::BeliefAdded, id, std::nullopt, belief, 0, ctx.timestamp});
    tx.commit();
}

void ConsciousnessEngine::add_value(const BlockContext& ctx, CharacterId id,
                                    const std::string& value, uint64_t priority) {
    Transaction tx({&records_, &events_});
    require_initialized(id, "add_value");
    if (priority > 100) {
        reject(ErrorCode::InvalidPriority, id, "add_value");
    }

    ConsciousnessRecord& record = records_.modify(id);
    record.values.push_back(value);
    record.priorities[value] = priority;

    events_.emit({EventKind::ValueAdded, id, std::nullopt, value, priority, ctx.timestamp});
    tx.commit();
}

bool ConsciousnessEngine::is_initialized(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record && record->is_initialized;
}

uint64_t ConsciousnessEngine::awareness_level(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record ? record->awareness_level : 0;
}

uint64_t ConsciousnessEngine::coherence_level(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record ? record->coherence_level : 0;
}

uint64_t ConsciousnessEngine::evolution_points(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record ? record->evolution_points : 0;
}

Timestamp ConsciousnessEngine::last_update_time(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record ? record->last_update_time : 0;
}

std::vector<std::string> ConsciousnessEngine::beliefs(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record ? record->beliefs : std::vector<std::string>{};
}

std::vector<std::string> ConsciousnessEngine::values(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record ? record->values : std::vector<std::string>{};
}

std::vector<std::string> ConsciousnessEngine::goals(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record ? record->goals : std::vector<std::string>{};
}

std::vector<Decision> ConsciousnessEngine::decision_history(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record ? record->decision_history : std::vector<Decision>{};
}

size_t ConsciousnessEngine::belief_count(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record ? record->beliefs.size() : 0;
}

size_t ConsciousnessEngine::value_count(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record ? record->values.size() : 0;
}

size_t ConsciousnessEngine::goal_count(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record ? record->goals.size() : 0;
}

size_t ConsciousnessEngine::decision_count(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record ? record->decision_history.size() : 0;
}

bool ConsciousnessEngine::has_breakthrough(CharacterId id, const std::string& experience) const {
    const ConsciousnessRecord* record = records_.find(id);
    return record && record->achieved_breakthroughs.count(experience) > 0;
}

std::vector<std::string> ConsciousnessEngine::breakthroughs(CharacterId id) const {
    const ConsciousnessRecord* record = records_.find(id);
    if (!record) return {};
    return std::vector<std::string>(record->achieved_breakthroughs.begin(),
                                    record->achieved_breakthroughs.end());
}

uint64_t ConsciousnessEngine::priority(CharacterId id, const std::string& key) const {
    const ConsciousnessRecord& record = require_initialized(id, "priority");
    auto it = record.priorities.find(key);
    return it != record.priorities.end() ? it->second : 0;
}

} // namespace psyche
