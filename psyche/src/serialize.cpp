#include <psyche/serialize.hpp>

namespace psyche {

using json = nlohmann::json;

void to_json(json& j, const QuantumState& s) {
    j = {
        {"entanglement_factor", s.entanglement_factor},
        {"is_collapsed", s.is_collapsed},
        {"superposition_states", s.superposition_states},
        {"quantum_bonds", s.quantum_bonds}  // [[peer, strength], ...]
    };
}

void from_json(const json& j, QuantumState& s) {
    s.entanglement_factor = j.at("entanglement_factor").get<uint64_t>();
    s.is_collapsed = j.at("is_collapsed").get<bool>();
    s.superposition_states = j.at("superposition_states").get<std::vector<std::string>>();
    s.quantum_bonds = j.at("quantum_bonds").get<std::map<CharacterId, uint64_t>>();
}

void to_json(json& j, const MemeticPattern& p) {
    j = {
        {"memes", p.memes},
        {"virality", p.virality},
        {"mutation_rate", p.mutation_rate},
        {"propagation_paths", p.propagation_paths}
    };
}

void from_json(const json& j, MemeticPattern& p) {
    p.memes = j.at("memes").get<std::vector<std::string>>();
    p.virality = j.at("virality").get<uint64_t>();
    p.mutation_rate = j.at("mutation_rate").get<uint64_t>();
    p.propagation_paths = j.at("propagation_paths").get<std::map<CharacterId, uint64_t>>();
}

void to_json(json& j, const Decision& d) {
    j = {
        {"context", d.context},
        {"reasoning", d.reasoning},
        {"outcome", d.outcome},
        {"timestamp", d.timestamp},
        {"confidence", d.confidence},
        {"success", d.success}
    };
}

void from_json(const json& j, Decision& d) {
    d.context = j.at("context").get<std::string>();
    d.reasoning = j.at("reasoning").get<std::string>();
    d.outcome = j.at("outcome").get<std::string>();
    d.timestamp = j.at("timestamp").get<Timestamp>();
    d.confidence = j.at("confidence").get<uint64_t>();
    d.success = j.at("success").get<bool>();
}

void to_json(json& j, const ConsciousnessRecord& r) {
    j = {
        {"beliefs", r.beliefs},
        {"values", r.values},
        {"goals", r.goals},
        {"priorities", r.priorities},
        {"decision_history", r.decision_history},
        {"awareness_level", r.awareness_level},
        {"coherence_level", r.coherence_level},
        {"evolution_points", r.evolution_points},
        {"achieved_breakthroughs", r.achieved_breakthroughs},
        {"last_update_time", r.last_update_time},
        {"is_initialized", r.is_initialized}
    };
}

void from_json(const json& j, ConsciousnessRecord& r) {
    r.beliefs = j.at("beliefs").get<std::vector<std::string>>();
    r.values = j.at("values").get<std::vector<std::string>>();
    r.goals = j.at("goals").get<std::vector<std::string>>();
    r.priorities = j.at("priorities").get<std::map<std::string, uint64_t>>();
    r.decision_history = j.at("decision_history").get<std::vector<Decision>>();
    r.awareness_level = j.at("awareness_level").get<uint64_t>();
    r.coherence_level = j.at("coherence_level").get<uint64_t>();
    r.evolution_points = j.at("evolution_points").get<uint64_t>();
    r.achieved_breakthroughs = j.at("achieved_breakthroughs").get<std::set<std::string>>();
    r.last_update_time = j.at("last_update_time").get<Timestamp>();
    r.is_initialized = j.at("is_initialized").get<bool>();
}

} // namespace psyche
