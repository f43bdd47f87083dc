#include <psyche/config.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace psyche {

const char* propagation_bound_name(PropagationBound bound) {
    switch (bound) {
        case PropagationBound::SuperpositionLength: return "superposition_length";
        case PropagationBound::Adjacency: return "adjacency";
    }
    return "unknown";
}

namespace {

PropagationBound parse_bound(const std::string& s) {
    if (s == "superposition_length") return PropagationBound::SuperpositionLength;
    if (s == "adjacency") return PropagationBound::Adjacency;
    throw std::runtime_error("Invalid propagation_bound: " + s);
}

} // namespace

void to_json(nlohmann::json& j, const EngineConfig& c) {
    j = {
        {"cooldown_seconds", c.cooldown_seconds},
        {"default_mutation_rate", c.default_mutation_rate},
        {"mutation_threshold", c.mutation_threshold},
        {"breakthrough_bonus", c.breakthrough_bonus},
        {"max_confidence", c.max_confidence},
        {"initial_coherence", c.initial_coherence},
        {"max_awareness", c.max_awareness},
        {"propagation_bound", propagation_bound_name(c.propagation_bound)},
        {"verbose", c.verbose}
    };
}

void from_json(const nlohmann::json& j, EngineConfig& c) {
    EngineConfig defaults;
    c.cooldown_seconds = j.value("cooldown_seconds", defaults.cooldown_seconds);
    c.default_mutation_rate = j.value("default_mutation_rate", defaults.default_mutation_rate);
    uint64_t threshold = j.value("mutation_threshold", uint64_t{defaults.mutation_threshold});
    if (threshold > 255) {
        throw std::runtime_error("mutation_threshold must be <= 255");
    }
    c.mutation_threshold = static_cast<uint8_t>(threshold);
    c.breakthrough_bonus = j.value("breakthrough_bonus", defaults.breakthrough_bonus);
    c.max_confidence = j.value("max_confidence", defaults.max_confidence);
    c.initial_coherence = j.value("initial_coherence", defaults.initial_coherence);
    c.max_awareness = j.value("max_awareness", defaults.max_awareness);
    c.propagation_bound = j.contains("propagation_bound")
        ? parse_bound(j["propagation_bound"].get<std::string>())
        : defaults.propagation_bound;
    c.verbose = j.value("verbose", defaults.verbose);

    if (c.default_mutation_rate > 100) {
        throw std::runtime_error("default_mutation_rate must be <= 100");
    }
    if (c.max_awareness == 0 || c.max_awareness > 100) {
        throw std::runtime_error("max_awareness must be in (0, 100]");
    }
    if (c.initial_coherence > 100) {
        throw std::runtime_error("initial_coherence must be <= 100");
    }
}

EngineConfig config_from_json(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Config parse error: ") + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }
    return j.get<EngineConfig>();
}

EngineConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return config_from_json(oss.str());
}

} // namespace psyche
