#pragma once
// Engine configuration
//
// Defaults reproduce the reference behavior. A JSON file may override any
// subset of the keys.

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace psyche {

// Which peer IDs a meme broadcast considers
enum class PropagationBound {
    SuperpositionLength,  // IDs 0..len(source superposition list)-1 (reference bound)
    Adjacency             // the source's actual entangled peers
};

struct EngineConfig {
    uint64_t cooldown_seconds = 3600;       // between evolutions of one character
    uint64_t default_mutation_rate = 10;    // percent, applied on first propagation
    uint8_t mutation_threshold = 126;       // bytes below are incremented, others decremented
    uint64_t breakthrough_bonus = 5;        // evolution points per breakthrough
    uint64_t max_confidence = 95;           // decision confidence ceiling
    uint64_t initial_coherence = 50;
    uint64_t max_awareness = 100;
    PropagationBound propagation_bound = PropagationBound::SuperpositionLength;
    bool verbose = false;
};

const char* propagation_bound_name(PropagationBound bound);

void to_json(nlohmann::json& j, const EngineConfig& c);
void from_json(const nlohmann::json& j, EngineConfig& c);

// Throws std::runtime_error if the file cannot be read or parsed
EngineConfig load_config(const std::string& path);
EngineConfig config_from_json(const std::string& text);

} // namespace psyche
