#pragma once
// JSON forms of the per-character records (archive payloads)

#include "consciousness.hpp"
#include "entanglement.hpp"
#include "meme.hpp"
#include <nlohmann/json.hpp>

namespace psyche {

void to_json(nlohmann::json& j, const QuantumState& s);
void from_json(const nlohmann::json& j, QuantumState& s);

void to_json(nlohmann::json& j, const MemeticPattern& p);
void from_json(const nlohmann::json& j, MemeticPattern& p);

void to_json(nlohmann::json& j, const Decision& d);
void from_json(const nlohmann::json& j, Decision& d);

void to_json(nlohmann::json& j, const ConsciousnessRecord& r);
void from_json(const nlohmann::json& j, ConsciousnessRecord& r);

} // namespace psyche
