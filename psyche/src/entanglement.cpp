#include <psyche/entanglement.hpp>
#include <psyche/log.hpp>

namespace psyche {

EntanglementNetwork::EntanglementNetwork(EventLog& events)
    : events_(events) {}

void EntanglementNetwork::reject(ErrorCode code, CharacterId id, const char* op) const {
    log_debug("entanglement", "%s rejected for %llu: %s",
              op, static_cast<unsigned long long>(id), error_name(code));
    throw ContractError(code, id);
}

void EntanglementNetwork::initialize_quantum_state(const BlockContext& ctx, CharacterId id,
                                                   uint64_t factor) {
    Transaction tx({&states_, &events_});

    const QuantumState* existing = states_.find(id);
    if (existing && existing->initialized()) {
        reject(ErrorCode::AlreadyInitialized, id, "initialize_quantum_state");
    }

    QuantumState& state = states_.modify(id);
    state.entanglement_factor = factor;
    state.is_collapsed = false;

    events_.emit({EventKind::QuantumStateInitialized, id, std::nullopt, "", factor, ctx.timestamp});
    tx.commit();

    log_debug("entanglement", "initialized %llu with factor %llu",
              static_cast<unsigned long long>(id), static_cast<unsigned long long>(factor));
}

void EntanglementNetwork::add_superposition_state(const BlockContext& ctx, CharacterId id,
                                                  const std::string& label) {
    Transaction tx({&states_, &events_});

    const QuantumState* existing = states_.find(id);
    if (!existing || !existing->initialized()) {
        reject(ErrorCode::NotInitialized, id, "add_superposition_state");
    }
    if (existing->is_collapsed) {
        reject(ErrorCode::AlreadyCollapsed, id, "add_superposition_state");
    }

    QuantumState& state = states_.modify(id);
    state.superposition_states.push_back(label);

    events_.emit({EventKind::SuperpositionAdded, id, std::nullopt, label,
                  state.superposition_states.size(), ctx.timestamp});
    tx.commit();
}

uint64_t EntanglementNetwork::create_quantum_bond(const BlockContext& ctx, CharacterId a,
                                                  CharacterId b) {
    Transaction tx({&states_, &adjacency_, &events_});

    if (a == b) {
        reject(ErrorCode::SelfEntanglement, a, "create_quantum_bond");
    }
    if (is_entangled(a, b)) {
        reject(ErrorCode::AlreadyEntangled, a, "create_quantum_bond");
    }
    if (!is_initialized(a)) {
        reject(ErrorCode::NotInitialized, a, "create_quantum_bond");
    }
    if (!is_initialized(b)) {
        reject(ErrorCode::NotInitialized, b, "create_quantum_bond");
    }

    uint64_t factor_a = states_.find(a)->entanglement_factor;
    uint64_t factor_b = states_.find(b)->entanglement_factor;

    // floor((a + b) / 2) without overflowing the sum
    uint64_t strength = (factor_a >> 1) + (factor_b >> 1) + (factor_a & factor_b & 1);
    uint64_t growth = strength / 10;

    QuantumState& state_a = states_.modify(a);
    state_a.quantum_bonds[b] = strength;
    state_a.entanglement_factor = checked_add(state_a.entanglement_factor, growth, a);

    QuantumState& state_b = states_.modify(b);
    state_b.quantum_bonds[a] = strength;
    state_b.entanglement_factor = checked_add(state_b.entanglement_factor, growth, b);

    adjacency_.modify(a).insert(b);
    adjacency_.modify(b).insert(a);

    events_.emit({EventKind::QuantumBondFormed, a, b, "", strength, ctx.timestamp});
    tx.commit();

    log_debug("entanglement", "bonded %llu <-> %llu strength %llu",
              static_cast<unsigned long long>(a), static_cast<unsigned long long>(b),
              static_cast<unsigned long long>(strength));
    return strength;
}

void EntanglementNetwork::collapse_quantum_state(const BlockContext& ctx, CharacterId id) {
    Transaction tx({&states_, &events_});

    const QuantumState* existing = states_.find(id);
    if (existing && existing->is_collapsed) {
        reject(ErrorCode::AlreadyCollapsed, id, "collapse_quantum_state");
    }

    QuantumState& state = states_.modify(id);
    state.is_collapsed = true;
    state.superposition_states.clear();

    events_.emit({EventKind::StateCollapsed, id, std::nullopt, "",
                  state.entanglement_factor, ctx.timestamp});
    tx.commit();
}

uint64_t EntanglementNetwork::entanglement_factor(CharacterId id) const {
    const QuantumState* state = states_.find(id);
    return state ? state->entanglement_factor : 0;
}

std::vector<std::string> EntanglementNetwork::superposition_states(CharacterId id) const {
    const QuantumState* state = states_.find(id);
    return state ? state->superposition_states : std::vector<std::string>{};
}

bool EntanglementNetwork::is_collapsed(CharacterId id) const {
    const QuantumState* state = states_.find(id);
    return state && state->is_collapsed;
}

bool EntanglementNetwork::is_initialized(CharacterId id) const {
    const QuantumState* state = states_.find(id);
    return state && state->initialized();
}

uint64_t EntanglementNetwork::bond_strength(CharacterId a, CharacterId b) const {
    const QuantumState* state = states_.find(a);
    if (!state) return 0;
    auto it = state->quantum_bonds.find(b);
    return it != state->quantum_bonds.end() ? it->second : 0;
}

bool EntanglementNetwork::is_entangled(CharacterId a, CharacterId b) const {
    const PeerSet* peers = adjacency_.find(a);
    return peers && peers->count(b) > 0;
}

std::vector<CharacterId> EntanglementNetwork::entangled_peers(CharacterId id) const {
    const PeerSet* peers = adjacency_.find(id);
    if (!peers) return {};
    return std::vector<CharacterId>(peers->begin(), peers->end());
}

} // namespace psyche
