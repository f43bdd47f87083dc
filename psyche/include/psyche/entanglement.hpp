#pragma once
// Entanglement Network: per-character quantum state and bonds
//
// A character is initialized once with a non-zero entanglement factor
// (zero means "uninitialized"). Bonding is symmetric and set-once.
// Collapse is one-way and only clears the superposition list.

#include "types.hpp"
#include "context.hpp"
#include "events.hpp"
#include "store.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace psyche {

struct QuantumState {
    uint64_t entanglement_factor = 0;
    bool is_collapsed = false;
    std::vector<std::string> superposition_states;
    std::map<CharacterId, uint64_t> quantum_bonds;  // peer -> bond strength

    bool initialized() const { return entanglement_factor != 0; }
};

// Symmetric adjacency, stored as each character's peer set
using PeerSet = std::set<CharacterId>;

class EntanglementNetwork {
public:
    explicit EntanglementNetwork(EventLog& events);

    // First write wins. factor must be non-zero to mark the slot initialized.
    void initialize_quantum_state(const BlockContext& ctx, CharacterId id, uint64_t factor);

    void add_superposition_state(const BlockContext& ctx, CharacterId id, const std::string& label);

    // Returns the bond strength
    uint64_t create_quantum_bond(const BlockContext& ctx, CharacterId a, CharacterId b);

    void collapse_quantum_state(const BlockContext& ctx, CharacterId id);

    // Read accessors (no preconditions; unknown IDs read as zero/empty)
    uint64_t entanglement_factor(CharacterId id) const;
    std::vector<std::string> superposition_states(CharacterId id) const;
    bool is_collapsed(CharacterId id) const;
    bool is_initialized(CharacterId id) const;
    uint64_t bond_strength(CharacterId a, CharacterId b) const;
    bool is_entangled(CharacterId a, CharacterId b) const;
    std::vector<CharacterId> entangled_peers(CharacterId id) const;
    size_t character_count() const { return states_.size(); }

    // Raw stores for persistence and transactions
    Store<QuantumState>& states() { return states_; }
    const Store<QuantumState>& states() const { return states_; }
    Store<PeerSet>& adjacency() { return adjacency_; }
    const Store<PeerSet>& adjacency() const { return adjacency_; }

private:
    [[noreturn]] void reject(ErrorCode code, CharacterId id, const char* op) const;

    EventLog& events_;
    Store<QuantumState> states_;
    Store<PeerSet> adjacency_;
};

} // namespace psyche
