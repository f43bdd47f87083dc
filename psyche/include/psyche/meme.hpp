#pragma once
// Meme Engine: memetic patterns spread over the entanglement graph
//
// propagate_meme appends to the source pattern, may append a single-byte
// mutation of the meme, then broadcasts the original meme to entangled
// peers. Which peer IDs are considered is set by EngineConfig::propagation_bound.

#include "types.hpp"
#include "config.hpp"
#include "context.hpp"
#include "entanglement.hpp"
#include "events.hpp"
#include "store.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace psyche {

struct MemeticPattern {
    std::vector<std::string> memes;
    uint64_t virality = 0;
    uint64_t mutation_rate = 0;  // percent; 0 = unset
    std::map<CharacterId, uint64_t> propagation_paths;  // source -> inbound count
};

// Outcome of one propagate_meme call
struct PropagationReport {
    std::optional<std::string> mutation;
    std::vector<CharacterId> recipients;
};

// Copy of text differing in exactly one byte: the byte at index is
// incremented if below threshold, decremented otherwise. text must be non-empty.
std::string mutate_byte(const std::string& text, size_t index, uint8_t threshold);

class MemeEngine {
public:
    MemeEngine(const EntanglementNetwork& network, EventLog& events,
               const EngineConfig& config, std::shared_ptr<SeedSource> seeds);

    PropagationReport propagate_meme(const BlockContext& ctx, CharacterId id,
                                     const std::string& meme);

    // 0 restores the default on the next propagation
    void set_mutation_rate(CharacterId id, uint64_t rate);

    std::vector<std::string> memes(CharacterId id) const;
    size_t meme_count(CharacterId id) const;
    uint64_t virality(CharacterId id) const;
    uint64_t mutation_rate(CharacterId id) const;
    uint64_t propagation_count(CharacterId target, CharacterId source) const;

    Store<MemeticPattern>& patterns() { return patterns_; }
    const Store<MemeticPattern>& patterns() const { return patterns_; }

private:
    [[noreturn]] void reject(ErrorCode code, CharacterId id, const char* op) const;
    std::vector<CharacterId> broadcast_candidates(CharacterId id) const;

    const EntanglementNetwork& network_;
    EventLog& events_;
    const EngineConfig& config_;
    std::shared_ptr<SeedSource> seeds_;
    Store<MemeticPattern> patterns_;
};

} // namespace psyche
