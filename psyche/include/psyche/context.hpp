#pragma once
// Block context and seed derivation
//
// Randomness here is NOT secure. Every seed is a hash of values the block
// producer chooses or anyone can read before submitting a call, so outcomes
// can be predicted and biased. The derivation surface is kept as-is.

#include "types.hpp"
#include "hash.hpp"
#include <string>

namespace psyche {

// Execution environment of one call
struct BlockContext {
    Timestamp timestamp = 0;
    Address caller = 0;
    uint64_t gas_price = 0;
    Digest prev_block_hash{};  // hash of the previous block
    Digest prevrandao{};       // per-block unpredictable value
};

// Injectable source of per-call pseudo-random digests
class SeedSource {
public:
    virtual ~SeedSource() = default;

    // Seed for the entanglement network and meme engine
    virtual Digest network_seed(const BlockContext& ctx) = 0;

    // Seed for a consciousness breakthrough draw
    virtual Digest evolution_seed(const BlockContext& ctx, CharacterId id,
                                  const std::string& experience) = 0;
};

// Production derivation from block data
//   network:   sha256(timestamp, caller, gas_price, prev_block_hash)
//   evolution: sha256(timestamp, prevrandao, id, sha256(experience))
class BlockHashSeed : public SeedSource {
public:
    Digest network_seed(const BlockContext& ctx) override;
    Digest evolution_seed(const BlockContext& ctx, CharacterId id,
                          const std::string& experience) override;
};

} // namespace psyche
