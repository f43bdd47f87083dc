#include <psyche/context.hpp>

namespace psyche {

Digest BlockHashSeed::network_seed(const BlockContext& ctx) {
    return Packer()
        .word(ctx.timestamp)
        .word(ctx.caller)
        .word(ctx.gas_price)
        .digest(ctx.prev_block_hash)
        .sha256();
}

Digest BlockHashSeed::evolution_seed(const BlockContext& ctx, CharacterId id,
                                     const std::string& experience) {
    return Packer()
        .word(ctx.timestamp)
        .digest(ctx.prevrandao)
        .word(id)
        .digest(sha256(experience))
        .sha256();
}

} // namespace psyche
