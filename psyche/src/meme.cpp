#include <psyche/meme.hpp>
#include <psyche/log.hpp>

namespace psyche {

std::string mutate_byte(const std::string& text, size_t index, uint8_t threshold) {
    std::string mutated = text;
    auto byte = static_cast<uint8_t>(mutated.at(index));
    if (byte < threshold) {
        ++byte;
    } else {
        --byte;
    }
    mutated[index] = static_cast<char>(byte);
    return mutated;
}

void MemeEngine::reject(ErrorCode code, CharacterId id, const char* op) const {
    log_debug("meme", "%s rejected for %llu: %s",
              op, static_cast<unsigned long long>(id), error_name(code));
    throw ContractError(code, id);
}

MemeEngine::MemeEngine(const EntanglementNetwork& network, EventLog& events,
                       const EngineConfig& config, std::shared_ptr<SeedSource> seeds)
    : network_(network)
    , events_(events)
    , config_(config)
    , seeds_(std::move(seeds)) {}

std::vector<CharacterId> MemeEngine::broadcast_candidates(CharacterId id) const {
    if (config_.propagation_bound == PropagationBound::Adjacency) {
        return network_.entangled_peers(id);
    }

    // Reference bound: peer IDs below the source's superposition count.
    // Entangled peers with larger IDs are never reached.
    std::vector<CharacterId> out;
    size_t bound = network_.superposition_states(id).size();
    for (CharacterId i = 0; i < bound; ++i) {
        if (network_.is_entangled(id, i)) out.push_back(i);
    }
    return out;
}

PropagationReport MemeEngine::propagate_meme(const BlockContext& ctx, CharacterId id,
                                             const std::string& meme) {
    Transaction tx({&patterns_, &events_});

    if (!network_.is_initialized(id)) {
        reject(ErrorCode::NotInitialized, id, "propagate_meme");
    }

    PropagationReport report;

    MemeticPattern& source = patterns_.modify(id);
    source.memes.push_back(meme);
    if (source.mutation_rate == 0) {
        source.mutation_rate = config_.default_mutation_rate;
    }

    // One seed per call: gate and index both come from it
    Digest seed = seeds_->network_seed(ctx);
    if (digest_mod(seed, 100) < source.mutation_rate && !meme.empty()) {
        size_t index = digest_mod(seed, meme.size());
        std::string mutated = mutate_byte(meme, index, config_.mutation_threshold);
        source.memes.push_back(mutated);
        events_.emit({EventKind::MemeMutated, id, std::nullopt, mutated, index, ctx.timestamp});
        report.mutation = std::move(mutated);
    }

    for (CharacterId peer : broadcast_candidates(id)) {
        MemeticPattern& target = patterns_.modify(peer);
        target.memes.push_back(meme);
        target.virality = checked_add(target.virality, 1, peer);
        target.propagation_paths[id] = checked_add(target.propagation_paths[id], 1, peer);
        events_.emit({EventKind::MemePropagated, id, peer, meme, target.virality, ctx.timestamp});
        report.recipients.push_back(peer);
    }

    tx.commit();

    log_debug("meme", "%llu propagated \"%s\" to %zu peers%s",
              static_cast<unsigned long long>(id), meme.c_str(), report.recipients.size(),
              report.mutation ? " (mutated)" : "");
    return report;
}

void MemeEngine::set_mutation_rate(CharacterId id, uint64_t rate) {
    Transaction tx({&patterns_});

    if (!network_.is_initialized(id)) {
        reject(ErrorCode::NotInitialized, id, "set_mutation_rate");
    }
    if (rate > 100) {
        reject(ErrorCode::InvalidMutationRate, id, "set_mutation_rate");
    }

    patterns_.modify(id).mutation_rate = rate;
    tx.commit();
}

std::vector<std::string> MemeEngine::memes(CharacterId id) const {
    const MemeticPattern* pattern = patterns_.find(id);
    return pattern ? pattern->memes : std::vector<std::string>{};
}

size_t MemeEngine::meme_count(CharacterId id) const {
    const MemeticPattern* pattern = patterns_.find(id);
    return pattern ? pattern->memes.size() : 0;
}

uint64_t MemeEngine::virality(CharacterId id) const {
    const MemeticPattern* pattern = patterns_.find(id);
    return pattern ? pattern->virality : 0;
}

uint64_t MemeEngine::mutation_rate(CharacterId id) const {
    const MemeticPattern* pattern = patterns_.find(id);
    return pattern ? pattern->mutation_rate : 0;
}

uint64_t MemeEngine::propagation_count(CharacterId target, CharacterId source) const {
    const MemeticPattern* pattern = patterns_.find(target);
    if (!pattern) return 0;
    auto it = pattern->propagation_paths.find(source);
    return it != pattern->propagation_paths.end() ? it->second : 0;
}

} // namespace psyche
