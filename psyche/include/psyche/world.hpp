#pragma once
// World: both simulation cores over one event stream
//
// The entanglement network (with its meme engine) and the consciousness
// engine share only the character-ID namespace, the config and the seed
// source. Neither calls into the other.

#include "config.hpp"
#include "consciousness.hpp"
#include "context.hpp"
#include "entanglement.hpp"
#include "events.hpp"
#include "log.hpp"
#include "meme.hpp"
#include <memory>

namespace psyche {

class World {
public:
    explicit World(EngineConfig config = {},
                   std::shared_ptr<SeedSource> seeds = std::make_shared<BlockHashSeed>())
        : config_(std::move(config))
        , seeds_(std::move(seeds))
        , network_(events_)
        , memes_(network_, events_, config_, seeds_)
        , consciousness_(events_, config_, seeds_) {
        if (config_.verbose) set_verbose(true);
    }

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    const EngineConfig& config() const { return config_; }
    EventLog& events() { return events_; }
    const EventLog& events() const { return events_; }
    EntanglementNetwork& network() { return network_; }
    const EntanglementNetwork& network() const { return network_; }
    MemeEngine& memes() { return memes_; }
    const MemeEngine& memes() const { return memes_; }
    ConsciousnessEngine& consciousness() { return consciousness_; }
    const ConsciousnessEngine& consciousness() const { return consciousness_; }

private:
    EngineConfig config_;
    std::shared_ptr<SeedSource> seeds_;
    EventLog events_;
    EntanglementNetwork network_;
    MemeEngine memes_;
    ConsciousnessEngine consciousness_;
};

} // namespace psyche
