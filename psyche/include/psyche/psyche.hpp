#pragma once
// Psyche: simulated characters with evolving state
//
// - Types: character IDs, block time, contract errors
// - Context: block context and (insecure) seed derivation
// - Store: keyed records with all-or-nothing writes
// - Entanglement: quantum bonds between characters
// - Meme: mutation and broadcast over the bond graph
// - Consciousness: cooldown-gated evolution and breakthroughs
// - Archive: SQLite checkpoints

#include "version.hpp"
#include "types.hpp"
#include "log.hpp"
#include "config.hpp"
#include "hash.hpp"
#include "context.hpp"
#include "store.hpp"
#include "events.hpp"
#include "entanglement.hpp"
#include "meme.hpp"
#include "consciousness.hpp"
#include "world.hpp"
#include "serialize.hpp"
#include "archive.hpp"
