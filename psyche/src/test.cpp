#include <psyche/psyche.hpp>
#include <iostream>
#include <cassert>
#include <deque>
#include <limits>
#include <sstream>

using namespace psyche;

// Seeds whose digest reduces to a chosen byte value; 99 when the script runs dry
class ScriptedSeed : public SeedSource {
public:
    std::deque<uint8_t> network;
    std::deque<uint8_t> evolution;

    Digest network_seed(const BlockContext&) override { return next(network); }

    Digest evolution_seed(const BlockContext&, CharacterId, const std::string&) override {
        return next(evolution);
    }

private:
    static Digest next(std::deque<uint8_t>& script) {
        Digest d{};
        d[31] = 99;
        if (!script.empty()) {
            d[31] = script.front();
            script.pop_front();
        }
        return d;
    }
};

BlockContext at(Timestamp t) {
    BlockContext ctx;
    ctx.timestamp = t;
    ctx.caller = 0xC0FFEE;
    ctx.gas_price = 20;
    return ctx;
}

template <typename F>
void expect_error(ErrorCode code, F&& func) {
    try {
        func();
    } catch (const ContractError& e) {
        assert(e.code() == code);
        return;
    }
    assert(false && "expected ContractError");
}

void test_digest_mod() {
    std::cout << "Testing digest_mod..." << std::endl;

    Digest d{};
    d[30] = 0x01;
    d[31] = 0x01;  // 257
    assert(digest_mod(d, 100) == 57);
    assert(digest_mod(d, 256) == 1);

    Digest ones;
    ones.fill(0xFF);  // 2^256 - 1 = ...935 -> mod 100 is 35
    assert(digest_mod(ones, 100) == 35);

    std::cout << "  PASS" << std::endl;
}

void test_block_hash_seed() {
    std::cout << "Testing BlockHashSeed..." << std::endl;

    BlockHashSeed seeds;
    BlockContext ctx = at(1700000000);

    // Anyone holding the block data can reproduce the draw
    assert(seeds.network_seed(ctx) == seeds.network_seed(ctx));

    BlockContext pricier = ctx;
    pricier.gas_price = 21;
    assert(seeds.network_seed(ctx) != seeds.network_seed(pricier));

    assert(seeds.evolution_seed(ctx, 1, "rain") == seeds.evolution_seed(ctx, 1, "rain"));
    assert(seeds.evolution_seed(ctx, 1, "rain") != seeds.evolution_seed(ctx, 1, "snow"));
    assert(seeds.evolution_seed(ctx, 1, "rain") != seeds.evolution_seed(ctx, 2, "rain"));

    assert(to_hex(sha256("")) ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    std::cout << "  PASS" << std::endl;
}

void test_store_rollback() {
    std::cout << "Testing Store rollback..." << std::endl;

    Store<int> store;
    store.modify(1) = 10;

    {
        Transaction tx({&store});
        store.modify(1) = 11;
        store.modify(2) = 20;
        // Destroyed without commit
    }
    assert(*store.find(1) == 10);
    assert(!store.contains(2));

    {
        Transaction tx({&store});
        store.modify(2) = 20;
        tx.commit();
    }
    assert(*store.find(2) == 20);
    assert(store.keys() == (std::vector<CharacterId>{1, 2}));

    std::cout << "  PASS" << std::endl;
}

void test_quantum_initialize() {
    std::cout << "Testing quantum initialization..." << std::endl;

    World world;
    auto& net = world.network();

    assert(!net.is_initialized(1));
    net.initialize_quantum_state(at(1), 1, 10);
    assert(net.is_initialized(1));
    assert(net.entanglement_factor(1) == 10);
    assert(!net.is_collapsed(1));

    size_t events = world.events().size();
    expect_error(ErrorCode::AlreadyInitialized, [&] { net.initialize_quantum_state(at(2), 1, 99); });
    assert(net.entanglement_factor(1) == 10);
    assert(world.events().size() == events);

    std::cout << "  PASS" << std::endl;
}

void test_quantum_bond() {
    std::cout << "Testing quantum bond..." << std::endl;

    World world;
    auto& net = world.network();
    net.initialize_quantum_state(at(1), 1, 10);
    net.initialize_quantum_state(at(1), 2, 20);

    uint64_t strength = net.create_quantum_bond(at(2), 1, 2);
    assert(strength == 15);
    assert(net.bond_strength(1, 2) == 15);
    assert(net.bond_strength(2, 1) == 15);
    assert(net.is_entangled(1, 2));
    assert(net.is_entangled(2, 1));
    assert(net.entanglement_factor(1) == 11);
    assert(net.entanglement_factor(2) == 21);
    assert(world.events().count(EventKind::QuantumBondFormed) == 1);

    expect_error(ErrorCode::AlreadyEntangled, [&] { net.create_quantum_bond(at(3), 1, 2); });
    expect_error(ErrorCode::AlreadyEntangled, [&] { net.create_quantum_bond(at(3), 2, 1); });
    assert(net.entanglement_factor(1) == 11);
    assert(world.events().count(EventKind::QuantumBondFormed) == 1);

    std::cout << "  PASS" << std::endl;
}

void test_quantum_bond_rejections() {
    std::cout << "Testing quantum bond rejections..." << std::endl;

    World world;
    auto& net = world.network();
    net.initialize_quantum_state(at(1), 1, 7);

    expect_error(ErrorCode::NotInitialized, [&] { net.create_quantum_bond(at(2), 1, 9); });
    expect_error(ErrorCode::NotInitialized, [&] { net.create_quantum_bond(at(2), 9, 1); });
    expect_error(ErrorCode::SelfEntanglement, [&] { net.create_quantum_bond(at(2), 1, 1); });
    assert(!net.is_entangled(1, 9));
    assert(net.bond_strength(1, 9) == 0);
    assert(net.entangled_peers(1).empty());
    assert(net.entanglement_factor(1) == 7);

    // Overflow in factor growth reverts the whole bond
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    net.initialize_quantum_state(at(3), 20, max);
    net.initialize_quantum_state(at(3), 21, max);
    expect_error(ErrorCode::ArithmeticOverflow, [&] { net.create_quantum_bond(at(4), 20, 21); });
    assert(!net.is_entangled(20, 21));
    assert(!net.is_entangled(21, 20));
    assert(net.bond_strength(20, 21) == 0);
    assert(net.entanglement_factor(20) == max);

    std::cout << "  PASS" << std::endl;
}

void test_bond_symmetry() {
    std::cout << "Testing bond symmetry..." << std::endl;

    World world;
    auto& net = world.network();
    for (CharacterId id = 1; id <= 8; ++id) {
        net.initialize_quantum_state(at(1), id, id * 13);
    }

    for (CharacterId a = 1; a <= 8; ++a) {
        for (CharacterId b = a + 1; b <= 8; b += 2) {
            uint64_t fa = net.entanglement_factor(a);
            uint64_t fb = net.entanglement_factor(b);
            uint64_t strength = net.create_quantum_bond(at(2), b, a);
            assert(strength == (fa + fb) / 2);
            assert(net.entanglement_factor(a) == fa + strength / 10);
            assert(net.entanglement_factor(b) == fb + strength / 10);
        }
    }

    for (CharacterId a = 1; a <= 8; ++a) {
        for (CharacterId b = 1; b <= 8; ++b) {
            assert(net.is_entangled(a, b) == net.is_entangled(b, a));
            assert(net.bond_strength(a, b) == net.bond_strength(b, a));
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_collapse() {
    std::cout << "Testing collapse..." << std::endl;

    World world;
    auto& net = world.network();
    net.initialize_quantum_state(at(1), 1, 10);
    net.initialize_quantum_state(at(1), 2, 30);
    net.add_superposition_state(at(2), 1, "wave");
    net.add_superposition_state(at(2), 1, "particle");
    net.create_quantum_bond(at(3), 1, 2);
    assert(net.superposition_states(1).size() == 2);

    net.collapse_quantum_state(at(4), 1);
    assert(net.is_collapsed(1));
    assert(net.superposition_states(1).empty());
    assert(net.is_entangled(1, 2));
    assert(net.bond_strength(1, 2) == 20);
    assert(net.entanglement_factor(1) == 12);

    expect_error(ErrorCode::AlreadyCollapsed, [&] { net.collapse_quantum_state(at(5), 1); });
    expect_error(ErrorCode::AlreadyCollapsed, [&] { net.add_superposition_state(at(5), 1, "x"); });
    expect_error(ErrorCode::NotInitialized, [&] { net.add_superposition_state(at(5), 3, "x"); });
    assert(world.events().count(EventKind::StateCollapsed) == 1);

    std::cout << "  PASS" << std::endl;
}

void test_mutate_byte() {
    std::cout << "Testing mutate_byte..." << std::endl;

    assert(mutate_byte("hello", 0, 126) == "iello");
    assert(mutate_byte("hello", 4, 126) == "hellp");
    assert(mutate_byte("a~", 1, 126) == "a}");

    std::string high(1, static_cast<char>(0xFF));
    std::string mutated = mutate_byte(high, 0, 126);
    assert(mutated.size() == 1);
    assert(static_cast<uint8_t>(mutated[0]) == 0xFE);

    std::cout << "  PASS" << std::endl;
}

void test_meme_uninitialized() {
    std::cout << "Testing meme from uninitialized character..." << std::endl;

    World world;
    expect_error(ErrorCode::NotInitialized, [&] { world.memes().propagate_meme(at(1), 1, "hello"); });
    assert(world.memes().memes(1).empty());
    assert(world.memes().patterns().empty());
    assert(world.events().empty());

    std::cout << "  PASS" << std::endl;
}

void test_meme_mutation() {
    std::cout << "Testing meme mutation..." << std::endl;

    auto seeds = std::make_shared<ScriptedSeed>();
    World world(EngineConfig{}, seeds);
    world.network().initialize_quantum_state(at(1), 1, 10);

    // 5 < 10 (default rate): mutate at index 5 % 5 = 0
    seeds->network.push_back(5);
    auto report = world.memes().propagate_meme(at(2), 1, "hello");
    assert(report.mutation.has_value());
    assert(*report.mutation == "iello");
    assert(world.memes().memes(1) == (std::vector<std::string>{"hello", "iello"}));
    assert(world.memes().mutation_rate(1) == 10);
    assert(world.events().count(EventKind::MemeMutated) == 1);

    // 10 is not below the rate
    seeds->network.push_back(10);
    report = world.memes().propagate_meme(at(3), 1, "bye");
    assert(!report.mutation.has_value());
    assert(world.memes().meme_count(1) == 3);

    // Empty memes cannot mutate
    seeds->network.push_back(0);
    report = world.memes().propagate_meme(at(4), 1, "");
    assert(!report.mutation.has_value());
    assert(world.memes().meme_count(1) == 4);

    world.memes().set_mutation_rate(1, 100);
    seeds->network.push_back(99);
    report = world.memes().propagate_meme(at(5), 1, "ab");
    assert(report.mutation.has_value());
    assert(*report.mutation == "ac");  // 99 % 2 = 1

    expect_error(ErrorCode::InvalidMutationRate, [&] { world.memes().set_mutation_rate(1, 101); });
    expect_error(ErrorCode::NotInitialized, [&] { world.memes().set_mutation_rate(2, 5); });
    assert(world.memes().mutation_rate(1) == 100);

    std::cout << "  PASS" << std::endl;
}

void test_meme_fanout_superposition_bound() {
    std::cout << "Testing meme fan-out (superposition bound)..." << std::endl;

    auto seeds = std::make_shared<ScriptedSeed>();
    World world(EngineConfig{}, seeds);
    auto& net = world.network();
    for (CharacterId id : {1, 3, 5}) {
        net.initialize_quantum_state(at(1), id, 10);
    }
    net.create_quantum_bond(at(2), 3, 1);
    net.create_quantum_bond(at(2), 3, 5);

    // No superposition states: no peer is reachable
    auto report = world.memes().propagate_meme(at(3), 3, "hi");
    assert(report.recipients.empty());
    assert(world.memes().memes(1).empty());

    // Three states: candidate IDs 0..2, so peer 1 is reached and peer 5 is not
    for (const char* label : {"a", "b", "c"}) {
        net.add_superposition_state(at(4), 3, label);
    }
    report = world.memes().propagate_meme(at(5), 3, "hi");
    assert(report.recipients == (std::vector<CharacterId>{1}));
    assert(world.memes().memes(1) == (std::vector<std::string>{"hi"}));
    assert(world.memes().virality(1) == 1);
    assert(world.memes().propagation_count(1, 3) == 1);
    assert(world.memes().memes(5).empty());
    assert(world.memes().virality(5) == 0);
    assert(world.memes().meme_count(3) == 2);
    assert(world.memes().virality(3) == 0);

    std::cout << "  PASS" << std::endl;
}

void test_meme_fanout_adjacency() {
    std::cout << "Testing meme fan-out (adjacency)..." << std::endl;

    EngineConfig config;
    config.propagation_bound = PropagationBound::Adjacency;
    auto seeds = std::make_shared<ScriptedSeed>();
    World world(config, seeds);
    auto& net = world.network();
    for (CharacterId id : {1, 3, 5, 7}) {
        net.initialize_quantum_state(at(1), id, 10);
    }
    net.create_quantum_bond(at(2), 3, 1);
    net.create_quantum_bond(at(2), 3, 5);

    // Mutated variant stays with the source; peers get the original
    seeds->network.push_back(0);
    auto report = world.memes().propagate_meme(at(3), 3, "zz");
    assert(report.mutation.has_value());
    assert(report.recipients == (std::vector<CharacterId>{1, 5}));
    assert(world.memes().memes(5) == (std::vector<std::string>{"zz"}));
    assert(world.memes().memes(7).empty());

    world.memes().propagate_meme(at(4), 3, "again");
    assert(world.memes().virality(1) == 2);
    assert(world.memes().propagation_count(1, 3) == 2);
    assert(world.memes().propagation_count(3, 1) == 0);
    assert(world.events().count(EventKind::MemePropagated) == 4);

    std::cout << "  PASS" << std::endl;
}

void test_consciousness_initialize() {
    std::cout << "Testing consciousness initialization..." << std::endl;

    World world;
    auto& mind = world.consciousness();

    expect_error(ErrorCode::InvalidAwarenessLevel, [&] { mind.initialize_consciousness(at(1), 1, 0); });
    expect_error(ErrorCode::InvalidAwarenessLevel, [&] { mind.initialize_consciousness(at(1), 1, 101); });
    assert(!mind.is_initialized(1));
    expect_error(ErrorCode::NotInitialized, [&] { mind.priority(1, "survival"); });

    mind.initialize_consciousness(at(1000), 1, 100);
    assert(mind.is_initialized(1));
    assert(mind.awareness_level(1) == 100);
    assert(mind.coherence_level(1) == 50);
    assert(mind.evolution_points(1) == 0);
    assert(mind.last_update_time(1) == 1000);
    assert(mind.belief_count(1) == 1);
    assert(mind.value_count(1) == 1);
    assert(mind.goal_count(1) == 1);
    assert(mind.decision_count(1) == 0);
    assert(mind.priority(1, "survival") == 90);
    assert(mind.priority(1, "learning") == 80);
    assert(mind.priority(1, "connection") == 70);
    assert(mind.priority(1, "nothing") == 0);

    expect_error(ErrorCode::AlreadyInitialized, [&] { mind.initialize_consciousness(at(1001), 1, 5); });
    assert(mind.awareness_level(1) == 100);

    std::cout << "  PASS" << std::endl;
}

void test_evolution_cooldown() {
    std::cout << "Testing evolution cooldown..." << std::endl;

    auto seeds = std::make_shared<ScriptedSeed>();
    World world(EngineConfig{}, seeds);
    auto& mind = world.consciousness();
    mind.initialize_consciousness(at(1000), 1, 10);

    expect_error(ErrorCode::NotInitialized, [&] { mind.evolve_consciousness(at(9000), 2, "x", "y"); });
    expect_error(ErrorCode::CooldownNotElapsed, [&] { mind.evolve_consciousness(at(4599), 1, "rain", "wet"); });
    assert(mind.belief_count(1) == 1);

    auto report = mind.evolve_consciousness(at(4600), 1, "rain", "wet");
    assert(report.impact == 3);
    assert(report.confidence == 30);
    assert(report.breakthrough_probability == 6);
    assert(!report.breakthrough);
    assert(mind.awareness_level(1) == 13);
    assert(mind.evolution_points(1) == 3);
    assert(mind.last_update_time(1) == 4600);
    assert(mind.beliefs(1).back() == "rain");

    auto history = mind.decision_history(1);
    assert(history.size() == 1);
    assert(history[0].context == "rain");
    assert(history[0].outcome == "wet");
    assert(history[0].reasoning == defaults::REASONING);
    assert(history[0].confidence == 30);
    assert(history[0].success);
    assert(history[0].timestamp == 4600);

    expect_error(ErrorCode::CooldownNotElapsed, [&] { mind.evolve_consciousness(at(4600), 1, "rain", "wet"); });

    // Matching a goal adds 2 to the impact; duplicates still become beliefs
    report = mind.evolve_consciousness(at(8200), 1, defaults::GOAL, "progress");
    assert(report.impact == 5);
    assert(mind.awareness_level(1) == 18);
    assert(mind.evolution_points(1) == 8);
    assert(mind.belief_count(1) == 3);

    std::cout << "  PASS" << std::endl;
}

void test_awareness_cap() {
    std::cout << "Testing awareness cap..." << std::endl;

    World world;  // real block-hash seeds
    auto& mind = world.consciousness();
    mind.initialize_consciousness(at(0), 1, 99);

    uint64_t points = 0;
    for (Timestamp t = 3600; t <= 3600 * 20; t += 3600) {
        mind.evolve_consciousness(at(t), 1, "step " + std::to_string(t), "ok");
        assert(mind.awareness_level(1) <= 100);
        assert(mind.evolution_points(1) > points);
        points = mind.evolution_points(1);
    }
    assert(mind.awareness_level(1) == 100);
    assert(mind.coherence_level(1) == 50);
    assert(mind.decision_count(1) == 20);

    std::cout << "  PASS" << std::endl;
}

void test_breakthrough_once() {
    std::cout << "Testing breakthrough is write-once..." << std::endl;

    auto seeds = std::make_shared<ScriptedSeed>();
    World world(EngineConfig{}, seeds);
    auto& mind = world.consciousness();
    mind.initialize_consciousness(at(0), 1, 100);

    // probability = 100 * 50 / 100 + 3 / 100 = 50
    seeds->evolution.push_back(10);
    auto report = mind.evolve_consciousness(at(3600), 1, "epiphany", "clarity");
    assert(report.breakthrough_probability == 50);
    assert(report.breakthrough);
    assert(mind.has_breakthrough(1, "epiphany"));
    assert(mind.evolution_points(1) == 8);

    // Already achieved: no draw is taken, even a certain one
    seeds->evolution.push_back(0);
    report = mind.evolve_consciousness(at(7200), 1, "epiphany", "clarity");
    assert(!report.breakthrough);
    assert(seeds->evolution.size() == 1);
    seeds->evolution.clear();
    assert(mind.evolution_points(1) == 11);
    assert(mind.breakthroughs(1) == (std::vector<std::string>{"epiphany"}));
    assert(world.events().count(EventKind::BreakthroughAchieved) == 1);

    // A draw at or above the probability misses
    seeds->evolution.push_back(50);
    report = mind.evolve_consciousness(at(10800), 1, "insight", "none");
    assert(!report.breakthrough);
    assert(!mind.has_breakthrough(1, "insight"));
    assert(!mind.has_breakthrough(2, "epiphany"));

    std::cout << "  PASS" << std::endl;
}

void test_goals_beliefs_values() {
    std::cout << "Testing goals, beliefs and values..." << std::endl;

    World world;
    auto& mind = world.consciousness();

    expect_error(ErrorCode::NotInitialized, [&] { mind.add_goal(at(1), 1, "g"); });
    expect_error(ErrorCode::NotInitialized, [&] { mind.add_belief(at(1), 1, "b"); });
    expect_error(ErrorCode::NotInitialized, [&] { mind.add_value(at(1), 1, "v", 10); });
    assert(mind.records().empty());

    mind.initialize_consciousness(at(1), 1, 40);
    mind.add_goal(at(2), 1, "learn to fly");
    mind.add_belief(at(2), 1, "the sky is open");
    mind.add_value(at(2), 1, "honesty", 60);
    assert(mind.goals(1).back() == "learn to fly");
    assert(mind.beliefs(1).back() == "the sky is open");
    assert(mind.priority(1, "honesty") == 60);

    expect_error(ErrorCode::InvalidPriority, [&] { mind.add_value(at(3), 1, "greed", 101); });
    assert(mind.value_count(1) == 2);
    assert(mind.priority(1, "greed") == 0);

    mind.add_value(at(3), 1, "honesty", 40);
    assert(mind.value_count(1) == 3);
    assert(mind.priority(1, "honesty") == 40);
    assert(world.events().count(EventKind::ValueAdded) == 2);

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing config..." << std::endl;

    EngineConfig config = config_from_json(R"({"cooldown_seconds": 60, "propagation_bound": "adjacency"})");
    assert(config.cooldown_seconds == 60);
    assert(config.propagation_bound == PropagationBound::Adjacency);
    assert(config.default_mutation_rate == 10);
    assert(config.breakthrough_bonus == 5);

    bool threw = false;
    try { config_from_json("{not json"); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    threw = false;
    try { config_from_json(R"({"propagation_bound": "everywhere"})"); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    // Out of byte range is rejected, not truncated
    threw = false;
    try { config_from_json(R"({"mutation_threshold": 300})"); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);
    assert(config_from_json(R"({"mutation_threshold": 255})").mutation_threshold == 255);

    threw = false;
    try { load_config("/nonexistent/psyche.json"); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);

    // Short cooldown flows through to the engine
    World world(config);
    world.consciousness().initialize_consciousness(at(0), 1, 10);
    world.consciousness().evolve_consciousness(at(60), 1, "quick", "ok");
    assert(world.consciousness().decision_count(1) == 1);

    std::cout << "  PASS" << std::endl;
}

void test_event_json() {
    std::cout << "Testing event JSON..." << std::endl;

    World world;
    world.network().initialize_quantum_state(at(5), 1, 10);
    world.network().initialize_quantum_state(at(5), 2, 20);
    world.network().create_quantum_bond(at(6), 1, 2);

    nlohmann::json j = world.events().to_json();
    assert(j.size() == 3);
    assert(j[2]["kind"] == "QuantumBondFormed");
    assert(j[2]["peer"] == 2);
    assert(j[2]["value"] == 15);
    assert(!j[0].contains("peer"));
    assert(world.events().events_for(1).size() == 2);
    assert(world.events().events_for(2).size() == 1);

    Event back = j[2].get<Event>();
    assert(back.kind == EventKind::QuantumBondFormed);
    assert(back.peer && *back.peer == 2);
    assert(back.timestamp == 6);

    std::cout << "  PASS" << std::endl;
}

void test_archive() {
    std::cout << "Testing Archive save/load..." << std::endl;

    auto seeds = std::make_shared<ScriptedSeed>();
    World world(EngineConfig{}, seeds);
    world.network().initialize_quantum_state(at(1), 1, 10);
    world.network().initialize_quantum_state(at(1), 2, 20);
    world.network().add_superposition_state(at(1), 1, "dream");
    world.network().create_quantum_bond(at(2), 1, 2);
    seeds->network.push_back(3);
    world.memes().propagate_meme(at(3), 1, "hello");
    world.consciousness().initialize_consciousness(at(0), 1, 100);
    world.consciousness().add_value(at(1), 1, "honesty", 60);
    seeds->evolution.push_back(0);
    world.consciousness().evolve_consciousness(at(3600), 1, "epiphany", "clarity");

    Archive archive;
    archive.open(":memory:");
    World restored;
    assert(!archive.load(restored));

    archive.save(world);
    assert(archive.load(restored));

    assert(restored.network().entanglement_factor(1) == 11);
    assert(restored.network().is_entangled(2, 1));
    assert(restored.network().bond_strength(1, 2) == 15);
    assert(restored.network().superposition_states(1) == (std::vector<std::string>{"dream"}));
    assert(restored.memes().memes(1) == world.memes().memes(1));
    assert(restored.memes().mutation_rate(1) == 10);
    assert(restored.consciousness().priority(1, "honesty") == 60);
    assert(restored.consciousness().has_breakthrough(1, "epiphany"));
    assert(restored.consciousness().evolution_points(1) == world.consciousness().evolution_points(1));
    assert(restored.consciousness().decision_history(1).size() == 1);
    assert(restored.events().size() == world.events().size());
    assert(restored.events().to_json() == world.events().to_json());

    // Restored state keeps enforcing the same rules
    expect_error(ErrorCode::AlreadyEntangled, [&] { restored.network().create_quantum_bond(at(9), 2, 1); });
    expect_error(ErrorCode::CooldownNotElapsed,
                 [&] { restored.consciousness().evolve_consciousness(at(3601), 1, "x", "y"); });

    std::cout << "  PASS" << std::endl;
}

void test_archive_binary_memes() {
    std::cout << "Testing Archive with non-UTF-8 memes..." << std::endl;

    auto seeds = std::make_shared<ScriptedSeed>();
    World world(EngineConfig{}, seeds);
    world.network().initialize_quantum_state(at(1), 1, 10);

    // 0xC2 is above the threshold: decremented to 0xC1, which is never valid UTF-8
    seeds->network.push_back(0);
    auto report = world.memes().propagate_meme(at(2), 1, "\xC2\xA2");
    assert(report.mutation && *report.mutation == "\xC1\xA2");

    Archive archive;
    archive.open(":memory:");
    archive.save(world);

    World restored;
    assert(archive.load(restored));
    assert(restored.memes().memes(1) == (std::vector<std::string>{"\xC2\xA2", "\xC1\xA2"}));
    assert(restored.events().count(EventKind::MemeMutated) == 1);
    assert(restored.events().at(1).text == "\xC1\xA2");

    std::cout << "  PASS" << std::endl;
}

void test_archive_config_mismatch() {
    std::cout << "Testing Archive config mismatch..." << std::endl;

    EngineConfig config;
    config.propagation_bound = PropagationBound::Adjacency;
    config.cooldown_seconds = 60;
    World world(config);
    world.network().initialize_quantum_state(at(1), 1, 10);

    Archive archive;
    archive.open(":memory:");
    archive.save(world);

    World defaults_world;
    bool threw = false;
    try { archive.load(defaults_world); } catch (const std::runtime_error&) { threw = true; }
    assert(threw);
    assert(defaults_world.network().character_count() == 0);
    assert(defaults_world.events().empty());

    // Only the verbose flag may differ
    EngineConfig noisy = config;
    noisy.verbose = true;
    World same_rules(noisy);
    set_verbose(false);
    assert(archive.load(same_rules));
    assert(same_rules.network().entanglement_factor(1) == 10);

    std::cout << "  PASS" << std::endl;
}

void test_rejections_logged() {
    std::cout << "Testing rejected calls are logged..." << std::endl;

    World world;
    world.network().initialize_quantum_state(at(1), 1, 10);
    world.consciousness().initialize_consciousness(at(0), 1, 10);

    std::ostringstream captured;
    std::streambuf* saved = std::cerr.rdbuf(captured.rdbuf());
    set_verbose(true);

    expect_error(ErrorCode::InvalidMutationRate, [&] { world.memes().set_mutation_rate(1, 101); });
    expect_error(ErrorCode::NotInitialized, [&] { world.memes().set_mutation_rate(2, 5); });
    expect_error(ErrorCode::NotInitialized, [&] { world.memes().propagate_meme(at(2), 2, "x"); });
    expect_error(ErrorCode::AlreadyInitialized,
                 [&] { world.consciousness().initialize_consciousness(at(1), 1, 10); });
    expect_error(ErrorCode::InvalidAwarenessLevel,
                 [&] { world.consciousness().initialize_consciousness(at(1), 2, 0); });
    expect_error(ErrorCode::CooldownNotElapsed,
                 [&] { world.consciousness().evolve_consciousness(at(10), 1, "x", "y"); });
    expect_error(ErrorCode::InvalidPriority,
                 [&] { world.consciousness().add_value(at(10), 1, "greed", 101); });

    set_verbose(false);
    std::cerr.rdbuf(saved);

    std::string log = captured.str();
    assert(log.find("[meme] set_mutation_rate rejected for 1: InvalidMutationRate") != std::string::npos);
    assert(log.find("[meme] set_mutation_rate rejected for 2: NotInitialized") != std::string::npos);
    assert(log.find("[meme] propagate_meme rejected for 2: NotInitialized") != std::string::npos);
    assert(log.find("initialize_consciousness rejected for 1: AlreadyInitialized") != std::string::npos);
    assert(log.find("initialize_consciousness rejected for 2: InvalidAwarenessLevel") != std::string::npos);
    assert(log.find("evolve_consciousness rejected for 1: CooldownNotElapsed") != std::string::npos);
    assert(log.find("add_value rejected for 1: InvalidPriority") != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Psyche Tests ===" << std::endl;

    test_digest_mod();
    test_block_hash_seed();
    test_store_rollback();
    test_quantum_initialize();
    test_quantum_bond();
    test_quantum_bond_rejections();
    test_bond_symmetry();
    test_collapse();
    test_mutate_byte();
    test_meme_uninitialized();
    test_meme_mutation();
    test_meme_fanout_superposition_bound();
    test_meme_fanout_adjacency();
    test_consciousness_initialize();
    test_evolution_cooldown();
    test_awareness_cap();
    test_breakthrough_once();
    test_goals_beliefs_values();
    test_config();
    test_event_json();
    test_archive();
    test_archive_binary_memes();
    test_archive_config_mismatch();
    test_rejections_logged();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
