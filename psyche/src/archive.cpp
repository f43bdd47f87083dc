#include <psyche/archive.hpp>
#include <psyche/log.hpp>
#include <psyche/serialize.hpp>
#include <psyche/version.hpp>
#include <sqlite3.h>
#include <stdexcept>
#include <vector>

namespace psyche {

using json = nlohmann::json;

namespace {

// Finalizes on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("Archive: prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, uint64_t value) {
        // Stored bit-for-bit as a signed 64-bit integer
        check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
    }

    void bind(int index, const std::string& text) {
        check(sqlite3_bind_text(stmt_, index, text.c_str(), static_cast<int>(text.size()),
                                SQLITE_TRANSIENT));
    }

    // CBOR keeps meme bytes as-is; JSON text would reject invalid UTF-8
    void bind_payload(int index, const json& payload) {
        std::vector<uint8_t> bytes = json::to_cbor(payload);
        check(sqlite3_bind_blob(stmt_, index, bytes.data(), static_cast<int>(bytes.size()),
                                SQLITE_TRANSIENT));
    }

    // True while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw std::runtime_error(std::string("Archive: step failed: ") + sqlite3_errmsg(db_));
    }

    void run_and_reset() {
        step();
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    uint64_t column_id(int col) const {
        return static_cast<uint64_t>(sqlite3_column_int64(stmt_, col));
    }

    std::string column_text(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        return text ? reinterpret_cast<const char*>(text) : "";
    }

    json column_payload(int col) const {
        const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, col));
        int size = sqlite3_column_bytes(stmt_, col);
        if (!data || size <= 0) {
            throw std::runtime_error("Archive: empty payload");
        }
        return json::from_cbor(std::vector<uint8_t>(data, data + size));
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw std::runtime_error(std::string("Archive: bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

const char* const RECORD_TABLES[] = {
    "quantum_states", "adjacency", "memetic_patterns", "consciousness"
};

template <typename Record>
void save_store(sqlite3* db, const char* table, const Store<Record>& store) {
    std::string sql = std::string("INSERT INTO ") + table + " (id, data) VALUES (?, ?)";
    Statement insert(db, sql.c_str());
    for (CharacterId id : store.keys()) {
        insert.bind(1, id);
        insert.bind_payload(2, json(*store.find(id)));
        insert.run_and_reset();
    }
}

template <typename Record>
typename Store<Record>::Map load_store(sqlite3* db, const char* table) {
    std::string sql = std::string("SELECT id, data FROM ") + table;
    Statement select(db, sql.c_str());
    typename Store<Record>::Map records;
    while (select.step()) {
        records.emplace(select.column_id(0),
                        select.column_payload(1).get<Record>());
    }
    return records;
}

// Everything but the verbose flag shapes engine behavior
bool same_rules(const EngineConfig& a, const EngineConfig& b) {
    json ja = a;
    json jb = b;
    ja.erase("verbose");
    jb.erase("verbose");
    return ja == jb;
}

} // namespace

Archive::~Archive() {
    close();
}

void Archive::open(const std::string& path) {
    close();
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        close();
        throw std::runtime_error("Archive: cannot open " + path + ": " + err);
    }
    create_schema();
    log_debug("archive", "opened %s", path.c_str());
}

void Archive::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void Archive::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Archive: " + message);
    }
}

void Archive::create_schema() {
    exec("CREATE TABLE IF NOT EXISTS meta (key TEXT PRIMARY KEY, value TEXT NOT NULL)");
    for (const char* table : RECORD_TABLES) {
        std::string sql = std::string("CREATE TABLE IF NOT EXISTS ") + table +
                          " (id INTEGER PRIMARY KEY, data BLOB NOT NULL)";
        exec(sql.c_str());
    }
    exec("CREATE TABLE IF NOT EXISTS events (seq INTEGER PRIMARY KEY, data BLOB NOT NULL)");
}

void Archive::save(const World& world) {
    if (!db_) throw std::runtime_error("Archive: not open");

    exec("BEGIN IMMEDIATE");
    try {
        exec("DELETE FROM meta");
        for (const char* table : RECORD_TABLES) {
            exec((std::string("DELETE FROM ") + table).c_str());
        }
        exec("DELETE FROM events");

        {
            Statement meta(db_, "INSERT INTO meta (key, value) VALUES (?, ?)");
            meta.bind(1, std::string("schema_version"));
            meta.bind(2, std::to_string(PSYCHE_ARCHIVE_SCHEMA_VERSION));
            meta.run_and_reset();
            meta.bind(1, std::string("config"));
            meta.bind(2, json(world.config()).dump());
            meta.run_and_reset();
        }

        save_store(db_, "quantum_states", world.network().states());
        save_store(db_, "adjacency", world.network().adjacency());
        save_store(db_, "memetic_patterns", world.memes().patterns());
        save_store(db_, "consciousness", world.consciousness().records());

        Statement insert(db_, "INSERT INTO events (seq, data) VALUES (?, ?)");
        const auto& events = world.events().all();
        for (size_t i = 0; i < events.size(); ++i) {
            insert.bind(1, static_cast<uint64_t>(i));
            insert.bind_payload(2, json(events[i]));
            insert.run_and_reset();
        }

        exec("COMMIT");
    } catch (const std::exception& e) {
        log_debug("archive", "save failed, rolling back: %s", e.what());
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            log_debug("archive", "rollback failed: %s", sqlite3_errmsg(db_));
        }
        throw;
    }

    log_debug("archive", "saved %zu characters, %zu events",
              world.network().character_count() + world.consciousness().records().size(),
              world.events().size());
}

bool Archive::load(World& world) {
    if (!db_) throw std::runtime_error("Archive: not open");

    Statement schema_row(db_, "SELECT value FROM meta WHERE key = 'schema_version'");
    if (!schema_row.step()) {
        return false;
    }
    int schema = std::stoi(schema_row.column_text(0));
    if (!version::archive_compatible(schema)) {
        throw std::runtime_error("Archive: unsupported schema version " + std::to_string(schema));
    }

    // Records only mean what they meant under the rules that produced them
    Statement config_row(db_, "SELECT value FROM meta WHERE key = 'config'");
    if (!config_row.step()) {
        throw std::runtime_error("Archive: checkpoint has no config");
    }
    EngineConfig stored = config_from_json(config_row.column_text(0));
    if (!same_rules(stored, world.config())) {
        throw std::runtime_error("Archive: checkpoint config " + json(stored).dump() +
                                 " differs from world config " + json(world.config()).dump());
    }

    // Parse everything before touching the world
    auto states = load_store<QuantumState>(db_, "quantum_states");
    auto adjacency = load_store<PeerSet>(db_, "adjacency");
    auto patterns = load_store<MemeticPattern>(db_, "memetic_patterns");
    auto records = load_store<ConsciousnessRecord>(db_, "consciousness");

    std::vector<Event> events;
    Statement select(db_, "SELECT data FROM events ORDER BY seq");
    while (select.step()) {
        events.push_back(select.column_payload(0).get<Event>());
    }

    world.network().states().restore(std::move(states));
    world.network().adjacency().restore(std::move(adjacency));
    world.memes().patterns().restore(std::move(patterns));
    world.consciousness().records().restore(std::move(records));
    world.events().restore(std::move(events));

    log_debug("archive", "loaded %zu events", world.events().size());
    return true;
}

} // namespace psyche
