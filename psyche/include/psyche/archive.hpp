#pragma once
// Archive: SQLite checkpoint of a World
//
// One table per record kind, keyed by character ID, payload as a CBOR blob
// (memes are arbitrary bytes). save() replaces the whole checkpoint inside
// one SQLite transaction. load() refuses a checkpoint written under a
// different config and replaces the world's stores; it must not run
// mid-operation.

#include "world.hpp"
#include <string>

struct sqlite3;

namespace psyche {

class Archive {
public:
    Archive() = default;
    ~Archive();

    Archive(const Archive&) = delete;
    Archive& operator=(const Archive&) = delete;

    // Opens (creating if needed) the database at path; ":memory:" is allowed.
    // Throws std::runtime_error on failure.
    void open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    void save(const World& world);

    // Returns false if the archive holds no checkpoint
    bool load(World& world);

private:
    void exec(const char* sql);
    void create_schema();

    sqlite3* db_ = nullptr;
};

} // namespace psyche
