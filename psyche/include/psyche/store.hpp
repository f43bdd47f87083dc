#pragma once
// Store: keyed record arena with all-or-nothing writes
//
// Each store journals the prior value of a record on its first write inside
// a transaction. Rollback puts every journaled record back (or erases it if
// it did not exist). Nothing outside a store may hold a reference into it
// across operations.

#include "types.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace psyche {

// Participant in a Transaction
class Journaled {
public:
    virtual ~Journaled() = default;
    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

template <typename Record>
class Store : public Journaled {
public:
    using Map = std::unordered_map<CharacterId, Record>;

    const Record* find(CharacterId id) const {
        auto it = records_.find(id);
        return it != records_.end() ? &it->second : nullptr;
    }

    bool contains(CharacterId id) const {
        return records_.count(id) > 0;
    }

    // Write access; a missing record is default-constructed
    Record& modify(CharacterId id) {
        if (active_ && journal_.find(id) == journal_.end()) {
            auto it = records_.find(id);
            if (it != records_.end()) {
                journal_.emplace(id, it->second);
            } else {
                journal_.emplace(id, std::nullopt);
            }
        }
        return records_[id];
    }

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    // Ascending keys, for stable iteration and serialization
    std::vector<CharacterId> keys() const {
        std::vector<CharacterId> out;
        out.reserve(records_.size());
        for (const auto& [id, _] : records_) out.push_back(id);
        std::sort(out.begin(), out.end());
        return out;
    }

    // Bulk replace, used when loading an archive
    void restore(Map records) {
        if (active_) throw std::logic_error("Store::restore inside a transaction");
        records_ = std::move(records);
    }

    void begin() override {
        if (active_) throw std::logic_error("Store: nested transaction");
        active_ = true;
        journal_.clear();
    }

    void commit() override {
        active_ = false;
        journal_.clear();
    }

    void rollback() override {
        for (auto& [id, prior] : journal_) {
            if (prior) {
                records_[id] = std::move(*prior);
            } else {
                records_.erase(id);
            }
        }
        journal_.clear();
        active_ = false;
    }

private:
    Map records_;
    std::unordered_map<CharacterId, std::optional<Record>> journal_;
    bool active_ = false;
};

// RAII transaction over a fixed set of participants.
// Not committed by the time it is destroyed = rolled back.
class Transaction {
public:
    explicit Transaction(std::vector<Journaled*> participants)
        : participants_(std::move(participants)) {
        for (auto* p : participants_) p->begin();
    }

    ~Transaction() {
        if (!committed_) {
            for (auto* p : participants_) p->rollback();
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        for (auto* p : participants_) p->commit();
        committed_ = true;
    }

private:
    std::vector<Journaled*> participants_;
    bool committed_ = false;
};

} // namespace psyche
