#pragma once

#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include <userver/concurrent/variable.hpp>

#include "risk_types/risk_types.hpp"

namespace wallet_risk {

// Record of one address together with its most recent observed transactions.
struct AddressHistory {
    AddressRecord record;
    std::vector<ObservedTransaction> window;
    // Bumped by every Record(); identifies the state a score was computed from.
    uint64_t revision = 0;
    uint64_t assessed_revision = 0;
};

// Per-address aggregates. Addresses are spread over shards, each guarded by its
// own engine mutex, so the read-compare-write in Record() is atomic per address.
class TransactionHistoryStore {
public:
    static constexpr size_t kDefaultShardCount = 16;
    static constexpr size_t kDefaultWindowCapacity = 100;

    explicit TransactionHistoryStore(
        size_t shard_count = kDefaultShardCount,
        size_t window_capacity = kDefaultWindowCapacity);

    // Applies one observed transaction to the address and returns the
    // post-update record with its window. The rapid counter compares against
    // the previous last_transaction_time before it is overwritten.
    AddressHistory Record(
        const Address& address,
        const ObservedTransaction& tx,
        uint64_t rapid_transaction_window_ms);

    // Returns the new failure count. An unobserved address gets a record with
    // transaction_count 0; its first Record() fills in the creation values.
    uint64_t RecordFailure(const Address& address);

    // Remembers raised pattern kinds and caches the composite score computed
    // from `revision`. A score from an older revision than the cached one is
    // dropped; returns whether the score was stored.
    bool UpdateAssessment(
        const Address& address,
        uint64_t revision,
        uint8_t risk_score,
        const std::vector<PatternKind>& raised_patterns);

    std::optional<AddressHistory> Find(const Address& address) const;

    size_t Size() const;

private:
    using HistoryMap = std::unordered_map<Address, AddressHistory>;
    using Shard = userver::concurrent::Variable<HistoryMap>;

    Shard& GetShard(const Address& address) const;

    const size_t window_capacity_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

}  // namespace wallet_risk
