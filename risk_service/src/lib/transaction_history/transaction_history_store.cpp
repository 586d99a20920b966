#include "transaction_history_store.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <stdexcept>

#include <userver/logging/log.hpp>

namespace wallet_risk {

namespace {

uint64_t CheckedAdd(uint64_t value, uint64_t delta, const Address& address, std::string_view counter) {
    if (value > std::numeric_limits<uint64_t>::max() - delta) {
        LOG_ERROR() << "Counter overflow for " << address << ": " << counter
                    << " saturated at " << std::numeric_limits<uint64_t>::max();
        return std::numeric_limits<uint64_t>::max();
    }
    return value + delta;
}

void AppendToWindow(std::vector<ObservedTransaction>& window, const ObservedTransaction& tx, size_t capacity) {
    if (capacity == 0) {
        return;
    }
    if (window.size() >= capacity) {
        window.erase(window.begin(), window.begin() + (window.size() - capacity + 1));
    }
    window.push_back(tx);
}

}  // namespace

TransactionHistoryStore::TransactionHistoryStore(size_t shard_count, size_t window_capacity)
    : window_capacity_(window_capacity) {
    if (shard_count == 0) {
        throw std::invalid_argument("TransactionHistoryStore requires at least one shard");
    }
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

TransactionHistoryStore::Shard& TransactionHistoryStore::GetShard(const Address& address) const {
    return *shards_[std::hash<Address>{}(address) % shards_.size()];
}

AddressHistory TransactionHistoryStore::Record(
    const Address& address,
    const ObservedTransaction& tx,
    uint64_t rapid_transaction_window_ms) {
    auto map = GetShard(address).Lock();

    auto it = map->find(address);
    if (it == map->end() || it->second.record.transaction_count == 0) {
        // Failures reported before the first transaction are kept.
        auto& history = (*map)[address];
        auto& record = history.record;
        record.address = address;
        record.transaction_count = 1;
        record.total_volume = tx.amount;
        record.first_seen_time = tx.timestamp_ms;
        record.last_transaction_time = tx.timestamp_ms;
        record.rapid_transaction_count = 0;
        record.contract_interaction_count = tx.category == TransactionCategory::kContract ? 1 : 0;
        AppendToWindow(history.window, tx, window_capacity_);
        ++history.revision;

        LOG_DEBUG() << "Created history record for " << address;
        return history;
    }

    auto& history = it->second;
    auto& record = history.record;
    record.transaction_count = CheckedAdd(record.transaction_count, 1, address, "transaction_count");
    record.total_volume = CheckedAdd(record.total_volume, tx.amount, address, "total_volume");

    // An out-of-order timestamp counts as a zero gap.
    const uint64_t gap = tx.timestamp_ms >= record.last_transaction_time
        ? tx.timestamp_ms - record.last_transaction_time
        : 0;
    if (gap < rapid_transaction_window_ms) {
        record.rapid_transaction_count =
            CheckedAdd(record.rapid_transaction_count, 1, address, "rapid_transaction_count");
    } else {
        record.rapid_transaction_count = 0;
    }

    if (tx.category == TransactionCategory::kContract) {
        record.contract_interaction_count =
            CheckedAdd(record.contract_interaction_count, 1, address, "contract_interaction_count");
    }

    record.last_transaction_time = tx.timestamp_ms;
    AppendToWindow(history.window, tx, window_capacity_);
    ++history.revision;
    return history;
}

uint64_t TransactionHistoryStore::RecordFailure(const Address& address) {
    auto map = GetShard(address).Lock();
    auto it = map->find(address);
    if (it == map->end()) {
        LOG_DEBUG() << "Failure reported before any transaction of " << address;
        it = map->emplace(address, AddressHistory{}).first;
        it->second.record.address = address;
    }
    auto& record = it->second.record;
    record.failed_transaction_count =
        CheckedAdd(record.failed_transaction_count, 1, address, "failed_transaction_count");
    return record.failed_transaction_count;
}

bool TransactionHistoryStore::UpdateAssessment(
    const Address& address,
    uint64_t revision,
    uint8_t risk_score,
    const std::vector<PatternKind>& raised_patterns) {
    auto map = GetShard(address).Lock();
    auto it = map->find(address);
    if (it == map->end()) {
        return false;
    }
    auto& history = it->second;
    history.record.suspicious_pattern_ids.insert(raised_patterns.begin(), raised_patterns.end());
    if (revision < history.assessed_revision) {
        LOG_DEBUG() << "Dropping score of " << address << " from revision " << revision
                    << ", revision " << history.assessed_revision << " is already cached";
        return false;
    }
    history.record.risk_score = std::min(risk_score, kMaxRiskScore);
    history.assessed_revision = revision;
    return true;
}

std::optional<AddressHistory> TransactionHistoryStore::Find(const Address& address) const {
    auto map = GetShard(address).Lock();
    auto it = map->find(address);
    if (it == map->end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t TransactionHistoryStore::Size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        total += shard->Lock()->size();
    }
    return total;
}

}  // namespace wallet_risk
