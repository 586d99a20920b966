#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <unordered_set>
#include <vector>

#include <userver/concurrent/variable.hpp>
#include <userver/rcu/rcu.hpp>

#include "address_registry/address_registry.hpp"
#include "ai_blend/ai_blend_adapter.hpp"
#include "pattern_detector/pattern_detector.hpp"
#include "risk_types/risk_types.hpp"
#include "transaction_history/transaction_history_store.hpp"

namespace wallet_risk {

// Thrown by administrative operations when the caller is not the administrator.
class AuthorizationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct EngineSettings {
    Address admin;
    RiskThresholds thresholds;
    AiBlendConfig ai_config;
    bool monitoring_enabled = true;
    size_t shard_count = TransactionHistoryStore::kDefaultShardCount;
    size_t window_capacity = TransactionHistoryStore::kDefaultWindowCapacity;
    // Oldest events are dropped once the outbound queue reaches this size.
    size_t max_pending_events = 10000;
};

struct AnalysisResult {
    // False when monitoring is disabled; nothing else is filled in then.
    bool monitoring_enabled = true;
    uint8_t sender_score = 0;
    uint8_t recipient_score = 0;
    std::vector<PatternFinding> findings;
    std::optional<Alert> alert;
    AiStatus ai_status = AiStatus::kNotRequested;
    TransactionAnalysis analysis;
    std::vector<WalletMonitoringUpdate> monitoring_updates;
};

class RiskEngine {
public:
    explicit RiskEngine(EngineSettings settings, std::shared_ptr<RiskOracle> oracle = nullptr);

    /// Records the transfer for both parties, scores them, runs pattern
    /// detection and raises an alert when warranted. Every produced event is
    /// also appended to the outbound queue. No-op while monitoring is disabled.
    /// Throws std::invalid_argument for an empty sender or recipient.
    AnalysisResult RecordAndScore(const Transfer& transfer);

    /// Returns false when monitoring is disabled. A failure may precede the
    /// address's first transaction and is still counted.
    bool RecordFailure(const Address& address);

    /// Batch detection over caller-supplied transactions; does not touch the store.
    std::vector<PatternFinding> AnalyzeHistory(
        const Address& address,
        const std::vector<ObservedTransaction>& transactions,
        TimestampMs now);

    // Administrative operations. Each throws AuthorizationError for a foreign
    // caller and std::invalid_argument for invalid input, leaving state unchanged.
    void SetThresholds(const Address& caller, const RiskThresholds& thresholds);
    // Applies `update` to the current thresholds under the writer lock, so
    // concurrent partial updates do not overwrite each other.
    void UpdateThresholds(const Address& caller, const std::function<void(RiskThresholds&)>& update);
    void AddToBlacklist(const Address& caller, const std::vector<Address>& addresses);
    void AddToWhitelist(const Address& caller, const std::vector<Address>& addresses);
    void SetAiConfig(const Address& caller, const AiBlendConfig& config);
    void UpdateAiConfig(const Address& caller, const std::function<void(AiBlendConfig&)>& update);
    void SetMonitoringEnabled(const Address& caller, bool enabled);

    // Queries. Unknown addresses yield defaults.
    uint8_t GetRiskScore(const Address& address) const;
    bool IsBlacklisted(const Address& address) const;
    bool IsWhitelisted(const Address& address) const;
    uint64_t GetTransactionCount(const Address& address) const;
    RiskThresholds GetThresholds() const;
    AiBlendConfig GetAiConfig() const;
    const Address& GetAdmin() const { return admin_; }
    bool IsMonitoringEnabled() const { return monitoring_enabled_.load(); }
    WalletRiskInfo GetWalletRiskInfo(const Address& address) const;
    std::optional<AddressRecord> FindRecord(const Address& address) const;

    // Wallet watch list.
    WalletMonitoringUpdate StartWalletMonitoring(const Address& address, TimestampMs now);
    WalletMonitoringUpdate StopWalletMonitoring(const Address& address, TimestampMs now);
    bool IsWatching(const Address& address) const;

    std::vector<RiskEvent> DrainEvents();
    size_t PendingEventCount() const;

private:
    void CheckAdmin(const Address& caller) const;

    WalletMonitoringUpdate MakeMonitoringUpdate(const Address& address, bool is_watching, TimestampMs now) const;

    void PushEvents(std::vector<RiskEvent> events);

    const Address admin_;
    const size_t max_pending_events_;

    std::atomic<bool> monitoring_enabled_;
    userver::rcu::Variable<RiskThresholds> thresholds_;
    userver::rcu::Variable<AiBlendConfig> ai_config_;
    userver::rcu::Variable<AddressRegistry> registry_;
    userver::rcu::Variable<std::unordered_set<Address>> watched_;

    TransactionHistoryStore history_;
    PatternDetector detector_;
    AiBlendAdapter ai_blend_;

    userver::concurrent::Variable<std::deque<RiskEvent>> events_;
};

}  // namespace wallet_risk
