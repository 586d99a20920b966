#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wallet_risk {

using Address = std::string;
using TimestampMs = uint64_t;

// Numeric values are shared with the wire format and existing event consumers.
enum class TransactionCategory : uint8_t {
    kSend = 1,
    kReceive = 2,
    kContract = 3,
    kApproval = 4,
};

enum class TransactionStatus : uint8_t {
    kSucceeded = 1,
    kFailed = 2,
};

enum class Severity : uint8_t {
    kLow = 1,
    kMedium = 2,
    kHigh = 3,
    kCritical = 4,
};

enum class PatternKind : uint8_t {
    kRapidTransactions = 1,
    kLargeTransfer = 2,
    kUnusualContract = 3,
    kFailedSpike = 4,
    kRoundAmounts = 5,
    kNewAddress = 6,
    kUnusualHour = 7,
};

enum class AlertKind : uint8_t {
    kSecurity = 1,
    kWarning = 2,
    kInfo = 3,
    kError = 4,
};

enum class RiskFactor : uint8_t {
    kBlacklisted = 1,
    kWhitelisted = 2,
    kLargeTransfer = 3,
    kRapidTransactions = 4,
    kFailedTransactions = 5,
    kContractRatio = 6,
};

enum class AiStatus : uint8_t {
    kNotRequested = 1,
    kBlended = 2,
    kLowConfidence = 3,
    kFallback = 4,
    kUnavailable = 5,
};

std::string_view ToString(TransactionCategory category);
std::string_view ToString(TransactionStatus status);
std::string_view ToString(Severity severity);
std::string_view ToString(PatternKind kind);
std::string_view ToString(AlertKind kind);
std::string_view ToString(RiskFactor factor);
std::string_view ToString(AiStatus status);

inline constexpr uint8_t kMaxRiskScore = 100;

struct ObservedTransaction {
    std::string transaction_ref;
    uint64_t amount = 0;
    TimestampMs timestamp_ms = 0;
    TransactionCategory category = TransactionCategory::kSend;
    TransactionStatus status = TransactionStatus::kSucceeded;
};

struct AddressRecord {
    Address address;
    uint64_t transaction_count = 0;
    uint64_t total_volume = 0;
    TimestampMs first_seen_time = 0;
    TimestampMs last_transaction_time = 0;
    // Reset to zero as soon as a gap reaches the rapid window.
    uint64_t rapid_transaction_count = 0;
    // Never reset for the lifetime of the record.
    uint64_t failed_transaction_count = 0;
    uint64_t contract_interaction_count = 0;
    uint8_t risk_score = 0;
    std::set<PatternKind> suspicious_pattern_ids;
};

bool operator==(const AddressRecord& lhs, const AddressRecord& rhs);

struct RiskThresholds {
    uint64_t rapid_transaction_window_ms = 5 * 60 * 1000;
    uint64_t large_transfer_cutoff = 1000;
    uint64_t failed_transaction_cutoff = 3;
    uint32_t contract_interaction_ratio_cutoff_pct = 70;
    uint64_t round_amount_cluster_cutoff = 5;
    // Unusual hours are [unusual_hour_start, unusual_hour_window) in UTC.
    uint32_t unusual_hour_start = 2;
    uint32_t unusual_hour_window = 6;
    uint64_t new_address_window_ms = 24 * 60 * 60 * 1000;

    /// Throws std::invalid_argument when a field is out of range.
    void Validate() const;
};

struct AiBlendConfig {
    bool enabled = false;
    uint32_t ai_weight_pct = 30;
    uint32_t confidence_floor_pct = 70;
    uint64_t max_wait_ms = 5000;
    bool fallback_on_failure = true;

    /// Throws std::invalid_argument when a percentage exceeds 100.
    void Validate() const;
};

struct PatternFinding {
    Address address;
    PatternKind pattern_kind = PatternKind::kRapidTransactions;
    Severity severity = Severity::kLow;
    std::string description;
    std::vector<std::string> evidence_ids;
    uint8_t score_contribution = 0;
    TimestampMs detected_at = 0;
};

struct Alert {
    std::string transaction_ref;
    Address sender;
    Address recipient;
    uint64_t amount = 0;
    uint8_t risk_score = 0;
    Severity severity = Severity::kMedium;
    AlertKind alert_kind = AlertKind::kWarning;
    std::string message;
    TimestampMs timestamp = 0;
};

struct Transfer {
    std::string transaction_ref;
    Address sender;
    Address recipient;
    uint64_t amount = 0;
    TransactionCategory category = TransactionCategory::kSend;
    TimestampMs now = 0;
};

struct TransactionAnalysis {
    std::string transaction_ref;
    Address sender;
    Address recipient;
    uint64_t amount = 0;
    TransactionCategory category = TransactionCategory::kSend;
    std::vector<RiskFactor> sender_factors;
    std::vector<RiskFactor> recipient_factors;
    uint8_t final_risk_score = 0;
    AiStatus ai_status = AiStatus::kNotRequested;
    TimestampMs timestamp = 0;
};

struct WalletMonitoringUpdate {
    Address wallet_address;
    bool is_watching = false;
    uint8_t current_risk_score = 0;
    std::vector<PatternKind> patterns_detected;
    TimestampMs last_update = 0;
};

using RiskEvent = std::variant<Alert, PatternFinding, TransactionAnalysis, WalletMonitoringUpdate>;

struct WalletRiskInfo {
    Address address;
    uint8_t risk_score = 0;
    bool is_blacklisted = false;
    bool is_whitelisted = false;
    uint64_t transaction_count = 0;
    Severity risk_level = Severity::kLow;
    bool is_watching = false;
};

// critical >= 90, high >= 80, medium >= 60, otherwise low.
Severity RiskLevelFromScore(uint8_t score);

}  // namespace wallet_risk
