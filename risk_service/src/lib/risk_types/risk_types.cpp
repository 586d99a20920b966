#include "risk_types.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace wallet_risk {

namespace {

void CheckPercentage(std::string_view field, uint32_t value) {
    if (value > 100) {
        throw std::invalid_argument(
            fmt::format("{} must be within [0, 100], got {}", field, value));
    }
}

void CheckHour(std::string_view field, uint32_t value) {
    if (value > 24) {
        throw std::invalid_argument(
            fmt::format("{} must be within [0, 24], got {}", field, value));
    }
}

}  // namespace

std::string_view ToString(TransactionCategory category) {
    switch (category) {
        case TransactionCategory::kSend: return "send";
        case TransactionCategory::kReceive: return "receive";
        case TransactionCategory::kContract: return "contract";
        case TransactionCategory::kApproval: return "approval";
    }
    return "unknown";
}

std::string_view ToString(TransactionStatus status) {
    switch (status) {
        case TransactionStatus::kSucceeded: return "succeeded";
        case TransactionStatus::kFailed: return "failed";
    }
    return "unknown";
}

std::string_view ToString(Severity severity) {
    switch (severity) {
        case Severity::kLow: return "low";
        case Severity::kMedium: return "medium";
        case Severity::kHigh: return "high";
        case Severity::kCritical: return "critical";
    }
    return "unknown";
}

std::string_view ToString(PatternKind kind) {
    switch (kind) {
        case PatternKind::kRapidTransactions: return "rapid_transactions";
        case PatternKind::kLargeTransfer: return "large_transfer";
        case PatternKind::kUnusualContract: return "unusual_contract";
        case PatternKind::kFailedSpike: return "failed_spike";
        case PatternKind::kRoundAmounts: return "round_amounts";
        case PatternKind::kNewAddress: return "new_address";
        case PatternKind::kUnusualHour: return "unusual_hour";
    }
    return "unknown";
}

std::string_view ToString(AlertKind kind) {
    switch (kind) {
        case AlertKind::kSecurity: return "security";
        case AlertKind::kWarning: return "warning";
        case AlertKind::kInfo: return "info";
        case AlertKind::kError: return "error";
    }
    return "unknown";
}

std::string_view ToString(RiskFactor factor) {
    switch (factor) {
        case RiskFactor::kBlacklisted: return "blacklisted";
        case RiskFactor::kWhitelisted: return "whitelisted";
        case RiskFactor::kLargeTransfer: return "large_transfer";
        case RiskFactor::kRapidTransactions: return "rapid_transactions";
        case RiskFactor::kFailedTransactions: return "failed_transactions";
        case RiskFactor::kContractRatio: return "contract_ratio";
    }
    return "unknown";
}

std::string_view ToString(AiStatus status) {
    switch (status) {
        case AiStatus::kNotRequested: return "not_requested";
        case AiStatus::kBlended: return "blended";
        case AiStatus::kLowConfidence: return "low_confidence";
        case AiStatus::kFallback: return "fallback";
        case AiStatus::kUnavailable: return "unavailable";
    }
    return "unknown";
}

bool operator==(const AddressRecord& lhs, const AddressRecord& rhs) {
    return lhs.address == rhs.address
        && lhs.transaction_count == rhs.transaction_count
        && lhs.total_volume == rhs.total_volume
        && lhs.first_seen_time == rhs.first_seen_time
        && lhs.last_transaction_time == rhs.last_transaction_time
        && lhs.rapid_transaction_count == rhs.rapid_transaction_count
        && lhs.failed_transaction_count == rhs.failed_transaction_count
        && lhs.contract_interaction_count == rhs.contract_interaction_count
        && lhs.risk_score == rhs.risk_score
        && lhs.suspicious_pattern_ids == rhs.suspicious_pattern_ids;
}

void RiskThresholds::Validate() const {
    CheckPercentage("contract_interaction_ratio_cutoff_pct", contract_interaction_ratio_cutoff_pct);
    CheckHour("unusual_hour_start", unusual_hour_start);
    CheckHour("unusual_hour_window", unusual_hour_window);
    if (unusual_hour_start > unusual_hour_window) {
        throw std::invalid_argument(fmt::format(
            "unusual_hour_start ({}) must not exceed unusual_hour_window ({})",
            unusual_hour_start, unusual_hour_window));
    }
}

void AiBlendConfig::Validate() const {
    CheckPercentage("ai_weight_pct", ai_weight_pct);
    CheckPercentage("confidence_floor_pct", confidence_floor_pct);
}

Severity RiskLevelFromScore(uint8_t score) {
    if (score >= 90) return Severity::kCritical;
    if (score >= 80) return Severity::kHigh;
    if (score >= 60) return Severity::kMedium;
    return Severity::kLow;
}

}  // namespace wallet_risk
