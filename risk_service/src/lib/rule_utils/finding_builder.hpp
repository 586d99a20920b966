#pragma once

#include <algorithm>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "rule_interface/IPatternRule.hpp"

namespace rule_utils {

inline wallet_risk::PatternFinding MakeFinding(
    const wallet_risk::PatternContext& context,
    wallet_risk::PatternKind kind,
    wallet_risk::Severity severity,
    std::string description,
    uint64_t contribution,
    std::vector<std::string> evidence_ids = {}) {
    wallet_risk::PatternFinding finding;
    finding.address = context.address;
    finding.pattern_kind = kind;
    finding.severity = severity;
    finding.description = std::move(description);
    finding.evidence_ids = std::move(evidence_ids);
    finding.score_contribution = static_cast<uint8_t>(
        std::min<uint64_t>(contribution, wallet_risk::kMaxRiskScore));
    finding.detected_at = context.now;
    return finding;
}

// References of the trailing `count` transactions, oldest first.
inline std::vector<std::string> TrailingRefs(
    const std::vector<wallet_risk::ObservedTransaction>& transactions,
    uint64_t count) {
    const auto take = static_cast<size_t>(std::min<uint64_t>(count, transactions.size()));
    std::vector<std::string> refs;
    refs.reserve(take);
    for (auto it = transactions.end() - take; it != transactions.end(); ++it) {
        refs.push_back(it->transaction_ref);
    }
    return refs;
}

// Saturating multiplication for threshold arithmetic.
inline uint64_t SaturatingMul(uint64_t value, uint64_t factor) {
    if (factor != 0 && value > std::numeric_limits<uint64_t>::max() / factor) {
        return std::numeric_limits<uint64_t>::max();
    }
    return value * factor;
}

}  // namespace rule_utils
