#pragma once

#include <optional>
#include <vector>

#include "risk_types/risk_types.hpp"

namespace wallet_risk {

inline constexpr uint8_t kAlertScoreBoundary = 80;
inline constexpr uint8_t kHighSeverityBoundary = 70;
inline constexpr uint8_t kCriticalSeverityBoundary = 90;

// Severity of an alert raised at the given score: >90 critical, >70 high,
// otherwise medium.
Severity AlertSeverityForScore(uint8_t score);

// Raises an alert when max(sender_score, recipient_score) exceeds 80. Findings
// only enrich the message; they never raise an alert on their own.
std::optional<Alert> MaybeAlert(
    uint8_t sender_score,
    uint8_t recipient_score,
    const std::vector<PatternFinding>& findings,
    const Transfer& transfer);

}  // namespace wallet_risk
