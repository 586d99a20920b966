#include "alert_emitter.hpp"

#include <algorithm>
#include <set>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <userver/logging/log.hpp>

namespace wallet_risk {

Severity AlertSeverityForScore(uint8_t score) {
    if (score > kCriticalSeverityBoundary) return Severity::kCritical;
    if (score > kHighSeverityBoundary) return Severity::kHigh;
    return Severity::kMedium;
}

std::optional<Alert> MaybeAlert(
    uint8_t sender_score,
    uint8_t recipient_score,
    const std::vector<PatternFinding>& findings,
    const Transfer& transfer) {
    const uint8_t final_score = std::max(sender_score, recipient_score);
    if (final_score <= kAlertScoreBoundary) {
        return std::nullopt;
    }

    Alert alert;
    alert.transaction_ref = transfer.transaction_ref;
    alert.sender = transfer.sender;
    alert.recipient = transfer.recipient;
    alert.amount = transfer.amount;
    alert.risk_score = final_score;
    alert.severity = AlertSeverityForScore(final_score);
    alert.alert_kind = alert.severity == Severity::kCritical ? AlertKind::kSecurity : AlertKind::kWarning;
    alert.timestamp = transfer.now;

    const bool sender_triggered = sender_score >= recipient_score;
    alert.message = fmt::format(
        "High risk transaction: {} {} scored {}",
        sender_triggered ? "sender" : "recipient",
        sender_triggered ? transfer.sender : transfer.recipient,
        final_score);

    std::set<PatternKind> kinds;
    for (const auto& finding : findings) {
        kinds.insert(finding.pattern_kind);
    }
    if (!kinds.empty()) {
        std::vector<std::string_view> names;
        for (auto kind : kinds) {
            names.push_back(ToString(kind));
        }
        alert.message += fmt::format("; patterns: {}", fmt::join(names, ", "));
    }

    LOG_WARNING() << "Alert (" << ToString(alert.severity) << ") for transaction "
                  << transfer.transaction_ref << ": " << alert.message;
    return alert;
}

}  // namespace wallet_risk
