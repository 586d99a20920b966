#include "window_rules.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "rule_utils/finding_builder.hpp"

namespace wallet_risk {

namespace {

constexpr uint64_t kMillisecondsPerHour = 60 * 60 * 1000;

}  // namespace

uint32_t HourOfDayUtc(TimestampMs timestamp_ms) {
    return static_cast<uint32_t>((timestamp_ms / kMillisecondsPerHour) % 24);
}

std::optional<PatternFinding> LargeTransferRule::Evaluate(const PatternContext& context) const {
    const uint64_t cutoff = context.thresholds.large_transfer_cutoff;

    std::vector<std::string> evidence;
    long double total = 0;
    uint64_t largest = 0;
    for (const auto& tx : context.transactions) {
        if (tx.amount > cutoff) {
            evidence.push_back(tx.transaction_ref);
            total += static_cast<long double>(tx.amount);
            largest = std::max(largest, tx.amount);
        }
    }
    if (evidence.empty()) {
        return std::nullopt;
    }

    const long double average = total / static_cast<long double>(evidence.size());
    const long double ratio = cutoff == 0
        ? static_cast<long double>(kMaxRiskScore)
        : average / static_cast<long double>(cutoff);

    Severity severity = Severity::kMedium;
    if (ratio > 10) {
        severity = Severity::kCritical;
    } else if (ratio > 5) {
        severity = Severity::kHigh;
    }

    const auto contribution = static_cast<uint64_t>(std::min<long double>(ratio * 10, kMaxRiskScore));
    return rule_utils::MakeFinding(
        context, Kind(), severity,
        fmt::format("{} transfers above {} (average {:.0f}, largest {})",
                    evidence.size(), cutoff, static_cast<double>(average), largest),
        contribution,
        std::move(evidence));
}

std::optional<PatternFinding> RoundAmountRule::Evaluate(const PatternContext& context) const {
    if (context.transactions.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> evidence;
    for (const auto& tx : context.transactions) {
        if (tx.amount > 0 && tx.amount % kRoundUnit == 0) {
            evidence.push_back(tx.transaction_ref);
        }
    }

    const uint64_t count = evidence.size();
    const uint64_t observed = context.transactions.size();
    if (count <= context.thresholds.round_amount_cluster_cutoff || count * 100 <= kMinSharePct * observed) {
        return std::nullopt;
    }

    return rule_utils::MakeFinding(
        context, Kind(), Severity::kLow,
        fmt::format("{} of {} transactions use round amounts (potential bot activity)", count, observed),
        kContribution,
        std::move(evidence));
}

std::optional<PatternFinding> UnusualHourRule::Evaluate(const PatternContext& context) const {
    const uint32_t start = context.thresholds.unusual_hour_start;
    const uint32_t end = context.thresholds.unusual_hour_window;

    std::vector<std::string> evidence;
    for (const auto& tx : context.transactions) {
        const uint32_t hour = HourOfDayUtc(tx.timestamp_ms);
        if (hour >= start && hour < end) {
            evidence.push_back(tx.transaction_ref);
        }
    }
    if (evidence.empty()) {
        return std::nullopt;
    }

    const uint64_t count = evidence.size();
    return rule_utils::MakeFinding(
        context, Kind(), count > 1 ? Severity::kMedium : Severity::kLow,
        fmt::format("{} transactions between {:02}:00 and {:02}:00 UTC", count, start, end),
        rule_utils::SaturatingMul(count, 5),
        std::move(evidence));
}

}  // namespace wallet_risk
