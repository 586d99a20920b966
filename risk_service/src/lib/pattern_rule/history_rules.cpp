#include "history_rules.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "risk_scoring/risk_scorer.hpp"
#include "rule_utils/finding_builder.hpp"

namespace wallet_risk {

std::optional<PatternFinding> RapidTransactionsRule::Evaluate(const PatternContext& context) const {
    if (!context.record) {
        return EvaluateBatch(context);
    }
    if (context.record->rapid_transaction_count <= kTriggerCount) {
        return std::nullopt;
    }
    const uint64_t rapid = context.record->rapid_transaction_count;
    const auto severity = rapid > kCriticalCount ? Severity::kCritical : Severity::kHigh;

    // A run of N rapid transactions spans N + 1 observed ones.
    return rule_utils::MakeFinding(
        context, Kind(), severity,
        fmt::format("{} consecutive transactions within {} ms of each other",
                    rapid + 1, context.thresholds.rapid_transaction_window_ms),
        rule_utils::SaturatingMul(rapid, 10),
        rule_utils::TrailingRefs(context.transactions, rapid + 1));
}

std::optional<PatternFinding> RapidTransactionsRule::EvaluateBatch(const PatternContext& context) const {
    const uint64_t window = context.thresholds.rapid_transaction_window_ms;

    std::vector<const ObservedTransaction*> ordered;
    ordered.reserve(context.transactions.size());
    for (const auto& tx : context.transactions) {
        ordered.push_back(&tx);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto* lhs, const auto* rhs) {
        return lhs->timestamp_ms < rhs->timestamp_ms;
    });

    uint64_t close_gaps = 0;
    std::vector<std::string> evidence;
    const ObservedTransaction* last_marked = nullptr;
    for (size_t i = 1; i < ordered.size(); ++i) {
        if (ordered[i]->timestamp_ms - ordered[i - 1]->timestamp_ms >= window) {
            continue;
        }
        ++close_gaps;
        if (last_marked != ordered[i - 1]) {
            evidence.push_back(ordered[i - 1]->transaction_ref);
        }
        evidence.push_back(ordered[i]->transaction_ref);
        last_marked = ordered[i];
    }
    if (close_gaps <= kTriggerCount) {
        return std::nullopt;
    }

    const auto severity = close_gaps > kCriticalCount ? Severity::kCritical : Severity::kHigh;
    const auto involved = evidence.size();
    return rule_utils::MakeFinding(
        context, Kind(), severity,
        fmt::format("{} transactions within {} ms of a neighbour ({} close gaps)",
                    involved, window, close_gaps),
        rule_utils::SaturatingMul(close_gaps, 10),
        std::move(evidence));
}

std::optional<PatternFinding> FailedSpikeRule::Evaluate(const PatternContext& context) const {
    if (!context.record) {
        return EvaluateBatch(context);
    }
    if (context.record->failed_transaction_count <= context.thresholds.failed_transaction_cutoff) {
        return std::nullopt;
    }
    const uint64_t failed = context.record->failed_transaction_count;
    return rule_utils::MakeFinding(
        context, Kind(), Severity::kMedium,
        fmt::format("{} failed transactions (cutoff {})",
                    failed, context.thresholds.failed_transaction_cutoff),
        rule_utils::SaturatingMul(failed, 15));
}

std::optional<PatternFinding> FailedSpikeRule::EvaluateBatch(const PatternContext& context) const {
    std::vector<std::string> evidence;
    for (const auto& tx : context.transactions) {
        if (tx.status == TransactionStatus::kFailed) {
            evidence.push_back(tx.transaction_ref);
        }
    }
    const uint64_t failed = evidence.size();
    if (failed <= context.thresholds.failed_transaction_cutoff) {
        return std::nullopt;
    }
    return rule_utils::MakeFinding(
        context, Kind(), Severity::kMedium,
        fmt::format("{} of {} transactions failed (cutoff {})",
                    failed, context.transactions.size(), context.thresholds.failed_transaction_cutoff),
        rule_utils::SaturatingMul(failed, 15),
        std::move(evidence));
}

std::optional<PatternFinding> UnusualContractRule::Evaluate(const PatternContext& context) const {
    if (!context.record) {
        return EvaluateBatch(context);
    }
    if (context.record->transaction_count == 0) {
        return std::nullopt;
    }
    const uint64_t percentage = ContractInteractionPercentage(*context.record);
    if (percentage <= context.thresholds.contract_interaction_ratio_cutoff_pct) {
        return std::nullopt;
    }

    std::vector<std::string> evidence;
    for (const auto& tx : context.transactions) {
        if (tx.category == TransactionCategory::kContract) {
            evidence.push_back(tx.transaction_ref);
        }
    }

    return rule_utils::MakeFinding(
        context, Kind(),
        percentage > kHighSeverityPct ? Severity::kHigh : Severity::kMedium,
        fmt::format("{}% of transactions are contract interactions ({} of {})",
                    percentage, context.record->contract_interaction_count,
                    context.record->transaction_count),
        percentage,
        std::move(evidence));
}

std::optional<PatternFinding> UnusualContractRule::EvaluateBatch(const PatternContext& context) const {
    if (context.transactions.empty()) {
        return std::nullopt;
    }
    std::vector<std::string> evidence;
    for (const auto& tx : context.transactions) {
        if (tx.category == TransactionCategory::kContract) {
            evidence.push_back(tx.transaction_ref);
        }
    }
    const uint64_t observed = context.transactions.size();
    const uint64_t percentage = evidence.size() * 100 / observed;
    if (percentage <= context.thresholds.contract_interaction_ratio_cutoff_pct) {
        return std::nullopt;
    }

    const auto contracts = evidence.size();
    return rule_utils::MakeFinding(
        context, Kind(),
        percentage > kHighSeverityPct ? Severity::kHigh : Severity::kMedium,
        fmt::format("{}% of transactions are contract interactions ({} of {})",
                    percentage, contracts, observed),
        percentage,
        std::move(evidence));
}

std::optional<PatternFinding> NewAddressRule::Evaluate(const PatternContext& context) const {
    if (!context.record) {
        return std::nullopt;
    }
    const auto& record = *context.record;
    const uint64_t age = context.now >= record.first_seen_time ? context.now - record.first_seen_time : 0;
    if (age >= context.thresholds.new_address_window_ms) {
        return std::nullopt;
    }
    const uint64_t volume_floor =
        rule_utils::SaturatingMul(context.thresholds.large_transfer_cutoff, kVolumeMultiplier);
    if (record.total_volume <= volume_floor) {
        return std::nullopt;
    }

    return rule_utils::MakeFinding(
        context, Kind(), Severity::kMedium,
        fmt::format("Address first seen {} ms ago already moved {} units",
                    age, record.total_volume),
        kContribution,
        rule_utils::TrailingRefs(context.transactions, context.transactions.size()));
}

}  // namespace wallet_risk
