#pragma once

#include "rule_interface/IPatternRule.hpp"

namespace wallet_risk {

// Rules over a list of observed transactions: the stored window of an address
// or a batch supplied by the caller.

class LargeTransferRule : public IPatternRule {
public:
    PatternKind Kind() const override { return PatternKind::kLargeTransfer; }
    std::optional<PatternFinding> Evaluate(const PatternContext& context) const override;
};

class RoundAmountRule : public IPatternRule {
public:
    static constexpr uint64_t kRoundUnit = 10;
    static constexpr uint64_t kMinSharePct = 30;
    static constexpr uint8_t kContribution = 25;

    PatternKind Kind() const override { return PatternKind::kRoundAmounts; }
    std::optional<PatternFinding> Evaluate(const PatternContext& context) const override;
};

class UnusualHourRule : public IPatternRule {
public:
    PatternKind Kind() const override { return PatternKind::kUnusualHour; }
    std::optional<PatternFinding> Evaluate(const PatternContext& context) const override;
};

// UTC hour of day of a millisecond timestamp.
uint32_t HourOfDayUtc(TimestampMs timestamp_ms);

}  // namespace wallet_risk
