#pragma once

#include "rule_interface/IPatternRule.hpp"

namespace wallet_risk {

// Rules over the aggregate counters of a stored AddressRecord. Without a record
// (a caller-supplied batch) the first three evaluate the transaction list.

class RapidTransactionsRule : public IPatternRule {
public:
    static constexpr uint64_t kTriggerCount = 3;
    static constexpr uint64_t kCriticalCount = 10;

    PatternKind Kind() const override { return PatternKind::kRapidTransactions; }
    std::optional<PatternFinding> Evaluate(const PatternContext& context) const override;

private:
    // Counts every gap below the window between time-ordered neighbours; runs
    // are not reset by a wide gap as they are in the record counter.
    std::optional<PatternFinding> EvaluateBatch(const PatternContext& context) const;
};

class FailedSpikeRule : public IPatternRule {
public:
    PatternKind Kind() const override { return PatternKind::kFailedSpike; }
    std::optional<PatternFinding> Evaluate(const PatternContext& context) const override;

private:
    std::optional<PatternFinding> EvaluateBatch(const PatternContext& context) const;
};

class UnusualContractRule : public IPatternRule {
public:
    static constexpr uint64_t kHighSeverityPct = 90;

    PatternKind Kind() const override { return PatternKind::kUnusualContract; }
    std::optional<PatternFinding> Evaluate(const PatternContext& context) const override;

private:
    std::optional<PatternFinding> EvaluateBatch(const PatternContext& context) const;
};

// A young address that already moved ten large transfers worth of value.
class NewAddressRule : public IPatternRule {
public:
    static constexpr uint64_t kVolumeMultiplier = 10;
    static constexpr uint8_t kContribution = 30;

    PatternKind Kind() const override { return PatternKind::kNewAddress; }
    std::optional<PatternFinding> Evaluate(const PatternContext& context) const override;
};

}  // namespace wallet_risk
