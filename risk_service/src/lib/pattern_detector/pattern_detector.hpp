#pragma once

#include <vector>

#include "rule_interface/IPatternRule.hpp"
#include "transaction_history/transaction_history_store.hpp"

namespace wallet_risk {

// Runs every pattern rule independently. Findings are cumulative: rules are not
// deduplicated against each other and several may fire for one address.
class PatternDetector {
public:
    PatternDetector();

    std::vector<PatternFinding> Detect(
        const Address& address,
        const AddressHistory& history,
        const RiskThresholds& thresholds,
        TimestampMs now) const;

    std::vector<PatternFinding> DetectBatch(
        const Address& address,
        const std::vector<ObservedTransaction>& transactions,
        const RiskThresholds& thresholds,
        TimestampMs now) const;

private:
    static std::vector<PatternFinding> Run(
        const std::vector<PatternRulePtr>& rules,
        const PatternContext& context);

    std::vector<PatternRulePtr> address_rules_;
    std::vector<PatternRulePtr> batch_rules_;
};

}  // namespace wallet_risk
