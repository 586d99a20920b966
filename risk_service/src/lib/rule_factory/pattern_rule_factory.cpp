#include "pattern_rule_factory.hpp"

#include <stdexcept>
#include <string>

#include "pattern_rule/history_rules.hpp"
#include "pattern_rule/window_rules.hpp"

namespace wallet_risk {

PatternRulePtr PatternRuleFactory::CreateRuleByKind(PatternKind kind) {
    const auto& creators = GetCreators();
    auto it = creators.find(kind);

    if (it == creators.end()) {
        throw std::runtime_error(
            "Unknown PatternKind: " + std::to_string(static_cast<int>(kind)));
    }

    return it->second();
}

std::vector<PatternRulePtr> PatternRuleFactory::CreateAddressRules() {
    std::vector<PatternRulePtr> rules;
    for (auto kind : {PatternKind::kRapidTransactions,
                      PatternKind::kFailedSpike,
                      PatternKind::kUnusualContract,
                      PatternKind::kRoundAmounts,
                      PatternKind::kUnusualHour,
                      PatternKind::kNewAddress}) {
        rules.push_back(CreateRuleByKind(kind));
    }
    return rules;
}

std::vector<PatternRulePtr> PatternRuleFactory::CreateBatchRules() {
    std::vector<PatternRulePtr> rules;
    for (auto kind : {PatternKind::kRapidTransactions,
                      PatternKind::kLargeTransfer,
                      PatternKind::kFailedSpike,
                      PatternKind::kUnusualContract,
                      PatternKind::kRoundAmounts,
                      PatternKind::kUnusualHour}) {
        rules.push_back(CreateRuleByKind(kind));
    }
    return rules;
}

const std::unordered_map<PatternKind, PatternRuleFactory::RuleCreator>&
PatternRuleFactory::GetCreators() {
    static const std::unordered_map<PatternKind, RuleCreator> creators = {
        {PatternKind::kRapidTransactions, []() -> PatternRulePtr {
            return std::make_unique<RapidTransactionsRule>();
        }},
        {PatternKind::kFailedSpike, []() -> PatternRulePtr {
            return std::make_unique<FailedSpikeRule>();
        }},
        {PatternKind::kUnusualContract, []() -> PatternRulePtr {
            return std::make_unique<UnusualContractRule>();
        }},
        {PatternKind::kNewAddress, []() -> PatternRulePtr {
            return std::make_unique<NewAddressRule>();
        }},
        {PatternKind::kLargeTransfer, []() -> PatternRulePtr {
            return std::make_unique<LargeTransferRule>();
        }},
        {PatternKind::kRoundAmounts, []() -> PatternRulePtr {
            return std::make_unique<RoundAmountRule>();
        }},
        {PatternKind::kUnusualHour, []() -> PatternRulePtr {
            return std::make_unique<UnusualHourRule>();
        }}
    };
    return creators;
}

}  // namespace wallet_risk
