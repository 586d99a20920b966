#pragma once

#include <functional>
#include <unordered_map>
#include <vector>

#include "rule_interface/IPatternRule.hpp"

namespace wallet_risk {

class PatternRuleFactory {
public:
    static PatternRulePtr CreateRuleByKind(PatternKind kind);

    // Rules run after every observed transaction against the stored record and window.
    static std::vector<PatternRulePtr> CreateAddressRules();

    // Rules run over a caller-supplied list of transactions.
    static std::vector<PatternRulePtr> CreateBatchRules();

private:
    using RuleCreator = std::function<PatternRulePtr()>;
    static const std::unordered_map<PatternKind, RuleCreator>& GetCreators();
};

}  // namespace wallet_risk
