#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "risk_types/risk_types.hpp"

namespace wallet_risk {

struct PatternContext {
    const Address& address;
    // Null when evaluating a caller-supplied batch without a stored record.
    const AddressRecord* record;
    const std::vector<ObservedTransaction>& transactions;
    const RiskThresholds& thresholds;
    TimestampMs now;
};

class IPatternRule {
public:
    virtual ~IPatternRule() = default;

    virtual PatternKind Kind() const = 0;

    virtual std::optional<PatternFinding> Evaluate(const PatternContext& context) const = 0;
};

using PatternRulePtr = std::unique_ptr<IPatternRule>;

}  // namespace wallet_risk
