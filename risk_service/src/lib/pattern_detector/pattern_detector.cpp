#include "pattern_detector.hpp"

#include <userver/logging/log.hpp>

#include "rule_factory/pattern_rule_factory.hpp"

namespace wallet_risk {

PatternDetector::PatternDetector()
    : address_rules_(PatternRuleFactory::CreateAddressRules())
    , batch_rules_(PatternRuleFactory::CreateBatchRules()) {}

std::vector<PatternFinding> PatternDetector::Detect(
    const Address& address,
    const AddressHistory& history,
    const RiskThresholds& thresholds,
    TimestampMs now) const {
    const PatternContext context{address, &history.record, history.window, thresholds, now};
    return Run(address_rules_, context);
}

std::vector<PatternFinding> PatternDetector::DetectBatch(
    const Address& address,
    const std::vector<ObservedTransaction>& transactions,
    const RiskThresholds& thresholds,
    TimestampMs now) const {
    const PatternContext context{address, nullptr, transactions, thresholds, now};
    return Run(batch_rules_, context);
}

std::vector<PatternFinding> PatternDetector::Run(
    const std::vector<PatternRulePtr>& rules,
    const PatternContext& context) {
    std::vector<PatternFinding> findings;
    for (const auto& rule : rules) {
        auto finding = rule->Evaluate(context);
        if (finding) {
            LOG_INFO() << "Pattern " << ToString(finding->pattern_kind)
                       << " (" << ToString(finding->severity) << ") detected for "
                       << context.address << ": " << finding->description;
            findings.push_back(std::move(*finding));
        }
    }
    return findings;
}

}  // namespace wallet_risk
