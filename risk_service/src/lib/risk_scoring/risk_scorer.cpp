#include "risk_scorer.hpp"

#include <algorithm>

namespace wallet_risk {

RiskScorer::RiskScorer(const AddressRegistry& registry, const RiskThresholds& thresholds)
    : registry_(registry)
    , thresholds_(thresholds) {}

ScoreBreakdown RiskScorer::Explain(
    const Address& address,
    uint64_t amount,
    const AddressRecord* record) const {
    ScoreBreakdown breakdown;
    uint32_t total = 0;

    if (registry_.IsBlacklisted(address)) {
        total += kBlacklistPenalty;
        breakdown.factors.push_back(RiskFactor::kBlacklisted);
    }

    // Halves whatever has accumulated so far, so the order of these two steps matters.
    if (registry_.IsWhitelisted(address)) {
        total /= 2;
        breakdown.factors.push_back(RiskFactor::kWhitelisted);
    }

    if (amount > thresholds_.large_transfer_cutoff) {
        total += kLargeTransferPenalty;
        breakdown.factors.push_back(RiskFactor::kLargeTransfer);
    }

    if (record) {
        if (record->rapid_transaction_count > kRapidTransactionsFloor) {
            total += kRapidTransactionsPenalty;
            breakdown.factors.push_back(RiskFactor::kRapidTransactions);
        }
        if (record->failed_transaction_count > thresholds_.failed_transaction_cutoff) {
            total += kFailedTransactionsPenalty;
            breakdown.factors.push_back(RiskFactor::kFailedTransactions);
        }
        if (record->transaction_count > 0
            && ContractInteractionPercentage(*record) > thresholds_.contract_interaction_ratio_cutoff_pct) {
            total += kContractRatioPenalty;
            breakdown.factors.push_back(RiskFactor::kContractRatio);
        }
    }

    breakdown.score = static_cast<uint8_t>(std::min<uint32_t>(total, kMaxRiskScore));
    return breakdown;
}

uint8_t RiskScorer::Score(const Address& address, uint64_t amount, const AddressRecord* record) const {
    return Explain(address, amount, record).score;
}

uint64_t ContractInteractionPercentage(const AddressRecord& record) {
    if (record.transaction_count == 0) {
        return 0;
    }
    // Split form of count * 100 / total that cannot wrap for large counters.
    const uint64_t whole = record.contract_interaction_count / record.transaction_count;
    const uint64_t rest = record.contract_interaction_count % record.transaction_count;
    return whole * 100 + rest * 100 / record.transaction_count;
}

}  // namespace wallet_risk
