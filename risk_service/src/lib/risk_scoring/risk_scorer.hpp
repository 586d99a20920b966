#pragma once

#include <vector>

#include "address_registry/address_registry.hpp"
#include "risk_types/risk_types.hpp"

namespace wallet_risk {

struct ScoreBreakdown {
    uint8_t score = 0;
    std::vector<RiskFactor> factors;
};

// Additive point system over registry membership, the transfer amount and the
// address aggregates, clamped to [0, 100]. Reads only; holds references to a
// registry and threshold snapshot that must outlive the scorer.
class RiskScorer {
public:
    static constexpr uint32_t kBlacklistPenalty = 90;
    static constexpr uint32_t kLargeTransferPenalty = 25;
    static constexpr uint32_t kRapidTransactionsPenalty = 20;
    static constexpr uint32_t kFailedTransactionsPenalty = 15;
    static constexpr uint32_t kContractRatioPenalty = 10;
    static constexpr uint64_t kRapidTransactionsFloor = 3;

    RiskScorer(const AddressRegistry& registry, const RiskThresholds& thresholds);

    // record is null for an address without history.
    ScoreBreakdown Explain(const Address& address, uint64_t amount, const AddressRecord* record) const;

    uint8_t Score(const Address& address, uint64_t amount, const AddressRecord* record) const;

private:
    const AddressRegistry& registry_;
    const RiskThresholds& thresholds_;
};

// contract_interaction_count * 100 / transaction_count with truncation; 0 for an
// empty record.
uint64_t ContractInteractionPercentage(const AddressRecord& record);

}  // namespace wallet_risk
