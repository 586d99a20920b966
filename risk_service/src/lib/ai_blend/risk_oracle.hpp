#pragma once

#include <string>

#include "risk_types/risk_types.hpp"

namespace wallet_risk {

struct AiAssessment {
    uint8_t score = 0;
    uint8_t confidence = 0;
};

// Context handed to the oracle. Records are copies taken after the history
// update, so the oracle never touches the store.
struct OracleRequest {
    Transfer transfer;
    AddressRecord sender;
    AddressRecord recipient;
};

// External risk assessment. Implementations may block and may throw on
// failure. A call that outlives max_wait_ms is abandoned, not awaited, and
// keeps running until Assess returns.
class RiskOracle {
public:
    virtual ~RiskOracle() = default;

    virtual AiAssessment Assess(const OracleRequest& request) = 0;

    virtual std::string Name() const = 0;
};

}  // namespace wallet_risk
