#pragma once

#include <memory>
#include <optional>

#include "ai_blend/risk_oracle.hpp"

namespace wallet_risk {

struct BlendOutcome {
    uint8_t sender_score = 0;
    uint8_t recipient_score = 0;
    AiStatus status = AiStatus::kNotRequested;
    std::optional<AiAssessment> assessment;
};

// round(rule * (1 - w) + ai * w) with w = ai_weight_pct / 100, in integers.
uint8_t BlendScores(uint8_t rule_score, uint8_t ai_score, uint32_t ai_weight_pct);

class AiBlendAdapter {
public:
    explicit AiBlendAdapter(std::shared_ptr<RiskOracle> oracle);

    // Must be called without any address lock held: the oracle runs in a
    // separate task and may take up to config.max_wait_ms. Never throws on
    // oracle failure; the rule scores are returned instead.
    BlendOutcome Blend(
        uint8_t sender_rule_score,
        uint8_t recipient_rule_score,
        OracleRequest request,
        const AiBlendConfig& config) const;

    bool HasOracle() const { return oracle_ != nullptr; }

private:
    std::optional<AiAssessment> RequestAssessment(OracleRequest request, const AiBlendConfig& config) const;

    std::shared_ptr<RiskOracle> oracle_;
};

}  // namespace wallet_risk
