#include "ai_blend_adapter.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include <userver/engine/deadline.hpp>
#include <userver/engine/task/task.hpp>
#include <userver/logging/log.hpp>
#include <userver/utils/async.hpp>

namespace wallet_risk {

uint8_t BlendScores(uint8_t rule_score, uint8_t ai_score, uint32_t ai_weight_pct) {
    const uint32_t weight = std::min<uint32_t>(ai_weight_pct, 100);
    const uint32_t ai = std::min<uint32_t>(ai_score, kMaxRiskScore);
    const uint32_t weighted = rule_score * (100 - weight) + ai * weight;
    // Half-up rounding of weighted / 100.
    return static_cast<uint8_t>(std::min<uint32_t>((weighted + 50) / 100, kMaxRiskScore));
}

AiBlendAdapter::AiBlendAdapter(std::shared_ptr<RiskOracle> oracle)
    : oracle_(std::move(oracle)) {}

BlendOutcome AiBlendAdapter::Blend(
    uint8_t sender_rule_score,
    uint8_t recipient_rule_score,
    OracleRequest request,
    const AiBlendConfig& config) const {
    BlendOutcome outcome;
    outcome.sender_score = sender_rule_score;
    outcome.recipient_score = recipient_rule_score;

    if (!config.enabled || !oracle_) {
        outcome.status = AiStatus::kNotRequested;
        return outcome;
    }

    const auto transaction_ref = request.transfer.transaction_ref;
    outcome.assessment = RequestAssessment(std::move(request), config);
    if (!outcome.assessment) {
        outcome.status = config.fallback_on_failure ? AiStatus::kFallback : AiStatus::kUnavailable;
        LOG_WARNING() << "AI assessment degraded for transaction " << transaction_ref
                      << ", using rule-based scores (status: " << ToString(outcome.status) << ")";
        return outcome;
    }

    if (outcome.assessment->confidence < config.confidence_floor_pct) {
        outcome.status = AiStatus::kLowConfidence;
        LOG_DEBUG() << "AI confidence " << static_cast<int>(outcome.assessment->confidence)
                    << " below floor " << config.confidence_floor_pct
                    << " for transaction " << transaction_ref;
        return outcome;
    }

    outcome.status = AiStatus::kBlended;
    outcome.sender_score = BlendScores(sender_rule_score, outcome.assessment->score, config.ai_weight_pct);
    outcome.recipient_score = BlendScores(recipient_rule_score, outcome.assessment->score, config.ai_weight_pct);
    return outcome;
}

std::optional<AiAssessment> AiBlendAdapter::RequestAssessment(
    OracleRequest request,
    const AiBlendConfig& config) const {
    auto task = userver::utils::Async(
        "ai-risk-oracle",
        [oracle = oracle_, request = std::move(request)] { return oracle->Assess(request); });

    task.WaitUntil(userver::engine::Deadline::FromDuration(std::chrono::milliseconds{config.max_wait_ms}));
    if (!task.IsFinished()) {
        // The oracle may ignore cancellation, so the task is detached rather
        // than awaited. It owns copies of everything it touches.
        task.RequestCancel();
        userver::engine::DetachUnscopedUnsafe(std::move(task));
        LOG_WARNING() << "AI oracle " << oracle_->Name() << " did not answer within "
                      << config.max_wait_ms << " ms, request abandoned";
        return std::nullopt;
    }

    try {
        return task.Get();
    } catch (const std::exception& e) {
        LOG_WARNING() << "AI oracle " << oracle_->Name() << " failed: " << e.what();
        return std::nullopt;
    }
}

}  // namespace wallet_risk
