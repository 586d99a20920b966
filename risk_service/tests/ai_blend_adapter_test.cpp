#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include <userver/engine/sleep.hpp>
#include <userver/utest/utest.hpp>

#include "ai_blend/ai_blend_adapter.hpp"

namespace wallet_risk {

namespace {

class StubOracle final : public RiskOracle {
public:
    StubOracle(AiAssessment assessment, std::chrono::milliseconds delay = {}, bool fail = false)
        : assessment_(assessment), delay_(delay), fail_(fail) {}

    AiAssessment Assess(const OracleRequest&) override {
        ++calls;
        if (delay_.count() > 0) {
            userver::engine::InterruptibleSleepFor(delay_);
        }
        if (fail_) {
            throw std::runtime_error("oracle unavailable");
        }
        return assessment_;
    }

    std::string Name() const override { return "stub"; }

    std::atomic<int> calls{0};

private:
    const AiAssessment assessment_;
    const std::chrono::milliseconds delay_;
    const bool fail_;
};

// Holds the call for a fixed time and ignores cancellation, like a native
// library call would.
class UninterruptibleOracle final : public RiskOracle {
public:
    explicit UninterruptibleOracle(std::chrono::milliseconds hold) : hold_(hold) {}

    AiAssessment Assess(const OracleRequest&) override {
        userver::engine::SleepFor(hold_);
        finished = true;
        return AiAssessment{100, 100};
    }

    std::string Name() const override { return "uninterruptible"; }

    std::atomic<bool> finished{false};

private:
    const std::chrono::milliseconds hold_;
};

AiBlendConfig EnabledConfig() {
    AiBlendConfig config;
    config.enabled = true;
    return config;
}

OracleRequest MakeRequest() {
    OracleRequest request;
    request.transfer.transaction_ref = "0xdigest";
    return request;
}

}  // namespace

TEST(BlendScores, WeightedHalfUp) {
    EXPECT_EQ(BlendScores(25, 80, 30), 42);
    EXPECT_EQ(BlendScores(50, 51, 50), 51);
    EXPECT_EQ(BlendScores(0, 100, 100), 100);
    EXPECT_EQ(BlendScores(100, 0, 0), 100);
    EXPECT_EQ(BlendScores(33, 34, 50), 34);
}

UTEST(AiBlendAdapter, DisabledDoesNotCallOracle) {
    auto oracle = std::make_shared<StubOracle>(AiAssessment{90, 90});
    const AiBlendAdapter adapter(oracle);

    const auto outcome = adapter.Blend(25, 10, MakeRequest(), AiBlendConfig{});
    EXPECT_EQ(outcome.status, AiStatus::kNotRequested);
    EXPECT_EQ(outcome.sender_score, 25);
    EXPECT_EQ(outcome.recipient_score, 10);
    EXPECT_EQ(oracle->calls.load(), 0);
}

UTEST(AiBlendAdapter, NoOracleIsNotRequested) {
    const AiBlendAdapter adapter(nullptr);
    const auto outcome = adapter.Blend(25, 10, MakeRequest(), EnabledConfig());
    EXPECT_EQ(outcome.status, AiStatus::kNotRequested);
    EXPECT_EQ(outcome.sender_score, 25);
}

UTEST(AiBlendAdapter, ConfidenceAtFloorBlends) {
    auto oracle = std::make_shared<StubOracle>(AiAssessment{80, 70});
    const AiBlendAdapter adapter(oracle);

    const auto outcome = adapter.Blend(25, 0, MakeRequest(), EnabledConfig());
    EXPECT_EQ(outcome.status, AiStatus::kBlended);
    EXPECT_EQ(outcome.sender_score, 42);
    EXPECT_EQ(outcome.recipient_score, 24);
    ASSERT_TRUE(outcome.assessment.has_value());
    EXPECT_EQ(outcome.assessment->score, 80);
}

UTEST(AiBlendAdapter, ConfidenceBelowFloorKeepsRuleScore) {
    auto oracle = std::make_shared<StubOracle>(AiAssessment{80, 69});
    const AiBlendAdapter adapter(oracle);

    const auto outcome = adapter.Blend(25, 0, MakeRequest(), EnabledConfig());
    EXPECT_EQ(outcome.status, AiStatus::kLowConfidence);
    EXPECT_EQ(outcome.sender_score, 25);
    EXPECT_EQ(outcome.recipient_score, 0);
}

UTEST(AiBlendAdapter, TimeoutFallsBackToRuleScore) {
    auto oracle = std::make_shared<StubOracle>(AiAssessment{100, 100}, std::chrono::seconds{10});
    const AiBlendAdapter adapter(oracle);
    auto config = EnabledConfig();
    config.max_wait_ms = 20;

    const auto outcome = adapter.Blend(25, 0, MakeRequest(), config);
    EXPECT_EQ(outcome.status, AiStatus::kFallback);
    EXPECT_EQ(outcome.sender_score, 25);
    EXPECT_FALSE(outcome.assessment.has_value());
    EXPECT_EQ(oracle->calls.load(), 1);
}

UTEST(AiBlendAdapter, TimeoutDoesNotWaitForUninterruptibleOracle) {
    auto oracle = std::make_shared<UninterruptibleOracle>(std::chrono::milliseconds{500});
    const AiBlendAdapter adapter(oracle);
    auto config = EnabledConfig();
    config.max_wait_ms = 20;

    const auto started = std::chrono::steady_clock::now();
    const auto outcome = adapter.Blend(25, 0, MakeRequest(), config);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(outcome.status, AiStatus::kFallback);
    EXPECT_EQ(outcome.sender_score, 25);
    EXPECT_LT(elapsed, std::chrono::milliseconds{300});
    EXPECT_FALSE(oracle->finished.load());

    // The abandoned call still runs to completion on its own.
    while (!oracle->finished.load()) {
        userver::engine::SleepFor(std::chrono::milliseconds{10});
    }
}

UTEST(AiBlendAdapter, FailureWithoutFallbackIsUnavailable) {
    auto oracle = std::make_shared<StubOracle>(AiAssessment{100, 100}, std::chrono::milliseconds{}, true);
    const AiBlendAdapter adapter(oracle);
    auto config = EnabledConfig();

    EXPECT_EQ(adapter.Blend(25, 0, MakeRequest(), config).status, AiStatus::kFallback);

    config.fallback_on_failure = false;
    const auto outcome = adapter.Blend(25, 0, MakeRequest(), config);
    EXPECT_EQ(outcome.status, AiStatus::kUnavailable);
    EXPECT_EQ(outcome.sender_score, 25);
}

}  // namespace wallet_risk
