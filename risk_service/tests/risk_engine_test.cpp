#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <userver/engine/sleep.hpp>
#include <userver/engine/task/task_with_result.hpp>
#include <userver/utest/utest.hpp>
#include <userver/utils/async.hpp>

#include "risk_engine/risk_engine.hpp"

namespace wallet_risk {

namespace {

constexpr char kAdmin[] = "0xadmin";
// 22:13 UTC, outside the default unusual-hour band.
constexpr TimestampMs kBase = 1'700'000'000'000;

EngineSettings MakeSettings() {
    EngineSettings settings;
    settings.admin = kAdmin;
    return settings;
}

Transfer MakeTransfer(std::string ref, Address sender, Address recipient, uint64_t amount,
                      TimestampMs now = kBase,
                      TransactionCategory category = TransactionCategory::kSend) {
    Transfer transfer;
    transfer.transaction_ref = std::move(ref);
    transfer.sender = std::move(sender);
    transfer.recipient = std::move(recipient);
    transfer.amount = amount;
    transfer.category = category;
    transfer.now = now;
    return transfer;
}

class FixedOracle final : public RiskOracle {
public:
    FixedOracle(AiAssessment assessment, std::chrono::milliseconds delay = {})
        : assessment_(assessment), delay_(delay) {}

    AiAssessment Assess(const OracleRequest&) override {
        if (delay_.count() > 0) {
            userver::engine::InterruptibleSleepFor(delay_);
        }
        return assessment_;
    }

    std::string Name() const override { return "fixed"; }

private:
    const AiAssessment assessment_;
    const std::chrono::milliseconds delay_;
};

// Scores "slow" transactions high after a delay and everything else low at once.
class PerTransactionOracle final : public RiskOracle {
public:
    AiAssessment Assess(const OracleRequest& request) override {
        if (request.transfer.transaction_ref == "slow") {
            userver::engine::InterruptibleSleepFor(std::chrono::milliseconds{200});
            return AiAssessment{100, 100};
        }
        return AiAssessment{0, 100};
    }

    std::string Name() const override { return "per-transaction"; }
};

template <typename T>
size_t CountEvents(const std::vector<RiskEvent>& events) {
    return std::count_if(events.begin(), events.end(),
                         [](const RiskEvent& event) { return std::holds_alternative<T>(event); });
}

}  // namespace

UTEST(RiskEngine, SingleLargeTransferScoresBothParties) {
    RiskEngine engine(MakeSettings());

    const auto result = engine.RecordAndScore(MakeTransfer("t1", "0xsender", "0xrecipient", 2000));

    EXPECT_TRUE(result.monitoring_enabled);
    EXPECT_EQ(result.sender_score, 25);
    EXPECT_EQ(result.recipient_score, 25);
    EXPECT_TRUE(result.findings.empty());
    EXPECT_FALSE(result.alert.has_value());
    EXPECT_EQ(result.ai_status, AiStatus::kNotRequested);

    EXPECT_EQ(engine.GetTransactionCount("0xsender"), 1u);
    EXPECT_EQ(engine.GetTransactionCount("0xrecipient"), 1u);
    EXPECT_EQ(engine.GetRiskScore("0xsender"), 25);
    EXPECT_EQ(engine.GetRiskScore("0xrecipient"), 25);

    EXPECT_EQ(result.analysis.final_risk_score, 25);
    EXPECT_EQ(result.analysis.sender_factors, std::vector<RiskFactor>{RiskFactor::kLargeTransfer});

    const auto events = engine.DrainEvents();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<TransactionAnalysis>(events.front()));
    EXPECT_EQ(engine.PendingEventCount(), 0u);
}

UTEST(RiskEngine, RapidTransactionsRaiseScoreAndFinding) {
    RiskEngine engine(MakeSettings());

    AnalysisResult result;
    for (int i = 0; i < 5; ++i) {
        result = engine.RecordAndScore(MakeTransfer(
            "t" + std::to_string(i), "0xsender", "0xrecipient" + std::to_string(i), 123, kBase + i * 1000));
    }

    const auto record = engine.FindRecord("0xsender");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->rapid_transaction_count, 4u);
    EXPECT_EQ(result.sender_score, 20);
    EXPECT_EQ(result.recipient_score, 0);

    ASSERT_EQ(result.findings.size(), 1u);
    const auto& finding = result.findings.front();
    EXPECT_EQ(finding.address, "0xsender");
    EXPECT_EQ(finding.pattern_kind, PatternKind::kRapidTransactions);
    EXPECT_EQ(finding.severity, Severity::kHigh);
    EXPECT_EQ(finding.evidence_ids.size(), 5u);
    EXPECT_FALSE(result.alert.has_value());

    EXPECT_EQ(record->suspicious_pattern_ids, std::set<PatternKind>{PatternKind::kRapidTransactions});
}

UTEST(RiskEngine, RecipientIsRecordedAsReceive) {
    RiskEngine engine(MakeSettings());
    engine.RecordAndScore(MakeTransfer("t1", "0xsender", "0xcontract", 5, kBase, TransactionCategory::kContract));

    EXPECT_EQ(engine.FindRecord("0xsender")->contract_interaction_count, 1u);
    EXPECT_EQ(engine.FindRecord("0xcontract")->contract_interaction_count, 0u);
}

UTEST(RiskEngine, MonitoringDisabledIsNoOp) {
    RiskEngine engine(MakeSettings());
    engine.RecordAndScore(MakeTransfer("t1", "0xsender", "0xrecipient", 2000));
    const auto before = engine.FindRecord("0xsender");
    engine.DrainEvents();

    engine.SetMonitoringEnabled(kAdmin, false);
    EXPECT_FALSE(engine.IsMonitoringEnabled());

    for (int i = 0; i < 3; ++i) {
        const auto result = engine.RecordAndScore(MakeTransfer("t2", "0xsender", "0xother", 50'000, kBase + 1));
        EXPECT_FALSE(result.monitoring_enabled);
        EXPECT_TRUE(result.findings.empty());
        EXPECT_FALSE(result.alert.has_value());
    }
    EXPECT_FALSE(engine.RecordFailure("0xsender"));

    EXPECT_EQ(engine.FindRecord("0xsender"), before);
    EXPECT_FALSE(engine.FindRecord("0xother").has_value());
    EXPECT_EQ(engine.PendingEventCount(), 0u);

    engine.SetMonitoringEnabled(kAdmin, true);
    EXPECT_TRUE(engine.RecordAndScore(MakeTransfer("t3", "0xsender", "0xother", 1, kBase + 2)).monitoring_enabled);
}

UTEST(RiskEngine, MonitoringCanStartDisabled) {
    auto settings = MakeSettings();
    settings.monitoring_enabled = false;
    RiskEngine engine(settings);

    EXPECT_FALSE(engine.RecordAndScore(MakeTransfer("t1", "0xa", "0xb", 1)).monitoring_enabled);
    EXPECT_EQ(engine.GetTransactionCount("0xa"), 0u);
}

UTEST(RiskEngine, NonAdminCannotChangeAnything) {
    RiskEngine engine(MakeSettings());

    RiskThresholds thresholds;
    thresholds.large_transfer_cutoff = 5;
    AiBlendConfig ai;
    ai.enabled = true;

    EXPECT_THROW(engine.SetThresholds("0xmallory", thresholds), AuthorizationError);
    EXPECT_THROW(engine.AddToBlacklist("0xmallory", {"0xvictim"}), AuthorizationError);
    EXPECT_THROW(engine.AddToWhitelist("0xmallory", {"0xmallory"}), AuthorizationError);
    EXPECT_THROW(engine.SetAiConfig("0xmallory", ai), AuthorizationError);
    EXPECT_THROW(engine.SetMonitoringEnabled("0xmallory", false), AuthorizationError);

    EXPECT_EQ(engine.GetThresholds().large_transfer_cutoff, 1000u);
    EXPECT_FALSE(engine.IsBlacklisted("0xvictim"));
    EXPECT_FALSE(engine.IsWhitelisted("0xmallory"));
    EXPECT_FALSE(engine.GetAiConfig().enabled);
    EXPECT_TRUE(engine.IsMonitoringEnabled());
}

UTEST(RiskEngine, WithoutConfiguredAdminEverythingIsRejected) {
    RiskEngine engine(EngineSettings{});
    EXPECT_THROW(engine.SetMonitoringEnabled("", false), AuthorizationError);
    EXPECT_TRUE(engine.IsMonitoringEnabled());
}

UTEST(RiskEngine, InvalidConfigIsRejectedAtomically) {
    RiskEngine engine(MakeSettings());

    RiskThresholds thresholds;
    thresholds.large_transfer_cutoff = 5;
    thresholds.contract_interaction_ratio_cutoff_pct = 101;
    EXPECT_THROW(engine.SetThresholds(kAdmin, thresholds), std::invalid_argument);
    EXPECT_EQ(engine.GetThresholds().large_transfer_cutoff, 1000u);

    thresholds.contract_interaction_ratio_cutoff_pct = 70;
    thresholds.unusual_hour_start = 7;
    thresholds.unusual_hour_window = 6;
    EXPECT_THROW(engine.SetThresholds(kAdmin, thresholds), std::invalid_argument);

    thresholds.unusual_hour_window = 25;
    EXPECT_THROW(engine.SetThresholds(kAdmin, thresholds), std::invalid_argument);
    EXPECT_EQ(engine.GetThresholds().large_transfer_cutoff, 1000u);

    AiBlendConfig ai;
    ai.enabled = true;
    ai.ai_weight_pct = 150;
    EXPECT_THROW(engine.SetAiConfig(kAdmin, ai), std::invalid_argument);
    ai.ai_weight_pct = 30;
    ai.confidence_floor_pct = 101;
    EXPECT_THROW(engine.SetAiConfig(kAdmin, ai), std::invalid_argument);
    EXPECT_FALSE(engine.GetAiConfig().enabled);

    thresholds.unusual_hour_start = 1;
    thresholds.unusual_hour_window = 4;
    engine.SetThresholds(kAdmin, thresholds);
    EXPECT_EQ(engine.GetThresholds().large_transfer_cutoff, 5u);
    EXPECT_EQ(engine.GetThresholds().unusual_hour_start, 1u);
}

UTEST(RiskEngine, PartialConfigUpdates) {
    RiskEngine engine(MakeSettings());
    RiskThresholds custom;
    custom.new_address_window_ms = 60'000;
    engine.SetThresholds(kAdmin, custom);

    engine.UpdateThresholds(kAdmin, [](RiskThresholds& thresholds) { thresholds.large_transfer_cutoff = 5000; });
    EXPECT_EQ(engine.GetThresholds().large_transfer_cutoff, 5000u);
    EXPECT_EQ(engine.GetThresholds().new_address_window_ms, 60'000u);

    EXPECT_THROW(engine.UpdateThresholds(kAdmin, [](RiskThresholds& thresholds) {
                     thresholds.large_transfer_cutoff = 1;
                     thresholds.contract_interaction_ratio_cutoff_pct = 101;
                 }),
                 std::invalid_argument);
    EXPECT_EQ(engine.GetThresholds().large_transfer_cutoff, 5000u);
    EXPECT_EQ(engine.GetThresholds().contract_interaction_ratio_cutoff_pct, 70u);

    bool touched = false;
    EXPECT_THROW(engine.UpdateThresholds("0xmallory", [&touched](RiskThresholds&) { touched = true; }),
                 AuthorizationError);
    EXPECT_FALSE(touched);

    engine.UpdateAiConfig(kAdmin, [](AiBlendConfig& config) { config.max_wait_ms = 250; });
    EXPECT_FALSE(engine.GetAiConfig().enabled);
    EXPECT_EQ(engine.GetAiConfig().max_wait_ms, 250u);
    EXPECT_THROW(engine.UpdateAiConfig(kAdmin, [](AiBlendConfig& config) {
                     config.enabled = true;
                     config.ai_weight_pct = 101;
                 }),
                 std::invalid_argument);
    EXPECT_FALSE(engine.GetAiConfig().enabled);
    EXPECT_EQ(engine.GetAiConfig().ai_weight_pct, 30u);
}

UTEST(RiskEngine, InvalidInitialSettingsThrow) {
    auto settings = MakeSettings();
    settings.ai_config.ai_weight_pct = 101;
    EXPECT_THROW(RiskEngine{settings}, std::invalid_argument);
}

UTEST(RiskEngine, BlacklistedPartyRaisesAlert) {
    RiskEngine engine(MakeSettings());
    engine.AddToBlacklist(kAdmin, {"0xscammer"});
    EXPECT_TRUE(engine.IsBlacklisted("0xscammer"));

    const auto high = engine.RecordAndScore(MakeTransfer("t1", "0xuser", "0xscammer", 10));
    EXPECT_EQ(high.recipient_score, 90);
    ASSERT_TRUE(high.alert.has_value());
    EXPECT_EQ(high.alert->severity, Severity::kHigh);
    EXPECT_EQ(high.alert->alert_kind, AlertKind::kWarning);
    EXPECT_EQ(high.alert->risk_score, 90);

    const auto critical = engine.RecordAndScore(MakeTransfer("t2", "0xuser", "0xscammer", 5000, kBase + 600'000));
    EXPECT_EQ(critical.recipient_score, 100);
    ASSERT_TRUE(critical.alert.has_value());
    EXPECT_EQ(critical.alert->severity, Severity::kCritical);
    EXPECT_EQ(critical.alert->alert_kind, AlertKind::kSecurity);

    const auto events = engine.DrainEvents();
    EXPECT_EQ(CountEvents<Alert>(events), 2u);
    EXPECT_EQ(CountEvents<TransactionAnalysis>(events), 2u);

    const auto info = engine.GetWalletRiskInfo("0xscammer");
    EXPECT_TRUE(info.is_blacklisted);
    EXPECT_EQ(info.risk_score, 100);
    EXPECT_EQ(info.risk_level, Severity::kCritical);
    EXPECT_EQ(info.transaction_count, 2u);
}

UTEST(RiskEngine, WhitelistHalvesBlacklistPenalty) {
    RiskEngine engine(MakeSettings());
    engine.AddToBlacklist(kAdmin, {"0xdisputed"});
    engine.AddToWhitelist(kAdmin, {"0xdisputed"});

    const auto result = engine.RecordAndScore(MakeTransfer("t1", "0xdisputed", "0xrecipient", 10));
    EXPECT_EQ(result.sender_score, 45);
    EXPECT_FALSE(result.alert.has_value());
}

UTEST(RiskEngine, FailuresAccumulateIntoScore) {
    RiskEngine engine(MakeSettings());

    engine.RecordAndScore(MakeTransfer("t1", "0xsender", "0xrecipient", 10));
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(engine.RecordFailure("0xsender"));
    }
    EXPECT_EQ(engine.FindRecord("0xsender")->failed_transaction_count, 4u);

    const auto result = engine.RecordAndScore(MakeTransfer("t2", "0xsender", "0xrecipient", 10, kBase + 3'600'000));
    EXPECT_EQ(result.sender_score, 15);
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings.front().pattern_kind, PatternKind::kFailedSpike);
}

UTEST(RiskEngine, FailuresBeforeFirstTransactionCount) {
    RiskEngine engine(MakeSettings());
    for (int i = 0; i < 4; ++i) {
        EXPECT_TRUE(engine.RecordFailure("0xfresh"));
    }
    EXPECT_EQ(engine.GetTransactionCount("0xfresh"), 0u);
    EXPECT_EQ(engine.FindRecord("0xfresh")->failed_transaction_count, 4u);
    EXPECT_EQ(engine.PendingEventCount(), 0u);

    const auto result = engine.RecordAndScore(MakeTransfer("t1", "0xfresh", "0xrecipient", 10));
    EXPECT_EQ(result.sender_score, 15);
    EXPECT_EQ(engine.GetTransactionCount("0xfresh"), 1u);
    ASSERT_EQ(result.findings.size(), 1u);
    EXPECT_EQ(result.findings.front().pattern_kind, PatternKind::kFailedSpike);
    EXPECT_EQ(result.findings.front().address, "0xfresh");

    EXPECT_THROW(engine.RecordFailure(""), std::invalid_argument);
}

UTEST(RiskEngine, UnknownAddressDefaults) {
    const RiskEngine engine(MakeSettings());

    EXPECT_EQ(engine.GetRiskScore("0xnobody"), 0);
    EXPECT_EQ(engine.GetTransactionCount("0xnobody"), 0u);
    EXPECT_FALSE(engine.IsBlacklisted("0xnobody"));
    EXPECT_FALSE(engine.IsWhitelisted("0xnobody"));
    EXPECT_FALSE(engine.FindRecord("0xnobody").has_value());

    const auto info = engine.GetWalletRiskInfo("0xnobody");
    EXPECT_EQ(info.address, "0xnobody");
    EXPECT_EQ(info.risk_score, 0);
    EXPECT_EQ(info.risk_level, Severity::kLow);
    EXPECT_FALSE(info.is_watching);

    EXPECT_EQ(engine.GetAdmin(), kAdmin);
}

UTEST(RiskEngine, EmptyPartyIsRejected) {
    RiskEngine engine(MakeSettings());
    EXPECT_THROW(engine.RecordAndScore(MakeTransfer("t1", "", "0xrecipient", 1)), std::invalid_argument);
    EXPECT_THROW(engine.RecordAndScore(MakeTransfer("t1", "0xsender", "", 1)), std::invalid_argument);
    EXPECT_FALSE(engine.FindRecord("0xrecipient").has_value());
}

UTEST(RiskEngine, WatchedWalletsEmitUpdates) {
    RiskEngine engine(MakeSettings());

    const auto started = engine.StartWalletMonitoring("0xwatched", kBase);
    EXPECT_TRUE(started.is_watching);
    EXPECT_TRUE(engine.IsWatching("0xwatched"));
    EXPECT_TRUE(engine.GetWalletRiskInfo("0xwatched").is_watching);

    const auto result = engine.RecordAndScore(MakeTransfer("t1", "0xother", "0xwatched", 2000, kBase + 1));
    ASSERT_EQ(result.monitoring_updates.size(), 1u);
    EXPECT_EQ(result.monitoring_updates.front().wallet_address, "0xwatched");
    EXPECT_EQ(result.monitoring_updates.front().current_risk_score, 25);
    EXPECT_EQ(result.monitoring_updates.front().last_update, kBase + 1);

    const auto self = engine.RecordAndScore(MakeTransfer("t2", "0xwatched", "0xwatched", 1, kBase + 2));
    EXPECT_EQ(self.monitoring_updates.size(), 1u);

    const auto stopped = engine.StopWalletMonitoring("0xwatched", kBase + 3);
    EXPECT_FALSE(stopped.is_watching);
    EXPECT_FALSE(engine.IsWatching("0xwatched"));
    EXPECT_TRUE(engine.RecordAndScore(MakeTransfer("t3", "0xother", "0xwatched", 1, kBase + 4))
                    .monitoring_updates.empty());

    EXPECT_EQ(CountEvents<WalletMonitoringUpdate>(engine.DrainEvents()), 4u);
    EXPECT_THROW(engine.StartWalletMonitoring("", kBase), std::invalid_argument);
}

UTEST(RiskEngine, AnalyzeHistoryDoesNotTouchStore) {
    RiskEngine engine(MakeSettings());
    const std::vector<ObservedTransaction> batch{
        {"big", 20'000, kBase, TransactionCategory::kSend},
        {"small", 3, kBase + 1, TransactionCategory::kSend},
    };

    const auto findings = engine.AnalyzeHistory("0xwallet", batch, kBase + 10);
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings.front().pattern_kind, PatternKind::kLargeTransfer);
    EXPECT_EQ(findings.front().severity, Severity::kCritical);
    EXPECT_FALSE(engine.FindRecord("0xwallet").has_value());
    EXPECT_EQ(CountEvents<PatternFinding>(engine.DrainEvents()), 1u);
}

UTEST(RiskEngine, EventQueueDropsOldest) {
    auto settings = MakeSettings();
    settings.max_pending_events = 2;
    RiskEngine engine(settings);

    for (int i = 0; i < 5; ++i) {
        const auto n = std::to_string(i);
        engine.RecordAndScore(MakeTransfer("t" + n, "0xa" + n, "0xb" + n, 1));
    }
    const auto events = engine.DrainEvents();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(std::get<TransactionAnalysis>(events.back()).transaction_ref, "t4");
}

UTEST(RiskEngine, AiBlendWhenConfident) {
    auto settings = MakeSettings();
    settings.ai_config.enabled = true;
    RiskEngine engine(settings, std::make_shared<FixedOracle>(AiAssessment{80, 70}));

    const auto result = engine.RecordAndScore(MakeTransfer("t1", "0xsender", "0xrecipient", 2000));
    EXPECT_EQ(result.ai_status, AiStatus::kBlended);
    EXPECT_EQ(result.sender_score, 42);
    EXPECT_EQ(result.recipient_score, 42);
    EXPECT_EQ(engine.GetRiskScore("0xsender"), 42);
    EXPECT_EQ(result.analysis.ai_status, AiStatus::kBlended);
}

UTEST(RiskEngine, AiBelowConfidenceFloorIsIgnored) {
    auto settings = MakeSettings();
    settings.ai_config.enabled = true;
    RiskEngine engine(settings, std::make_shared<FixedOracle>(AiAssessment{80, 69}));

    const auto result = engine.RecordAndScore(MakeTransfer("t1", "0xsender", "0xrecipient", 2000));
    EXPECT_EQ(result.ai_status, AiStatus::kLowConfidence);
    EXPECT_EQ(result.sender_score, 25);
}

UTEST(RiskEngine, AiTimeoutFallsBack) {
    auto settings = MakeSettings();
    settings.ai_config.enabled = true;
    settings.ai_config.max_wait_ms = 20;
    RiskEngine engine(settings, std::make_shared<FixedOracle>(AiAssessment{100, 100}, std::chrono::seconds{10}));

    const auto result = engine.RecordAndScore(MakeTransfer("t1", "0xsender", "0xrecipient", 2000));
    EXPECT_EQ(result.ai_status, AiStatus::kFallback);
    EXPECT_EQ(result.sender_score, 25);
    EXPECT_FALSE(result.alert.has_value());
}

UTEST(RiskEngine, AiCanBeEnabledAtRuntime) {
    RiskEngine engine(MakeSettings(), std::make_shared<FixedOracle>(AiAssessment{100, 100}));
    EXPECT_EQ(engine.RecordAndScore(MakeTransfer("t1", "0xa", "0xb", 10)).ai_status, AiStatus::kNotRequested);

    AiBlendConfig ai;
    ai.enabled = true;
    ai.ai_weight_pct = 100;
    engine.SetAiConfig(kAdmin, ai);

    const auto result = engine.RecordAndScore(MakeTransfer("t2", "0xa", "0xb", 10, kBase + 600'000));
    EXPECT_EQ(result.sender_score, 100);
    ASSERT_TRUE(result.alert.has_value());
    EXPECT_EQ(result.alert->severity, Severity::kCritical);
}

UTEST(RiskEngine, SlowOlderScoreDoesNotReplaceNewerOne) {
    auto settings = MakeSettings();
    settings.ai_config.enabled = true;
    settings.ai_config.max_wait_ms = 2000;
    RiskEngine engine(settings, std::make_shared<PerTransactionOracle>());

    auto slow = userver::utils::Async("slow-transfer", [&engine] {
        return engine.RecordAndScore(MakeTransfer("slow", "0xsender", "0xfirst", 1, kBase));
    });
    userver::engine::SleepFor(std::chrono::milliseconds{50});

    const auto fast = engine.RecordAndScore(MakeTransfer("fast", "0xsender", "0xsecond", 1, kBase + 1));
    EXPECT_EQ(fast.sender_score, 0);
    EXPECT_EQ(engine.GetRiskScore("0xsender"), 0);

    const auto slow_result = slow.Get();
    EXPECT_EQ(slow_result.ai_status, AiStatus::kBlended);
    EXPECT_EQ(slow_result.sender_score, 30);
    EXPECT_EQ(engine.GetRiskScore("0xsender"), 0);
    EXPECT_EQ(engine.GetRiskScore("0xfirst"), 30);
    EXPECT_EQ(engine.GetTransactionCount("0xsender"), 2u);
}

UTEST_MT(RiskEngine, ConcurrentTransfersKeepCountsExact, 4) {
    RiskEngine engine(MakeSettings());
    constexpr int kTasks = 4;
    constexpr int kPerTask = 50;

    std::vector<userver::engine::TaskWithResult<void>> tasks;
    for (int t = 0; t < kTasks; ++t) {
        tasks.push_back(userver::utils::Async("transfer", [&engine, t] {
            for (int i = 0; i < kPerTask; ++i) {
                engine.RecordAndScore(MakeTransfer(
                    std::to_string(t) + "-" + std::to_string(i), "0xhot", "0xcold" + std::to_string(t), 1,
                    kBase + i));
            }
        }));
    }
    for (auto& task : tasks) {
        task.Get();
    }

    EXPECT_EQ(engine.GetTransactionCount("0xhot"), static_cast<uint64_t>(kTasks * kPerTask));
    EXPECT_LE(engine.GetRiskScore("0xhot"), kMaxRiskScore);
}

}  // namespace wallet_risk
