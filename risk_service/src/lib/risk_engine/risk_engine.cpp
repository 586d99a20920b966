#include "risk_engine.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

#include <userver/logging/log.hpp>

#include "alert_emitter/alert_emitter.hpp"
#include "risk_scoring/risk_scorer.hpp"

namespace wallet_risk {

namespace {

std::vector<PatternKind> KindsFor(const Address& address, const std::vector<PatternFinding>& findings) {
    std::vector<PatternKind> kinds;
    for (const auto& finding : findings) {
        if (finding.address == address
            && std::find(kinds.begin(), kinds.end(), finding.pattern_kind) == kinds.end()) {
            kinds.push_back(finding.pattern_kind);
        }
    }
    return kinds;
}

}  // namespace

RiskEngine::RiskEngine(EngineSettings settings, std::shared_ptr<RiskOracle> oracle)
    : admin_(std::move(settings.admin))
    , max_pending_events_(settings.max_pending_events)
    , monitoring_enabled_(settings.monitoring_enabled)
    , thresholds_(settings.thresholds)
    , ai_config_(settings.ai_config)
    , history_(settings.shard_count, settings.window_capacity)
    , ai_blend_(std::move(oracle)) {
    settings.thresholds.Validate();
    settings.ai_config.Validate();
    if (admin_.empty()) {
        LOG_WARNING() << "No administrator configured, administrative operations are disabled";
    }
    LOG_INFO() << "Risk engine started (monitoring "
               << (settings.monitoring_enabled ? "enabled" : "disabled")
               << ", AI " << (settings.ai_config.enabled ? "enabled" : "disabled")
               << (ai_blend_.HasOracle() ? "" : ", no oracle") << ")";
}

AnalysisResult RiskEngine::RecordAndScore(const Transfer& transfer) {
    AnalysisResult result;
    if (!monitoring_enabled_.load()) {
        LOG_DEBUG() << "Monitoring disabled, skipping transaction " << transfer.transaction_ref;
        result.monitoring_enabled = false;
        return result;
    }
    if (transfer.sender.empty() || transfer.recipient.empty()) {
        throw std::invalid_argument(fmt::format(
            "Transaction {} must name both sender and recipient", transfer.transaction_ref));
    }

    const auto thresholds = thresholds_.ReadCopy();

    const auto sender_history = history_.Record(
        transfer.sender,
        ObservedTransaction{transfer.transaction_ref, transfer.amount, transfer.now, transfer.category},
        thresholds.rapid_transaction_window_ms);
    const auto recipient_history = history_.Record(
        transfer.recipient,
        ObservedTransaction{transfer.transaction_ref, transfer.amount, transfer.now, TransactionCategory::kReceive},
        thresholds.rapid_transaction_window_ms);

    ScoreBreakdown sender_breakdown;
    ScoreBreakdown recipient_breakdown;
    {
        const auto registry = registry_.Read();
        const RiskScorer scorer(*registry, thresholds);
        sender_breakdown = scorer.Explain(transfer.sender, transfer.amount, &sender_history.record);
        recipient_breakdown = scorer.Explain(transfer.recipient, transfer.amount, &recipient_history.record);
    }

    result.findings = detector_.Detect(transfer.sender, sender_history, thresholds, transfer.now);
    auto recipient_findings = detector_.Detect(transfer.recipient, recipient_history, thresholds, transfer.now);
    std::move(recipient_findings.begin(), recipient_findings.end(), std::back_inserter(result.findings));

    const auto blend = ai_blend_.Blend(
        sender_breakdown.score,
        recipient_breakdown.score,
        OracleRequest{transfer, sender_history.record, recipient_history.record},
        ai_config_.ReadCopy());
    result.sender_score = blend.sender_score;
    result.recipient_score = blend.recipient_score;
    result.ai_status = blend.status;

    history_.UpdateAssessment(
        transfer.sender, sender_history.revision, result.sender_score, KindsFor(transfer.sender, result.findings));
    history_.UpdateAssessment(
        transfer.recipient, recipient_history.revision, result.recipient_score,
        KindsFor(transfer.recipient, result.findings));

    result.alert = MaybeAlert(result.sender_score, result.recipient_score, result.findings, transfer);

    auto& analysis = result.analysis;
    analysis.transaction_ref = transfer.transaction_ref;
    analysis.sender = transfer.sender;
    analysis.recipient = transfer.recipient;
    analysis.amount = transfer.amount;
    analysis.category = transfer.category;
    analysis.sender_factors = std::move(sender_breakdown.factors);
    analysis.recipient_factors = std::move(recipient_breakdown.factors);
    analysis.final_risk_score = std::max(result.sender_score, result.recipient_score);
    analysis.ai_status = result.ai_status;
    analysis.timestamp = transfer.now;

    {
        const auto watched = watched_.Read();
        for (const auto* party : {&transfer.sender, &transfer.recipient}) {
            if (watched->count(*party) == 0) {
                continue;
            }
            if (!result.monitoring_updates.empty() && result.monitoring_updates.front().wallet_address == *party) {
                continue;
            }
            result.monitoring_updates.push_back(MakeMonitoringUpdate(*party, true, transfer.now));
        }
    }

    LOG_INFO() << fmt::format(
        "Transaction {}: sender {} scored {}, recipient {} scored {}, {} finding(s), AI {}",
        transfer.transaction_ref, transfer.sender, result.sender_score, transfer.recipient,
        result.recipient_score, result.findings.size(), ToString(result.ai_status));

    std::vector<RiskEvent> events;
    events.emplace_back(result.analysis);
    for (const auto& finding : result.findings) {
        events.emplace_back(finding);
    }
    if (result.alert) {
        events.emplace_back(*result.alert);
    }
    for (const auto& update : result.monitoring_updates) {
        events.emplace_back(update);
    }
    PushEvents(std::move(events));

    return result;
}

bool RiskEngine::RecordFailure(const Address& address) {
    if (!monitoring_enabled_.load()) {
        LOG_DEBUG() << "Monitoring disabled, ignoring failure for " << address;
        return false;
    }
    if (address.empty()) {
        throw std::invalid_argument("Failure report must name an address");
    }
    const auto failed = history_.RecordFailure(address);
    LOG_DEBUG() << "Failure recorded for " << address << ", total " << failed;
    return true;
}

std::vector<PatternFinding> RiskEngine::AnalyzeHistory(
    const Address& address,
    const std::vector<ObservedTransaction>& transactions,
    TimestampMs now) {
    auto findings = detector_.DetectBatch(address, transactions, thresholds_.ReadCopy(), now);
    LOG_INFO() << "History analysis of " << address << " over " << transactions.size()
               << " transaction(s) raised " << findings.size() << " finding(s)";
    if (monitoring_enabled_.load() && !findings.empty()) {
        PushEvents(std::vector<RiskEvent>(findings.begin(), findings.end()));
    }
    return findings;
}

void RiskEngine::CheckAdmin(const Address& caller) const {
    if (admin_.empty() || caller != admin_) {
        LOG_WARNING() << "Rejected administrative call from " << caller;
        throw AuthorizationError(fmt::format("{} is not the administrator", caller));
    }
}

void RiskEngine::SetThresholds(const Address& caller, const RiskThresholds& thresholds) {
    CheckAdmin(caller);
    thresholds.Validate();
    thresholds_.Assign(thresholds);
    LOG_INFO() << "Risk thresholds updated by " << caller;
}

void RiskEngine::UpdateThresholds(const Address& caller, const std::function<void(RiskThresholds&)>& update) {
    CheckAdmin(caller);
    auto thresholds = thresholds_.StartWrite();
    update(*thresholds);
    // An invalid result is dropped with the uncommitted write.
    thresholds->Validate();
    thresholds.Commit();
    LOG_INFO() << "Risk thresholds updated by " << caller;
}

void RiskEngine::AddToBlacklist(const Address& caller, const std::vector<Address>& addresses) {
    CheckAdmin(caller);
    auto registry = registry_.StartWrite();
    registry->AddToBlacklist(addresses);
    registry.Commit();
    LOG_INFO() << "Added " << addresses.size() << " address(es) to the blacklist";
}

void RiskEngine::AddToWhitelist(const Address& caller, const std::vector<Address>& addresses) {
    CheckAdmin(caller);
    auto registry = registry_.StartWrite();
    registry->AddToWhitelist(addresses);
    registry.Commit();
    LOG_INFO() << "Added " << addresses.size() << " address(es) to the whitelist";
}

void RiskEngine::SetAiConfig(const Address& caller, const AiBlendConfig& config) {
    CheckAdmin(caller);
    config.Validate();
    ai_config_.Assign(config);
    LOG_INFO() << "AI blend config updated by " << caller << " (enabled: " << config.enabled << ")";
}

void RiskEngine::UpdateAiConfig(const Address& caller, const std::function<void(AiBlendConfig&)>& update) {
    CheckAdmin(caller);
    auto config = ai_config_.StartWrite();
    update(*config);
    config->Validate();
    const bool enabled = config->enabled;
    config.Commit();
    LOG_INFO() << "AI blend config updated by " << caller << " (enabled: " << enabled << ")";
}

void RiskEngine::SetMonitoringEnabled(const Address& caller, bool enabled) {
    CheckAdmin(caller);
    monitoring_enabled_.store(enabled);
    LOG_INFO() << "Monitoring " << (enabled ? "enabled" : "disabled") << " by " << caller;
}

uint8_t RiskEngine::GetRiskScore(const Address& address) const {
    const auto record = FindRecord(address);
    return record ? record->risk_score : 0;
}

bool RiskEngine::IsBlacklisted(const Address& address) const {
    return registry_.Read()->IsBlacklisted(address);
}

bool RiskEngine::IsWhitelisted(const Address& address) const {
    return registry_.Read()->IsWhitelisted(address);
}

uint64_t RiskEngine::GetTransactionCount(const Address& address) const {
    const auto record = FindRecord(address);
    return record ? record->transaction_count : 0;
}

RiskThresholds RiskEngine::GetThresholds() const {
    return thresholds_.ReadCopy();
}

AiBlendConfig RiskEngine::GetAiConfig() const {
    return ai_config_.ReadCopy();
}

WalletRiskInfo RiskEngine::GetWalletRiskInfo(const Address& address) const {
    WalletRiskInfo info;
    info.address = address;
    if (const auto record = FindRecord(address)) {
        info.risk_score = record->risk_score;
        info.transaction_count = record->transaction_count;
    }
    {
        const auto registry = registry_.Read();
        info.is_blacklisted = registry->IsBlacklisted(address);
        info.is_whitelisted = registry->IsWhitelisted(address);
    }
    info.risk_level = RiskLevelFromScore(info.risk_score);
    info.is_watching = IsWatching(address);
    return info;
}

std::optional<AddressRecord> RiskEngine::FindRecord(const Address& address) const {
    auto history = history_.Find(address);
    if (!history) {
        return std::nullopt;
    }
    return std::move(history->record);
}

WalletMonitoringUpdate RiskEngine::MakeMonitoringUpdate(
    const Address& address,
    bool is_watching,
    TimestampMs now) const {
    WalletMonitoringUpdate update;
    update.wallet_address = address;
    update.is_watching = is_watching;
    update.last_update = now;
    if (const auto record = FindRecord(address)) {
        update.current_risk_score = record->risk_score;
        update.patterns_detected.assign(
            record->suspicious_pattern_ids.begin(), record->suspicious_pattern_ids.end());
    }
    return update;
}

WalletMonitoringUpdate RiskEngine::StartWalletMonitoring(const Address& address, TimestampMs now) {
    if (address.empty()) {
        throw std::invalid_argument("Cannot watch an empty address");
    }
    {
        auto watched = watched_.StartWrite();
        watched->insert(address);
        watched.Commit();
    }
    LOG_INFO() << "Started monitoring wallet " << address;
    auto update = MakeMonitoringUpdate(address, true, now);
    PushEvents({update});
    return update;
}

WalletMonitoringUpdate RiskEngine::StopWalletMonitoring(const Address& address, TimestampMs now) {
    {
        auto watched = watched_.StartWrite();
        watched->erase(address);
        watched.Commit();
    }
    LOG_INFO() << "Stopped monitoring wallet " << address;
    auto update = MakeMonitoringUpdate(address, false, now);
    PushEvents({update});
    return update;
}

bool RiskEngine::IsWatching(const Address& address) const {
    return watched_.Read()->count(address) > 0;
}

void RiskEngine::PushEvents(std::vector<RiskEvent> events) {
    auto queue = events_.Lock();
    for (auto& event : events) {
        queue->push_back(std::move(event));
    }
    if (queue->size() > max_pending_events_) {
        const auto dropped = queue->size() - max_pending_events_;
        queue->erase(queue->begin(), queue->begin() + static_cast<std::ptrdiff_t>(dropped));
        LOG_WARNING() << "Outbound event queue full, dropped " << dropped << " oldest event(s)";
    }
}

std::vector<RiskEvent> RiskEngine::DrainEvents() {
    auto queue = events_.Lock();
    std::vector<RiskEvent> drained(
        std::make_move_iterator(queue->begin()), std::make_move_iterator(queue->end()));
    queue->clear();
    return drained;
}

size_t RiskEngine::PendingEventCount() const {
    return events_.Lock()->size();
}

}  // namespace wallet_risk
