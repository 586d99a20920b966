#include "proto_conversions.hpp"

#include <type_traits>
#include <variant>

namespace wallet_risk::proto {

namespace {

risk::Severity ToProto(Severity severity) {
    return static_cast<risk::Severity>(static_cast<int>(severity));
}

risk::PatternType ToProto(PatternKind kind) {
    return static_cast<risk::PatternType>(static_cast<int>(kind));
}

risk::AlertType ToProto(AlertKind kind) {
    return static_cast<risk::AlertType>(static_cast<int>(kind));
}

risk::RiskFactor ToProto(RiskFactor factor) {
    return static_cast<risk::RiskFactor>(static_cast<int>(factor));
}

risk::AiStatus ToProto(AiStatus status) {
    return static_cast<risk::AiStatus>(static_cast<int>(status));
}

}  // namespace

TransactionCategory FromProto(wallet::Transaction::Category category) {
    switch (category) {
        case wallet::Transaction::RECEIVE: return TransactionCategory::kReceive;
        case wallet::Transaction::CONTRACT: return TransactionCategory::kContract;
        case wallet::Transaction::APPROVAL: return TransactionCategory::kApproval;
        default: return TransactionCategory::kSend;
    }
}

wallet::Transaction::Category ToProto(TransactionCategory category) {
    return static_cast<wallet::Transaction::Category>(static_cast<int>(category));
}

TransactionStatus FromProto(wallet::Transaction::Status status) {
    return status == wallet::Transaction::FAILED ? TransactionStatus::kFailed : TransactionStatus::kSucceeded;
}

Transfer ToTransfer(const wallet::Transaction& tx, TimestampMs now) {
    Transfer transfer;
    transfer.transaction_ref = tx.transaction_id();
    transfer.sender = tx.sender();
    transfer.recipient = tx.recipient();
    transfer.amount = tx.amount();
    transfer.category = FromProto(tx.category());
    transfer.now = tx.timestamp_ms() != 0 ? tx.timestamp_ms() : now;
    return transfer;
}

ObservedTransaction ToObserved(const wallet::Transaction& tx) {
    return ObservedTransaction{
        tx.transaction_id(), tx.amount(), tx.timestamp_ms(), FromProto(tx.category()), FromProto(tx.status())};
}

void MergeFromProto(const risk::RiskThresholds& thresholds, RiskThresholds& target) {
    if (thresholds.has_rapid_transaction_threshold()) {
        target.rapid_transaction_window_ms = thresholds.rapid_transaction_threshold();
    }
    if (thresholds.has_large_transfer_threshold()) {
        target.large_transfer_cutoff = thresholds.large_transfer_threshold();
    }
    if (thresholds.has_failed_transaction_threshold()) {
        target.failed_transaction_cutoff = thresholds.failed_transaction_threshold();
    }
    if (thresholds.has_contract_interaction_threshold()) {
        target.contract_interaction_ratio_cutoff_pct = thresholds.contract_interaction_threshold();
    }
    if (thresholds.has_round_amount_threshold()) {
        target.round_amount_cluster_cutoff = thresholds.round_amount_threshold();
    }
    if (thresholds.has_unusual_time_threshold()) {
        target.unusual_hour_window = thresholds.unusual_time_threshold();
    }
    if (thresholds.has_unusual_time_start()) {
        target.unusual_hour_start = thresholds.unusual_time_start();
    }
    if (thresholds.has_new_address_window()) {
        target.new_address_window_ms = thresholds.new_address_window();
    }
}


risk::RiskThresholds ToProto(const RiskThresholds& thresholds) {
    risk::RiskThresholds result;
    result.set_rapid_transaction_threshold(thresholds.rapid_transaction_window_ms);
    result.set_large_transfer_threshold(thresholds.large_transfer_cutoff);
    result.set_failed_transaction_threshold(thresholds.failed_transaction_cutoff);
    result.set_contract_interaction_threshold(thresholds.contract_interaction_ratio_cutoff_pct);
    result.set_round_amount_threshold(thresholds.round_amount_cluster_cutoff);
    result.set_unusual_time_threshold(thresholds.unusual_hour_window);
    result.set_unusual_time_start(thresholds.unusual_hour_start);
    result.set_new_address_window(thresholds.new_address_window_ms);
    return result;
}

void MergeFromProto(const risk::AiConfig& config, AiBlendConfig& target) {
    if (config.has_enabled()) {
        target.enabled = config.enabled();
    }
    if (config.has_risk_weight()) {
        target.ai_weight_pct = config.risk_weight();
    }
    if (config.has_confidence_threshold()) {
        target.confidence_floor_pct = config.confidence_threshold();
    }
    if (config.has_max_response_time_ms()) {
        target.max_wait_ms = config.max_response_time_ms();
    }
    if (config.has_fallback_to_rule_based()) {
        target.fallback_on_failure = config.fallback_to_rule_based();
    }
}


risk::AiConfig ToProto(const AiBlendConfig& config) {
    risk::AiConfig result;
    result.set_enabled(config.enabled);
    result.set_risk_weight(config.ai_weight_pct);
    result.set_confidence_threshold(config.confidence_floor_pct);
    result.set_max_response_time_ms(config.max_wait_ms);
    result.set_fallback_to_rule_based(config.fallback_on_failure);
    return result;
}

risk::SuspiciousPattern ToProto(const PatternFinding& finding) {
    risk::SuspiciousPattern result;
    result.set_wallet_address(finding.address);
    result.set_pattern_type(ToProto(finding.pattern_kind));
    result.set_risk_level(ToProto(finding.severity));
    result.set_description(finding.description);
    for (const auto& id : finding.evidence_ids) {
        result.add_transaction_ids(id);
    }
    result.set_risk_score(finding.score_contribution);
    result.set_detected_at(finding.detected_at);
    return result;
}

risk::ScamAlert ToProto(const Alert& alert) {
    risk::ScamAlert result;
    result.set_tx_digest(alert.transaction_ref);
    result.set_sender(alert.sender);
    result.set_recipient(alert.recipient);
    result.set_amount(alert.amount);
    result.set_risk_score(alert.risk_score);
    result.set_severity(ToProto(alert.severity));
    result.set_alert_type(ToProto(alert.alert_kind));
    result.set_message(alert.message);
    result.set_timestamp(alert.timestamp);
    return result;
}

risk::TransactionAnalysis ToProto(const TransactionAnalysis& analysis) {
    risk::TransactionAnalysis result;
    result.set_tx_digest(analysis.transaction_ref);
    result.set_sender(analysis.sender);
    result.set_recipient(analysis.recipient);
    result.set_amount(analysis.amount);
    result.set_transaction_type(ToProto(analysis.category));
    for (auto factor : analysis.sender_factors) {
        result.add_sender_risk_factors(ToProto(factor));
    }
    for (auto factor : analysis.recipient_factors) {
        result.add_recipient_risk_factors(ToProto(factor));
    }
    result.set_final_risk_score(analysis.final_risk_score);
    result.set_ai_status(ToProto(analysis.ai_status));
    result.set_timestamp(analysis.timestamp);
    return result;
}

risk::WalletMonitoringUpdate ToProto(const WalletMonitoringUpdate& update) {
    risk::WalletMonitoringUpdate result;
    result.set_wallet_address(update.wallet_address);
    result.set_is_watching(update.is_watching);
    result.set_current_risk_score(update.current_risk_score);
    for (auto kind : update.patterns_detected) {
        result.add_patterns_detected(ToProto(kind));
    }
    result.set_last_update(update.last_update);
    return result;
}

risk::RiskEvent ToProto(const RiskEvent& event) {
    risk::RiskEvent result;
    std::visit([&result](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, Alert>) {
            *result.mutable_alert() = ToProto(payload);
        } else if constexpr (std::is_same_v<T, PatternFinding>) {
            *result.mutable_pattern() = ToProto(payload);
        } else if constexpr (std::is_same_v<T, TransactionAnalysis>) {
            *result.mutable_analysis() = ToProto(payload);
        } else {
            *result.mutable_monitoring() = ToProto(payload);
        }
    }, event);
    return result;
}

risk::WalletRiskInfo ToProto(const WalletRiskInfo& info) {
    risk::WalletRiskInfo result;
    result.set_address(info.address);
    result.set_risk_score(info.risk_score);
    result.set_is_scammer(info.is_blacklisted);
    result.set_is_whitelisted(info.is_whitelisted);
    result.set_transaction_count(info.transaction_count);
    result.set_risk_level(ToProto(info.risk_level));
    result.set_is_watching(info.is_watching);
    return result;
}

risk::AnalysisResponse ToProto(const AnalysisResult& result) {
    risk::AnalysisResponse response;
    response.set_monitoring_enabled(result.monitoring_enabled);
    if (!result.monitoring_enabled) {
        return response;
    }
    response.set_sender_risk_score(result.sender_score);
    response.set_recipient_risk_score(result.recipient_score);
    for (const auto& finding : result.findings) {
        *response.add_patterns() = ToProto(finding);
    }
    if (result.alert) {
        response.set_has_alert(true);
        *response.mutable_alert() = ToProto(*result.alert);
    }
    response.set_ai_status(ToProto(result.ai_status));
    return response;
}

}  // namespace wallet_risk::proto
