#pragma once

#include <risk/events.pb.h>
#include <risk/risk.pb.h>
#include <wallet/transaction.pb.h>

#include "risk_engine/risk_engine.hpp"
#include "risk_types/risk_types.hpp"

namespace wallet_risk::proto {

// Enumerations share their numeric values with the wire format.
TransactionCategory FromProto(wallet::Transaction::Category category);
wallet::Transaction::Category ToProto(TransactionCategory category);
TransactionStatus FromProto(wallet::Transaction::Status status);

// A zero timestamp_ms is replaced with `now`.
Transfer ToTransfer(const wallet::Transaction& tx, TimestampMs now);
ObservedTransaction ToObserved(const wallet::Transaction& tx);

// Fields left unset on the wire keep the target's values.
void MergeFromProto(const risk::RiskThresholds& thresholds, RiskThresholds& target);
risk::RiskThresholds ToProto(const RiskThresholds& thresholds);

void MergeFromProto(const risk::AiConfig& config, AiBlendConfig& target);
risk::AiConfig ToProto(const AiBlendConfig& config);

risk::SuspiciousPattern ToProto(const PatternFinding& finding);
risk::ScamAlert ToProto(const Alert& alert);
risk::TransactionAnalysis ToProto(const TransactionAnalysis& analysis);
risk::WalletMonitoringUpdate ToProto(const WalletMonitoringUpdate& update);
risk::RiskEvent ToProto(const RiskEvent& event);

risk::WalletRiskInfo ToProto(const WalletRiskInfo& info);
risk::AnalysisResponse ToProto(const AnalysisResult& result);

}  // namespace wallet_risk::proto
