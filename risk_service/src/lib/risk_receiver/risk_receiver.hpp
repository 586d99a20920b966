#pragma once

// libstd
#include <string>
#include <string_view>

// userver
#include <userver/ugrpc/server/service_component_base.hpp>

// models
#include <risk/risk.pb.h>
#include <risk/risk_service.usrv.pb.hpp>

// self
#include "risk_processor/risk_processor.hpp"


namespace wallet_risk {


class RiskReceiver final : public risk::RiskServiceBase {
public:
    explicit RiskReceiver(RiskProcessor& processor);

    AnalyzeTransactionResult AnalyzeTransaction(CallContext&, wallet::Transaction&& request) override;
    RecordFailedTransactionResult RecordFailedTransaction(CallContext&, risk::FailureReport&& request) override;
    GetWalletRiskInfoResult GetWalletRiskInfo(CallContext&, risk::AddressQuery&& request) override;
    GetDetectorStatusResult GetDetectorStatus(CallContext&, google::protobuf::Empty&& request) override;
    AnalyzeHistoryResult AnalyzeHistory(CallContext&, risk::HistoryAnalysisRequest&& request) override;
    ListTransactionsResult ListTransactions(CallContext&, risk::ListTransactionsRequest&& request) override;
    StartWalletMonitoringResult StartWalletMonitoring(CallContext&, risk::AddressQuery&& request) override;
    StopWalletMonitoringResult StopWalletMonitoring(CallContext&, risk::AddressQuery&& request) override;

    UpdateRiskThresholdsResult UpdateRiskThresholds(CallContext&, risk::SetThresholdsRequest&& request) override;
    AddScammerAddressesResult AddScammerAddresses(CallContext&, risk::AddressListRequest&& request) override;
    AddWhitelistedAddressesResult AddWhitelistedAddresses(CallContext&, risk::AddressListRequest&& request) override;
    UpdateAiConfigResult UpdateAiConfig(CallContext&, risk::SetAiConfigRequest&& request) override;
    SetMonitoringEnabledResult SetMonitoringEnabled(CallContext&, risk::SetMonitoringRequest&& request) override;

    ~RiskReceiver() override = default;

private:
    RiskProcessor& _processor;
};


class RiskReceiverComponent final : public userver::ugrpc::server::ServiceComponentBase {
public:
    static constexpr std::string_view kName = "risk-receiver-service";

    RiskReceiverComponent(
        const userver::components::ComponentConfig& config,
        const userver::components::ComponentContext& context
    );

    static userver::yaml_config::Schema GetStaticConfigSchema();

    ~RiskReceiverComponent() override = default;

private:
    RiskReceiver _service;
};


} // namespace wallet_risk
