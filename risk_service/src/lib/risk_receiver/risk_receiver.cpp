#include "risk_receiver.hpp"

// libstd
#include <stdexcept>
#include <vector>

// userver
#include <userver/components/component_context.hpp>
#include <userver/logging/log.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

// protobuf
#include <google/protobuf/empty.pb.h>
#include <grpcpp/support/status.h>

// utils
#include <fmt/format.h>

// self
#include "proto_conversions/proto_conversions.hpp"

namespace wallet_risk {

namespace {

// Must be called from a catch block.
grpc::Status CurrentExceptionToStatus(std::string_view method) {
    try {
        throw;
    } catch (const AuthorizationError& e) {
        LOG_WARNING() << fmt::format("{}: permission denied: {}", method, e.what());
        return grpc::Status(grpc::StatusCode::PERMISSION_DENIED, e.what());
    } catch (const std::invalid_argument& e) {
        LOG_WARNING() << fmt::format("{}: invalid argument: {}", method, e.what());
        return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR() << fmt::format("{}: {}", method, e.what());
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

std::vector<Address> ToAddresses(const risk::AddressListRequest& request) {
    return std::vector<Address>(request.addresses().begin(), request.addresses().end());
}

} // namespace


RiskReceiver::RiskReceiver(RiskProcessor& processor)
    : _processor(processor) {  }

RiskReceiver::AnalyzeTransactionResult RiskReceiver::AnalyzeTransaction(
  CallContext&,
  wallet::Transaction&& request) {
    LOG_INFO() << fmt::format("receive new transaction, id: {}", request.transaction_id());
    try {
        return proto::ToProto(_processor.ProcessTransaction(request));
    } catch (const std::exception&) {
        return CurrentExceptionToStatus("AnalyzeTransaction");
    }
}

RiskReceiver::RecordFailedTransactionResult RiskReceiver::RecordFailedTransaction(
  CallContext&,
  risk::FailureReport&& request) {
    LOG_INFO() << fmt::format("failed transaction {} reported for {}", request.transaction_id(), request.address());
    try {
        if (!_processor.RecordFailure(request.address())) {
            LOG_INFO() << fmt::format("monitoring disabled, failure of {} not recorded", request.transaction_id());
        }
        return google::protobuf::Empty{};
    } catch (const std::exception&) {
        return CurrentExceptionToStatus("RecordFailedTransaction");
    }
}

RiskReceiver::GetWalletRiskInfoResult RiskReceiver::GetWalletRiskInfo(
  CallContext&,
  risk::AddressQuery&& request) {
    try {
        return proto::ToProto(_processor.GetEngine().GetWalletRiskInfo(request.address()));
    } catch (const std::exception&) {
        return CurrentExceptionToStatus("GetWalletRiskInfo");
    }
}

RiskReceiver::GetDetectorStatusResult RiskReceiver::GetDetectorStatus(
  CallContext&,
  google::protobuf::Empty&&) {
    const auto& engine = _processor.GetEngine();
    risk::DetectorStatus status;
    status.set_admin(engine.GetAdmin());
    status.set_monitoring_enabled(engine.IsMonitoringEnabled());
    *status.mutable_thresholds() = proto::ToProto(engine.GetThresholds());
    *status.mutable_ai_config() = proto::ToProto(engine.GetAiConfig());
    return status;
}

RiskReceiver::AnalyzeHistoryResult RiskReceiver::AnalyzeHistory(
  CallContext&,
  risk::HistoryAnalysisRequest&& request) {
    LOG_INFO() << fmt::format("history analysis for {} over {} transactions",
                              request.address(), request.transactions_size());
    try {
        risk::HistoryAnalysisResponse response;
        for (const auto& finding : _processor.AnalyzeHistory(request)) {
            *response.add_patterns() = proto::ToProto(finding);
        }
        return response;
    } catch (const std::exception&) {
        return CurrentExceptionToStatus("AnalyzeHistory");
    }
}

RiskReceiver::ListTransactionsResult RiskReceiver::ListTransactions(
  CallContext&,
  risk::ListTransactionsRequest&& request) {
    risk::TransactionList response;
    for (auto& tx : _processor.ListTransactions(request.address(), request.limit())) {
        *response.add_transactions() = std::move(tx);
    }
    return response;
}

RiskReceiver::StartWalletMonitoringResult RiskReceiver::StartWalletMonitoring(
  CallContext&,
  risk::AddressQuery&& request) {
    try {
        _processor.StartWalletMonitoring(request.address());
        return google::protobuf::Empty{};
    } catch (const std::exception&) {
        return CurrentExceptionToStatus("StartWalletMonitoring");
    }
}

RiskReceiver::StopWalletMonitoringResult RiskReceiver::StopWalletMonitoring(
  CallContext&,
  risk::AddressQuery&& request) {
    try {
        _processor.StopWalletMonitoring(request.address());
        return google::protobuf::Empty{};
    } catch (const std::exception&) {
        return CurrentExceptionToStatus("StopWalletMonitoring");
    }
}

RiskReceiver::UpdateRiskThresholdsResult RiskReceiver::UpdateRiskThresholds(
  CallContext&,
  risk::SetThresholdsRequest&& request) {
    try {
        const auto& update = request.thresholds();
        _processor.GetEngine().UpdateThresholds(request.caller(), [&update](RiskThresholds& thresholds) {
            proto::MergeFromProto(update, thresholds);
        });
        return google::protobuf::Empty{};
    } catch (const std::exception&) {
        return CurrentExceptionToStatus("UpdateRiskThresholds");
    }
}

RiskReceiver::AddScammerAddressesResult RiskReceiver::AddScammerAddresses(
  CallContext&,
  risk::AddressListRequest&& request) {
    try {
        _processor.GetEngine().AddToBlacklist(request.caller(), ToAddresses(request));
        return google::protobuf::Empty{};
    } catch (const std::exception&) {
        return CurrentExceptionToStatus("AddScammerAddresses");
    }
}

RiskReceiver::AddWhitelistedAddressesResult RiskReceiver::AddWhitelistedAddresses(
  CallContext&,
  risk::AddressListRequest&& request) {
    try {
        _processor.GetEngine().AddToWhitelist(request.caller(), ToAddresses(request));
        return google::protobuf::Empty{};
    } catch (const std::exception&) {
        return CurrentExceptionToStatus("AddWhitelistedAddresses");
    }
}

RiskReceiver::UpdateAiConfigResult RiskReceiver::UpdateAiConfig(
  CallContext&,
  risk::SetAiConfigRequest&& request) {
    try {
        const auto& update = request.config();
        _processor.GetEngine().UpdateAiConfig(request.caller(), [&update](AiBlendConfig& config) {
            proto::MergeFromProto(update, config);
        });
        return google::protobuf::Empty{};
    } catch (const std::exception&) {
        return CurrentExceptionToStatus("UpdateAiConfig");
    }
}

RiskReceiver::SetMonitoringEnabledResult RiskReceiver::SetMonitoringEnabled(
  CallContext&,
  risk::SetMonitoringRequest&& request) {
    try {
        _processor.GetEngine().SetMonitoringEnabled(request.caller(), request.enabled());
        return google::protobuf::Empty{};
    } catch (const std::exception&) {
        return CurrentExceptionToStatus("SetMonitoringEnabled");
    }
}


RiskReceiverComponent::RiskReceiverComponent(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context
)
  : userver::ugrpc::server::ServiceComponentBase(config, context),
  _service(context.FindComponent<RiskProcessor>(RiskProcessor::kName)) {
    RegisterService(_service);
}

userver::yaml_config::Schema RiskReceiverComponent::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::ugrpc::server::ServiceComponentBase>(R"(
type: object
description: gRPC wallet risk service component
additionalProperties: false
properties: {}
)");
}


} // namespace wallet_risk
