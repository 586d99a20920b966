#pragma once

#include <memory>
#include <string>
#include <vector>

#include <userver/components/component_config.hpp>
#include <userver/components/component_context.hpp>
#include <userver/components/loggable_component_base.hpp>
#include <userver/kafka/producer_component.hpp>
#include <userver/yaml_config/schema.hpp>

#include <risk/risk.pb.h>
#include <wallet/transaction.pb.h>

#include "event_publisher/kafka_event_publisher.hpp"
#include "ml_model/ml_risk_oracle.hpp"
#include "risk_engine/risk_engine.hpp"
#include "transaction_archive/transaction_archive.hpp"

namespace wallet_risk {

// Hosts the risk engine: archives incoming transactions, runs them through the
// engine and publishes every produced event to Kafka.
class RiskProcessor final : public userver::components::LoggableComponentBase {
public:
    static constexpr std::string_view kName = "risk-processor";

    RiskProcessor(const userver::components::ComponentConfig& config,
                  const userver::components::ComponentContext& context);

    ~RiskProcessor() override;

    RiskProcessor(const RiskProcessor&) = delete;
    RiskProcessor& operator=(const RiskProcessor&) = delete;

    static userver::yaml_config::Schema GetStaticConfigSchema();

    AnalysisResult ProcessTransaction(const wallet::Transaction& tx);

    bool RecordFailure(const std::string& address);

    std::vector<PatternFinding> AnalyzeHistory(const risk::HistoryAnalysisRequest& request);

    std::vector<wallet::Transaction> ListTransactions(const std::string& address, int limit) const;

    void StartWalletMonitoring(const std::string& address);
    void StopWalletMonitoring(const std::string& address);

    RiskEngine& GetEngine() { return *engine_; }

private:
    static EngineSettings ParseEngineSettings(const userver::components::ComponentConfig& config);

    std::shared_ptr<RiskOracle> LoadOracle(const userver::components::ComponentConfig& config) const;

    void FlushEvents();

    userver::kafka::ProducerComponent& producer_;
    std::string events_topic_;

    std::unique_ptr<RiskEngine> engine_;
    std::shared_ptr<TransactionArchive> archive_;
    std::unique_ptr<KafkaEventPublisher> event_publisher_;
};

}  // namespace wallet_risk
