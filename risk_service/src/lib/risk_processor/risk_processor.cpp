#include "risk_processor.hpp"

#include <chrono>

#include <userver/logging/log.hpp>
#include <userver/storages/postgres/component.hpp>
#include <userver/utils/datetime.hpp>
#include <userver/yaml_config/merge_schemas.hpp>

#include "proto_conversions/proto_conversions.hpp"

namespace wallet_risk {

namespace {

TimestampMs NowMs() {
    return static_cast<TimestampMs>(std::chrono::duration_cast<std::chrono::milliseconds>(
        userver::utils::datetime::Now().time_since_epoch()).count());
}

}  // namespace

RiskProcessor::RiskProcessor(
    const userver::components::ComponentConfig& config,
    const userver::components::ComponentContext& context)
    : LoggableComponentBase(config, context),
      producer_(context.FindComponent<userver::kafka::ProducerComponent>("kafka-producer")),
      events_topic_(config["events_topic"].As<std::string>("RiskEvents")) {
    engine_ = std::make_unique<RiskEngine>(ParseEngineSettings(config), LoadOracle(config));

    if (config["archive_enabled"].As<bool>(false)) {
        try {
            auto& pg_component = context.FindComponent<userver::components::Postgres>("postgres-db-1");
            auto pg_cluster = pg_component.GetCluster();

            LOG_INFO() << "Pinging PostgreSQL cluster";
            auto ping = pg_cluster->Execute(userver::storages::postgres::ClusterHostType::kMaster, "SELECT 1");
            if (ping.IsEmpty()) {
                LOG_WARNING() << "PostgreSQL ping returned empty result";
            }

            archive_ = std::make_shared<TransactionArchive>(pg_cluster);
            LOG_INFO() << "TransactionArchive initialized with PostgreSQL";
        } catch (const std::exception& e) {
            LOG_WARNING() << "PostgreSQL not available, TransactionArchive disabled: " << e.what();
            archive_ = nullptr;
        }
    }

    event_publisher_ = std::make_unique<KafkaEventPublisher>(producer_, events_topic_);

    LOG_INFO() << "RiskProcessor initialized. Publishing events to topic: " << events_topic_;
}

RiskProcessor::~RiskProcessor() {
    LOG_INFO() << "RiskProcessor shutting down";
}

EngineSettings RiskProcessor::ParseEngineSettings(const userver::components::ComponentConfig& config) {
    EngineSettings settings;
    settings.admin = config["admin"].As<std::string>("");
    settings.monitoring_enabled = config["monitoring_enabled"].As<bool>(true);
    settings.shard_count = config["shard_count"].As<size_t>(TransactionHistoryStore::kDefaultShardCount);
    settings.window_capacity = config["window_capacity"].As<size_t>(TransactionHistoryStore::kDefaultWindowCapacity);
    settings.max_pending_events = config["max_pending_events"].As<size_t>(settings.max_pending_events);

    const auto thresholds = config["thresholds"];
    auto& t = settings.thresholds;
    t.rapid_transaction_window_ms = thresholds["rapid_transaction_window_ms"].As<uint64_t>(t.rapid_transaction_window_ms);
    t.large_transfer_cutoff = thresholds["large_transfer_cutoff"].As<uint64_t>(t.large_transfer_cutoff);
    t.failed_transaction_cutoff = thresholds["failed_transaction_cutoff"].As<uint64_t>(t.failed_transaction_cutoff);
    t.contract_interaction_ratio_cutoff_pct =
        thresholds["contract_interaction_ratio_cutoff_pct"].As<uint32_t>(t.contract_interaction_ratio_cutoff_pct);
    t.round_amount_cluster_cutoff = thresholds["round_amount_cluster_cutoff"].As<uint64_t>(t.round_amount_cluster_cutoff);
    t.unusual_hour_start = thresholds["unusual_hour_start"].As<uint32_t>(t.unusual_hour_start);
    t.unusual_hour_window = thresholds["unusual_hour_window"].As<uint32_t>(t.unusual_hour_window);
    t.new_address_window_ms = thresholds["new_address_window_ms"].As<uint64_t>(t.new_address_window_ms);

    const auto ai = config["ai"];
    auto& a = settings.ai_config;
    a.enabled = ai["enabled"].As<bool>(a.enabled);
    a.ai_weight_pct = ai["ai_weight_pct"].As<uint32_t>(a.ai_weight_pct);
    a.confidence_floor_pct = ai["confidence_floor_pct"].As<uint32_t>(a.confidence_floor_pct);
    a.max_wait_ms = ai["max_wait_ms"].As<uint64_t>(a.max_wait_ms);
    a.fallback_on_failure = ai["fallback_on_failure"].As<bool>(a.fallback_on_failure);

    return settings;
}

std::shared_ptr<RiskOracle> RiskProcessor::LoadOracle(const userver::components::ComponentConfig& config) const {
    const auto uuid = config["ml_model_uuid"].As<std::string>("");
    if (uuid.empty()) {
        LOG_INFO() << "No ML model configured, AI blend runs without an oracle";
        return nullptr;
    }
    const auto model_config_dir = config["ml_model_config_dir"].As<std::string>("model_configs");

    auto oracle = std::make_shared<MlRiskOracle>();
    if (!oracle->LoadModelByUuid(model_config_dir, uuid)) {
        LOG_WARNING() << "Model config not found for uuid " << uuid << ", AI blend runs without an oracle";
        return nullptr;
    }
    return oracle;
}

AnalysisResult RiskProcessor::ProcessTransaction(const wallet::Transaction& tx) {
    LOG_INFO() << "Processing transaction: " << tx.transaction_id();

    auto result = engine_->RecordAndScore(proto::ToTransfer(tx, NowMs()));
    if (result.monitoring_enabled && archive_) {
        archive_->SaveTransaction(tx);
    }
    FlushEvents();
    return result;
}

bool RiskProcessor::RecordFailure(const std::string& address) {
    return engine_->RecordFailure(address);
}

std::vector<PatternFinding> RiskProcessor::AnalyzeHistory(const risk::HistoryAnalysisRequest& request) {
    std::vector<ObservedTransaction> transactions;
    transactions.reserve(request.transactions_size());
    for (const auto& tx : request.transactions()) {
        transactions.push_back(proto::ToObserved(tx));
    }
    auto findings = engine_->AnalyzeHistory(request.address(), transactions, NowMs());
    FlushEvents();
    return findings;
}

std::vector<wallet::Transaction> RiskProcessor::ListTransactions(const std::string& address, int limit) const {
    if (!archive_) {
        LOG_WARNING() << "Transaction archive disabled, no history for " << address;
        return {};
    }
    return archive_->GetAddressHistory(address, limit);
}

void RiskProcessor::StartWalletMonitoring(const std::string& address) {
    engine_->StartWalletMonitoring(address, NowMs());
    FlushEvents();
}

void RiskProcessor::StopWalletMonitoring(const std::string& address) {
    engine_->StopWalletMonitoring(address, NowMs());
    FlushEvents();
}

void RiskProcessor::FlushEvents() {
    const auto events = engine_->DrainEvents();
    if (!events.empty()) {
        event_publisher_->Publish(events);
    }
}

userver::yaml_config::Schema RiskProcessor::GetStaticConfigSchema() {
    return userver::yaml_config::MergeSchemas<userver::components::LoggableComponentBase>(R"(
type: object
description: Wallet risk engine host component
additionalProperties: false
properties:
    admin:
        type: string
        description: Identity allowed to call administrative operations
        defaultDescription: ''
    monitoring_enabled:
        type: boolean
        description: Initial state of the monitoring circuit breaker
        defaultDescription: true
    events_topic:
        type: string
        description: Kafka topic for outgoing risk events
        defaultDescription: RiskEvents
    archive_enabled:
        type: boolean
        description: Archive observed transactions in PostgreSQL (postgres-db-1)
        defaultDescription: false
    ml_model_config_dir:
        type: string
        description: Directory containing ML model files
        defaultDescription: model_configs
    ml_model_uuid:
        type: string
        description: Model uuid; empty disables the AI oracle
        defaultDescription: ''
    shard_count:
        type: integer
        description: Number of history store shards
        defaultDescription: 16
    window_capacity:
        type: integer
        description: Observed transactions kept per address
        defaultDescription: 100
    max_pending_events:
        type: integer
        description: Outbound event queue capacity
        defaultDescription: 10000
    thresholds:
        type: object
        description: Initial risk thresholds
        additionalProperties: false
        properties:
            rapid_transaction_window_ms:
                type: integer
                description: Gap below which consecutive transactions count as rapid
            large_transfer_cutoff:
                type: integer
                description: Amount above which a transfer is large
            failed_transaction_cutoff:
                type: integer
                description: Failed transactions tolerated per address
            contract_interaction_ratio_cutoff_pct:
                type: integer
                description: Contract interaction percentage tolerated per address
            round_amount_cluster_cutoff:
                type: integer
                description: Round amounts tolerated in the recent window
            unusual_hour_start:
                type: integer
                description: First unusual hour (UTC, inclusive)
            unusual_hour_window:
                type: integer
                description: End of the unusual hours (UTC, exclusive)
            new_address_window_ms:
                type: integer
                description: Age below which an address counts as new
    ai:
        type: object
        description: Initial AI blend configuration
        additionalProperties: false
        properties:
            enabled:
                type: boolean
                description: Blend the oracle score into rule scores
            ai_weight_pct:
                type: integer
                description: Weight of the oracle score in percent
            confidence_floor_pct:
                type: integer
                description: Minimum oracle confidence for blending
            max_wait_ms:
                type: integer
                description: Oracle deadline in milliseconds
            fallback_on_failure:
                type: boolean
                description: Report oracle failures as fallback instead of unavailable
)");
}

}  // namespace wallet_risk
