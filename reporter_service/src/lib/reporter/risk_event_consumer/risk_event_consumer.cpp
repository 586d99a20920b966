#include "risk_event_consumer.hpp"


// userver
#include <userver/components/component_base.hpp>
#include <userver/components/component_context.hpp>

#include <userver/kafka/consumer_component.hpp>
#include <userver/kafka/consumer_scope.hpp>

#include <userver/logging/log.hpp>


// protobuf
#include <google/protobuf/util/json_util.h>


// utils
#include <fmt/format.h>


namespace reporter_service {


std::optional<risk::RiskEvent> ParseRiskEvent(std::string_view payload) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    risk::RiskEvent event;
    const auto status = google::protobuf::util::JsonStringToMessage(
        std::string(payload), &event, options);
    if (!status.ok() || event.event_case() == risk::RiskEvent::EVENT_NOT_SET) {
        return std::nullopt;
    }
    return event;
}

std::string DescribeRiskEvent(const risk::RiskEvent& event) {
    switch (event.event_case()) {
        case risk::RiskEvent::kAlert: {
            const auto& alert = event.alert();
            return fmt::format("ScamAlert [{}] tx {}: {} -> {}, score {}: {}",
                risk::Severity_Name(alert.severity()), alert.tx_digest(), alert.sender(),
                alert.recipient(), alert.risk_score(), alert.message());
        }
        case risk::RiskEvent::kPattern: {
            const auto& pattern = event.pattern();
            return fmt::format("SuspiciousPattern [{}] {} for {}: {}",
                risk::Severity_Name(pattern.risk_level()), risk::PatternType_Name(pattern.pattern_type()),
                pattern.wallet_address(), pattern.description());
        }
        case risk::RiskEvent::kAnalysis: {
            const auto& analysis = event.analysis();
            return fmt::format("TransactionAnalysis tx {}: {} -> {}, amount {}, final score {}, ai {}",
                analysis.tx_digest(), analysis.sender(), analysis.recipient(), analysis.amount(),
                analysis.final_risk_score(), risk::AiStatus_Name(analysis.ai_status()));
        }
        case risk::RiskEvent::kMonitoring: {
            const auto& update = event.monitoring();
            return fmt::format("WalletMonitoringUpdate {}: watching {}, score {}, {} pattern(s)",
                update.wallet_address(), update.is_watching(), update.current_risk_score(),
                update.patterns_detected_size());
        }
        default:
            return "empty RiskEvent";
    }
}


void RiskEventConsumer::operator()(userver::kafka::MessageBatchView messages) const {
    for (const auto& message : messages) {
        if (!message.GetTimestamp().has_value()) {
            continue;
        }

        const auto event = ParseRiskEvent(message.GetPayload());
        if (!event) {
            LOG_ERROR()
                << fmt::format("RiskEventConsumer: failed to parse RiskEvent from Kafka message, key: {}, topic: {}, partition: {}",
                    message.GetKey(), message.GetTopic(), message.GetPartition());
            continue;
        }

        const auto description = DescribeRiskEvent(*event);
        if (event->has_alert()) {
            LOG_WARNING() << description;
        } else {
            LOG_INFO() << description;
        }
    }
}


RiskEventConsumerComponent::RiskEventConsumerComponent(
        const userver::components::ComponentConfig& config,
        const userver::components::ComponentContext& context
    )
  : userver::components::ComponentBase{config, context},
  _consumer{context.FindComponent<userver::kafka::ConsumerComponent>("kafka-consumer").GetConsumer()} {
        _consumer.Start([this](userver::kafka::MessageBatchView messages) {
            kRiskEventConsumer(messages);
            _consumer.AsyncCommit();
        });
    }


} // namespace reporter_service
