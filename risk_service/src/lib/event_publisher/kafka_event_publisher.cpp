#include "kafka_event_publisher.hpp"

#include <google/protobuf/util/json_util.h>

#include <userver/kafka/exceptions.hpp>
#include <userver/kafka/producer.hpp>
#include <userver/logging/log.hpp>

#include "proto_conversions/proto_conversions.hpp"

namespace wallet_risk {

KafkaEventPublisher::KafkaEventPublisher(userver::kafka::ProducerComponent& producer, std::string topic)
    : producer_(producer), topic_(std::move(topic)) {}

std::string KafkaEventPublisher::KeyFor(const risk::RiskEvent& event) {
    switch (event.event_case()) {
        case risk::RiskEvent::kAlert: return event.alert().tx_digest();
        case risk::RiskEvent::kPattern: return event.pattern().wallet_address();
        case risk::RiskEvent::kAnalysis: return event.analysis().tx_digest();
        case risk::RiskEvent::kMonitoring: return event.monitoring().wallet_address();
        default: return {};
    }
}

void KafkaEventPublisher::Publish(const std::vector<RiskEvent>& events) {
    for (const auto& event : events) {
        Publish(proto::ToProto(event));
    }
}

void KafkaEventPublisher::Publish(const risk::RiskEvent& event) {
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;

    std::string serialized_event;
    auto status = google::protobuf::util::MessageToJsonString(event, &serialized_event, options);
    if (!status.ok()) {
        LOG_ERROR() << "Failed to serialize RiskEvent to JSON: " << status.message();
        return;
    }

    const auto key = KeyFor(event);
    try {
        producer_.GetProducer().Send(topic_, key, serialized_event);
        LOG_DEBUG() << "Sent event to Kafka topic '" << topic_ << "' with key " << key;
    } catch (const userver::kafka::SendException& e) {
        LOG_ERROR() << "Failed to send event to Kafka topic '" << topic_ << "': " << e.what();
    } catch (const std::exception& e) {
        LOG_ERROR() << "Failed to send event to Kafka: " << e.what();
    }
}

}  // namespace wallet_risk
