#pragma once

#include <string>
#include <vector>

#include <userver/kafka/producer_component.hpp>

#include <risk/events.pb.h>

#include "risk_types/risk_types.hpp"

namespace wallet_risk {

// Publishes engine events to Kafka as JSON with proto field names preserved.
class KafkaEventPublisher {
public:
    KafkaEventPublisher(userver::kafka::ProducerComponent& producer, std::string topic);

    // Send failures are logged; the remaining events are still attempted.
    void Publish(const std::vector<RiskEvent>& events);

    void Publish(const risk::RiskEvent& event);

    // Message key used for partitioning: the address or transaction the event is about.
    static std::string KeyFor(const risk::RiskEvent& event);

private:
    userver::kafka::ProducerComponent& producer_;
    const std::string topic_;
};

}  // namespace wallet_risk
