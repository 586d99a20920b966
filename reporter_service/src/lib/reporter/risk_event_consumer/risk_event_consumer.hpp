#pragma once


// cppstd
#include <optional>
#include <string>
#include <string_view>


// userver
#include <userver/components/component_base.hpp>

#include <userver/kafka/consumer_scope.hpp>
#include <userver/kafka/message.hpp>


// models
#include <risk/events.pb.h>


namespace reporter_service {


// Parses a JSON encoded risk::RiskEvent; unknown fields are ignored.
std::optional<risk::RiskEvent> ParseRiskEvent(std::string_view payload);

// One-line human readable summary of an event.
std::string DescribeRiskEvent(const risk::RiskEvent& event);


struct RiskEventConsumer {
    void operator()(userver::kafka::MessageBatchView messages) const;
};

inline constexpr RiskEventConsumer kRiskEventConsumer = {};


class RiskEventConsumerComponent final : public userver::components::ComponentBase {
public:
    static constexpr std::string_view kName = "risk-event-consumer";

    RiskEventConsumerComponent(
        const userver::components::ComponentConfig& config,
        const userver::components::ComponentContext& context
    );

private:
    userver::kafka::ConsumerScope _consumer;
};


} // namespace reporter_service
