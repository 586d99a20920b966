// userver
#include <userver/utils/daemon_run.hpp>

#include <userver/components/minimal_server_component_list.hpp>
#include <userver/kafka/consumer_component.hpp>
#include <userver/storages/secdist/component.hpp>
#include <userver/storages/secdist/provider_component.hpp>


// self
#include "reporter/risk_event_consumer/risk_event_consumer.hpp"

int main(int argc, char* argv[]) {
    const auto component_list = userver::components::MinimalServerComponentList()
        .Append<userver::components::Secdist>()
        .Append<userver::components::DefaultSecdistProvider>()
        .Append<userver::kafka::ConsumerComponent>("kafka-consumer")
        .Append<reporter_service::RiskEventConsumerComponent>()
    ;

    return userver::utils::DaemonMain(argc, argv, component_list);
}
