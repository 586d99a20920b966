// userver
#include <userver/clients/dns/component.hpp>
#include <userver/components/minimal_server_component_list.hpp>
#include <userver/kafka/producer_component.hpp>
#include <userver/storages/postgres/component.hpp>
#include <userver/storages/secdist/component.hpp>
#include <userver/storages/secdist/provider_component.hpp>
#include <userver/testsuite/testsuite_support.hpp>
#include <userver/ugrpc/server/component_list.hpp>
#include <userver/utils/daemon_run.hpp>

// self
#include "risk_processor/risk_processor.hpp"
#include "risk_receiver/risk_receiver.hpp"

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    const auto component_list = userver::components::MinimalServerComponentList()
        .AppendComponentList(userver::ugrpc::server::MinimalComponentList())
        .Append<userver::clients::dns::Component>()
        .Append<userver::components::Secdist>()
        .Append<userver::components::DefaultSecdistProvider>()
        .Append<userver::components::TestsuiteSupport>()
        .Append<userver::components::Postgres>("postgres-db-1")
        .Append<userver::kafka::ProducerComponent>("kafka-producer")
        .Append<wallet_risk::RiskProcessor>()
        .Append<wallet_risk::RiskReceiverComponent>()
    ;

    return userver::utils::DaemonMain(argc, argv, component_list);
}
