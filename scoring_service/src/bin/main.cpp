// userver
#include <userver/components/minimal_server_component_list.hpp>
#include <userver/testsuite/testsuite_support.hpp>
#include <userver/ugrpc/server/component_list.hpp>
#include <userver/utils/daemon_run.hpp>

// self
#include "review_service/review_service.hpp"
#include "scoring_component/scoring_component.hpp"

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    const auto component_list =
        userver::components::MinimalServerComponentList()
            .AppendComponentList(userver::ugrpc::server::MinimalComponentList())
            .Append<userver::components::TestsuiteSupport>()
            .Append<review_scoring::ReviewScoringEngineComponent>()
            .Append<review_scoring::ReviewScoringServiceComponent>()
        ;

    return userver::utils::DaemonMain(argc, argv, component_list);
}
