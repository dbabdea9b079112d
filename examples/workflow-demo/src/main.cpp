#include <cstdlib>
#include <string>

#include "conduit/conduit.hpp"

namespace {

constexpr const char* COMPONENT = "workflow_demo";

/// Publish a graph event the way the graph editor would.
conduit::DomainEvent node_added(const conduit::UUID& graph_id, const std::string& node_id) {
    conduit::DomainEvent event;
    event.mutable_envelope()->set_id(conduit::helpers::new_id());
    *event.mutable_envelope()->mutable_timestamp() = conduit::helpers::now();
    auto* added = event.mutable_node()->mutable_added();
    *added->mutable_graph_id() = graph_id;
    added->set_node_id(node_id);
    added->set_node_type("step");
    return event;
}

void drain(conduit::SubjectConsumer& consumer, const std::string& name) {
    for (const auto& routed : consumer.poll_events()) {
        conduit::log_info(COMPONENT, "event received", {
            {"consumer", name},
            {"subject", routed.subject()},
            {"event_type", conduit::subjects::event_type_of(routed.event())},
            {"global_sequence", routed.global_sequence()},
            {"aggregate_sequence", routed.aggregate_sequence()}
        });
    }
}

} // anonymous namespace

int main() {
    try {
        conduit::SubjectRouter router(conduit::RouterConfig::from_env());
        conduit::InMemoryEventStore store;
        conduit::WorkflowCommandHandler handler(store, router);

        conduit::SubjectConsumer workflow_view(router, {"event.workflow.>"});
        conduit::SubjectConsumer graph_view(router, {"event.graph.>", "event.graph.node.added"});

        auto workflow_id = conduit::helpers::new_uuid();
        conduit::WorkflowCommandBuilder commands(workflow_id);
        commands.with_correlation_id(conduit::helpers::new_id())
                .with_metadata("origin", "demo");

        handler.handle(commands.create("Document review", "Review then approve", "demo"));
        handler.handle(commands.add_step(conduit::steps::script("A", "Prepare", "lua", "return 1"), true));
        handler.handle(commands.add_step(conduit::steps::user_task("B", "Approve"), false, true));
        handler.handle(commands.connect_steps("A", "B", "edge-a-b"));
        handler.handle(commands.validate("demo"));
        handler.handle(commands.start("demo", {{"document", "spec.pdf"}}));
        handler.handle(commands.complete_step("A", std::string("B"), {{"prepared", "yes"}}));

        try {
            handler.handle(commands.validate("demo"));
        } catch (const conduit::ConduitError& e) {
            auto status = e.to_grpc_status();
            conduit::log_info(COMPONENT, "command rejected as expected", {
                {"code", static_cast<int>(status.error_code())},
                {"error", status.error_message()}
            });
        }

        handler.handle(commands.complete_step("B", std::nullopt, {{"approved", "true"}}));

        auto graph_id = conduit::helpers::new_uuid();
        router.route_event(node_added(graph_id, "A"));

        drain(workflow_view, "workflow_view");
        drain(graph_view, "graph_view");

        auto workflow = handler.load(workflow_id);
        conduit::log_info(COMPONENT, "workflow finished", {
            {"workflow_id", conduit::helpers::uuid_to_string(workflow_id)},
            {"status", conduit::to_string(workflow.status())},
            {"version", workflow.version()}
        });

        for (const auto& [pattern, stats] : router.get_stats()) {
            conduit::log_info(COMPONENT, "channel stats", {
                {"pattern", pattern},
                {"sent", stats.messages_sent},
                {"received", stats.messages_received},
                {"dropped", stats.messages_dropped},
                {"subscribers", stats.subscriber_count}
            });
        }
    } catch (const conduit::ConduitError& e) {
        conduit::log_error(COMPONENT, "demo failed", {{"error", e.what()}});
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
