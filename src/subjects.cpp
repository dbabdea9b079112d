#include "conduit/subjects.hpp"

#include <cctype>

#include "conduit/errors.hpp"

namespace conduit {
namespace subjects {

namespace {

[[noreturn]] void throw_unset(const char* what) {
    throw InvalidArgumentError(std::string("Domain event has no ") + what + " set");
}

std::string graph_fact(const GraphEvent& e) {
    switch (e.event_case()) {
        case GraphEvent::kCreated: return "created";
        case GraphEvent::kDeleted: return "deleted";
        case GraphEvent::kRenamed: return "renamed";
        case GraphEvent::kTagged: return "tagged";
        case GraphEvent::kUntagged: return "untagged";
        case GraphEvent::kUpdated: return "updated";
        case GraphEvent::kImportRequested: return "import_requested";
        case GraphEvent::kImportCompleted: return "import_completed";
        case GraphEvent::kImportFailed: return "import_failed";
        case GraphEvent::EVENT_NOT_SET: break;
    }
    throw_unset("graph event");
}

std::string node_fact(const NodeEvent& e) {
    switch (e.event_case()) {
        case NodeEvent::kAdded: return "added";
        case NodeEvent::kRemoved: return "removed";
        case NodeEvent::kUpdated: return "updated";
        case NodeEvent::kMoved: return "moved";
        case NodeEvent::kContentChanged: return "content_changed";
        case NodeEvent::EVENT_NOT_SET: break;
    }
    throw_unset("node event");
}

std::string edge_fact(const EdgeEvent& e) {
    switch (e.event_case()) {
        case EdgeEvent::kConnected: return "connected";
        case EdgeEvent::kRemoved: return "removed";
        case EdgeEvent::kUpdated: return "updated";
        case EdgeEvent::kReversed: return "reversed";
        case EdgeEvent::EVENT_NOT_SET: break;
    }
    throw_unset("edge event");
}

std::string subgraph_fact(const SubgraphEvent& e) {
    switch (e.event_case()) {
        case SubgraphEvent::kCreated: return "created";
        case SubgraphEvent::kRemoved: return "removed";
        case SubgraphEvent::kMoved: return "moved";
        case SubgraphEvent::kNodeAdded: return "node_added";
        case SubgraphEvent::kNodeRemoved: return "node_removed";
        case SubgraphEvent::EVENT_NOT_SET: break;
    }
    throw_unset("subgraph event");
}

std::string workflow_fact(const WorkflowEvent& e) {
    switch (e.event_case()) {
        case WorkflowEvent::kCreated: return "created";
        case WorkflowEvent::kStepAdded: return "step_added";
        case WorkflowEvent::kStepsConnected: return "steps_connected";
        case WorkflowEvent::kValidated: return "validated";
        case WorkflowEvent::kStarted: return "started";
        case WorkflowEvent::kStepCompleted: return "step_completed";
        case WorkflowEvent::kPaused: return "paused";
        case WorkflowEvent::kResumed: return "resumed";
        case WorkflowEvent::kFailed: return "failed";
        case WorkflowEvent::kCompleted: return "completed";
        case WorkflowEvent::EVENT_NOT_SET: break;
    }
    throw_unset("workflow event");
}

const UUID& graph_root(const GraphEvent& e) {
    switch (e.event_case()) {
        case GraphEvent::kCreated: return e.created().graph_id();
        case GraphEvent::kDeleted: return e.deleted().graph_id();
        case GraphEvent::kRenamed: return e.renamed().graph_id();
        case GraphEvent::kTagged: return e.tagged().graph_id();
        case GraphEvent::kUntagged: return e.untagged().graph_id();
        case GraphEvent::kUpdated: return e.updated().graph_id();
        case GraphEvent::kImportRequested: return e.import_requested().graph_id();
        case GraphEvent::kImportCompleted: return e.import_completed().graph_id();
        case GraphEvent::kImportFailed: return e.import_failed().graph_id();
        case GraphEvent::EVENT_NOT_SET: break;
    }
    throw_unset("graph event");
}

const UUID& node_root(const NodeEvent& e) {
    switch (e.event_case()) {
        case NodeEvent::kAdded: return e.added().graph_id();
        case NodeEvent::kRemoved: return e.removed().graph_id();
        case NodeEvent::kUpdated: return e.updated().graph_id();
        case NodeEvent::kMoved: return e.moved().graph_id();
        case NodeEvent::kContentChanged: return e.content_changed().graph_id();
        case NodeEvent::EVENT_NOT_SET: break;
    }
    throw_unset("node event");
}

const UUID& edge_root(const EdgeEvent& e) {
    switch (e.event_case()) {
        case EdgeEvent::kConnected: return e.connected().graph_id();
        case EdgeEvent::kRemoved: return e.removed().graph_id();
        case EdgeEvent::kUpdated: return e.updated().graph_id();
        case EdgeEvent::kReversed: return e.reversed().graph_id();
        case EdgeEvent::EVENT_NOT_SET: break;
    }
    throw_unset("edge event");
}

const UUID& subgraph_root(const SubgraphEvent& e) {
    switch (e.event_case()) {
        case SubgraphEvent::kCreated: return e.created().graph_id();
        case SubgraphEvent::kRemoved: return e.removed().graph_id();
        case SubgraphEvent::kMoved: return e.moved().graph_id();
        case SubgraphEvent::kNodeAdded: return e.node_added().graph_id();
        case SubgraphEvent::kNodeRemoved: return e.node_removed().graph_id();
        case SubgraphEvent::EVENT_NOT_SET: break;
    }
    throw_unset("subgraph event");
}

const UUID& workflow_root(const WorkflowEvent& e) {
    switch (e.event_case()) {
        case WorkflowEvent::kCreated: return e.created().workflow_id();
        case WorkflowEvent::kStepAdded: return e.step_added().workflow_id();
        case WorkflowEvent::kStepsConnected: return e.steps_connected().workflow_id();
        case WorkflowEvent::kValidated: return e.validated().workflow_id();
        case WorkflowEvent::kStarted: return e.started().workflow_id();
        case WorkflowEvent::kStepCompleted: return e.step_completed().workflow_id();
        case WorkflowEvent::kPaused: return e.paused().workflow_id();
        case WorkflowEvent::kResumed: return e.resumed().workflow_id();
        case WorkflowEvent::kFailed: return e.failed().workflow_id();
        case WorkflowEvent::kCompleted: return e.completed().workflow_id();
        case WorkflowEvent::EVENT_NOT_SET: break;
    }
    throw_unset("workflow event");
}

// PascalCase from snake_case: "content_changed" -> "ContentChanged".
std::string pascal(const std::string& snake) {
    std::string result;
    bool upper = true;
    for (char c : snake) {
        if (c == '_') {
            upper = true;
            continue;
        }
        result.push_back(upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
        upper = false;
    }
    return result;
}

} // anonymous namespace

std::string subject_for(const DomainEvent& event) {
    const std::string prefix = std::string(ROOT) + ".";
    switch (event.event_case()) {
        case DomainEvent::kGraph: return prefix + "graph." + graph_fact(event.graph());
        case DomainEvent::kNode: return prefix + "graph.node." + node_fact(event.node());
        case DomainEvent::kEdge: return prefix + "graph.edge." + edge_fact(event.edge());
        case DomainEvent::kSubgraph:
            return prefix + "graph.subgraph." + subgraph_fact(event.subgraph());
        case DomainEvent::kWorkflow:
            return prefix + "workflow." + workflow_fact(event.workflow());
        case DomainEvent::EVENT_NOT_SET: break;
    }
    throw_unset("variant");
}

const UUID& aggregate_id_of(const DomainEvent& event) {
    switch (event.event_case()) {
        case DomainEvent::kGraph: return graph_root(event.graph());
        case DomainEvent::kNode: return node_root(event.node());
        case DomainEvent::kEdge: return edge_root(event.edge());
        case DomainEvent::kSubgraph: return subgraph_root(event.subgraph());
        case DomainEvent::kWorkflow: return workflow_root(event.workflow());
        case DomainEvent::EVENT_NOT_SET: break;
    }
    throw_unset("variant");
}

std::string event_type_of(const DomainEvent& event) {
    switch (event.event_case()) {
        case DomainEvent::kGraph: return "Graph" + pascal(graph_fact(event.graph()));
        case DomainEvent::kNode: return "Node" + pascal(node_fact(event.node()));
        case DomainEvent::kEdge: return "Edge" + pascal(edge_fact(event.edge()));
        case DomainEvent::kSubgraph: {
            auto fact = subgraph_fact(event.subgraph());
            if (fact == "node_added") return "NodeAddedToSubgraph";
            if (fact == "node_removed") return "NodeRemovedFromSubgraph";
            return "Subgraph" + pascal(fact);
        }
        case DomainEvent::kWorkflow: {
            auto fact = workflow_fact(event.workflow());
            if (fact == "step_added") return "StepAdded";
            if (fact == "steps_connected") return "StepsConnected";
            if (fact == "step_completed") return "StepCompleted";
            return "Workflow" + pascal(fact);
        }
        case DomainEvent::EVENT_NOT_SET: break;
    }
    throw_unset("variant");
}

std::vector<std::string> tokenize(const std::string& subject) {
    std::vector<std::string> tokens;
    size_t start = 0;
    while (true) {
        auto pos = subject.find('.', start);
        if (pos == std::string::npos) {
            tokens.push_back(subject.substr(start));
            return tokens;
        }
        tokens.push_back(subject.substr(start, pos - start));
        start = pos + 1;
    }
}

bool matches(const std::string& subject, const std::string& pattern) {
    if (subject.empty() || pattern.empty()) return false;

    auto subject_tokens = tokenize(subject);
    auto pattern_tokens = tokenize(pattern);

    if (pattern_tokens.back() == ">") {
        size_t prefix = pattern_tokens.size() - 1;
        // At least one token must stand in for '>'
        if (subject_tokens.size() <= prefix) return false;
        for (size_t i = 0; i < prefix; ++i) {
            if (pattern_tokens[i] != "*" && pattern_tokens[i] != subject_tokens[i]) return false;
        }
        return true;
    }

    if (pattern_tokens.size() != subject_tokens.size()) return false;

    for (size_t i = 0; i < pattern_tokens.size(); ++i) {
        if (pattern_tokens[i] != "*" && pattern_tokens[i] != subject_tokens[i]) return false;
    }
    return true;
}

} // namespace subjects
} // namespace conduit
