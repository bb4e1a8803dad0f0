#include "text_dump.hpp"
#include <algorithm>
#include <cassert>

static std::vector<NodeId> sorted_ids(const std::unordered_map<NodeId, std::string>& names) {
    std::vector<NodeId> ids;
    for(const auto& [id, _]: names) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

static std::vector<CallEdge> sorted_edges(const std::unordered_set<CallEdge>& edges) {
    std::vector<CallEdge> sorted(edges.begin(), edges.end());
    std::sort(sorted.begin(), sorted.end(), [](const CallEdge& a, const CallEdge& b) {
        return a.caller < b.caller || (a.caller == b.caller && a.callee < b.callee);
    });
    return sorted;
}

static void dump_edges(const CallGraph& graph, const std::unordered_set<CallEdge>& edges, std::ostream& out) {
    for(const CallEdge& edge: sorted_edges(edges)) {
        assert(graph.functions.contains(edge.caller) && graph.functions.contains(edge.callee));
        out << graph.functions.at(edge.caller) << " -> " << graph.functions.at(edge.callee) << std::endl;
    }
}

void dump_call_graph(const CallGraph& graph, std::ostream& out) {
    assert(graph.post_processed && graph.dynamic_calls.empty());
    out << "Found fns:" << std::endl;
    for(NodeId id: sorted_ids(graph.functions)) {
        out << id << ": " << graph.functions.at(id) << std::endl;
    }
    out << std::endl << "Found method decls:" << std::endl;
    for(NodeId id: sorted_ids(graph.method_decls)) {
        out << id << ": " << graph.method_decls.at(id) << std::endl;
    }
    out << std::endl << "Found calls:" << std::endl;
    dump_edges(graph, graph.static_calls, out);
    out << std::endl << "Found potential calls:" << std::endl;
    dump_edges(graph, graph.potential_calls, out);
}
