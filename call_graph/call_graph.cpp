#include "call_graph.hpp"
#include <algorithm>
#include <cassert>

void append_method_impl(CallGraph& graph, NodeId decl, NodeId def) {
    std::vector<NodeId>& impls = graph.method_impls[decl];
    if(std::find(impls.begin(), impls.end(), def) == impls.end()) {
        impls.push_back(def);
    }
}

void post_process(CallGraph& graph) {
    for(const CallEdge& edge: graph.dynamic_calls) {
        assert(graph.method_impls.contains(edge.callee));
        for(NodeId impl: graph.method_impls.at(edge.callee)) {
            graph.potential_calls.insert(CallEdge{edge.caller, impl});
        }
    }
    graph.dynamic_calls.clear();
    graph.post_processed = true;
}

bool edges_closed(const CallGraph& graph) {
    auto ends_on_callables = [&](const std::unordered_set<CallEdge>& edges) {
        return std::all_of(edges.begin(), edges.end(), [&](const CallEdge& edge) {
            return graph.functions.contains(edge.caller) && graph.functions.contains(edge.callee);
        });
    };
    bool pending_closed = std::all_of(graph.dynamic_calls.begin(), graph.dynamic_calls.end(), [&](const CallEdge& edge) {
        return graph.functions.contains(edge.caller) && graph.method_impls.contains(edge.callee);
    });
    return pending_closed && ends_on_callables(graph.static_calls) && ends_on_callables(graph.potential_calls);
}
