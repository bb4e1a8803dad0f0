#pragma once
#include "expr.hpp"
#include <unordered_map>
#include <unordered_set>

struct CallEdge {
    NodeId caller;
    NodeId callee;
    bool operator==(const CallEdge& other) const {
        return caller == other.caller && callee == other.callee;
    }
};

namespace std {
    template<>
    struct hash<CallEdge> {
        size_t operator()(const CallEdge& edge) const {
            return std::hash<uint64_t>{}((static_cast<uint64_t>(edge.caller) << 32) | edge.callee);
        }
    };
}

// Callables and calls of one unit. Filled by [build_call_graph], then [post_process] replaces the
// calls through declarations by the calls they can reach. Read only afterwards
struct CallGraph {
    // Definitions with a body, by qualified name
    std::unordered_map<NodeId, std::string> functions;
    std::unordered_map<NodeId, std::string> method_decls;
    // Declaration to the definitions implementing it. A default bodied declaration implements itself
    std::unordered_map<NodeId, std::vector<NodeId>> method_impls;

    // (caller, callee) where the callee is known exactly
    std::unordered_set<CallEdge> static_calls;
    // (caller, declaration) where only the declaration is known. Empty after [post_process]
    std::unordered_set<CallEdge> dynamic_calls;
    // (caller, implementation), the expansion of [dynamic_calls]
    std::unordered_set<CallEdge> potential_calls;
    bool post_processed = false;
};

void append_method_impl(CallGraph& graph, NodeId decl, NodeId def);
void post_process(CallGraph& graph);
// True when every edge ends on a known callable and every pending declaration has an entry in
// [method_impls]
bool edges_closed(const CallGraph& graph);
