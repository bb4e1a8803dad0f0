#pragma once
#include "call_graph.hpp"
#include <ostream>

// Prints callables, declarations, calls and potential calls, sorted by node id. The graph must be
// post processed
void dump_call_graph(const CallGraph& graph, std::ostream& out);
