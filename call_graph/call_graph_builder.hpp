#pragma once
#include "call_graph.hpp"
#include "semantic_query.hpp"

struct BuildDiagnostics {
    // Calls found outside of every callable (eg in static initializers). They are not recorded
    std::vector<SourceSpan> calls_without_caller;
};

void build_call_graph(
    Program* root,
    const SemanticQuery& query,
    CallGraph& graph,
    BuildDiagnostics& diagnostics);
