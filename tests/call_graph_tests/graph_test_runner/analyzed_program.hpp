#pragma once

#include <string>
#include <vector>
#include <utility>
#include <cstdio>
#include "call_graph_builder.hpp"

using NamedEdge = std::pair<std::string, std::string>;

// Runs the whole pipeline on one program and answers questions about the result by qualified
// names, so that expectations don't depend on node ids
class AnalyzedProgram {
private:
    bool front_end_ok = false;
    bool closed_before_post_processing = false;
    CallGraph graph;
    BuildDiagnostics diagnostics;

    std::vector<NamedEdge> named_edges(const std::unordered_set<CallEdge>& edges) const;
public:
    // Takes ownership of [file]
    explicit AnalyzedProgram(FILE* file);
    bool analysis_succeeded() const;
    std::vector<std::string> callables() const;
    std::vector<std::string> method_decls() const;
    std::vector<NamedEdge> definite_calls() const;
    std::vector<NamedEdge> potential_calls() const;
    // Qualified names of the implementations of the declaration named [decl_name]
    std::vector<std::string> implementers(const std::string& decl_name) const;
    size_t dropped_calls() const;
    bool edges_closed_before_post_processing() const;
    bool edges_closed_after_post_processing() const;
    // Post processes a copy of the graph once more and compares it with the graph
    bool post_processing_idempotent() const;
    std::string text_dump() const;
    std::string dot_output(const std::string& unit_name) const;
};
