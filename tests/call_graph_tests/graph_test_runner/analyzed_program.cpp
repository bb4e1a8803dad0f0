#include <algorithm>
#include <cassert>
#include <sstream>
#include "parse_file.hpp"
#include "semantic_analyzer.hpp"
#include "semantic_query.hpp"
#include "text_dump.hpp"
#include "dot_renderer.hpp"
#include "analyzed_program.hpp"

AnalyzedProgram::AnalyzedProgram(FILE* file) {
    Program* program = parse_file(file);
    if(program == nullptr) {
        return;
    }
    std::shared_ptr<DeclCollection> decl_collection = analyze_program(program);
    if(decl_collection == nullptr) {
        delete program;
        return;
    }
    front_end_ok = true;
    SemanticQuery query(decl_collection);
    build_call_graph(program, query, graph, diagnostics);
    closed_before_post_processing = edges_closed(graph);
    post_process(graph);
    delete program;
}

bool AnalyzedProgram::analysis_succeeded() const {
    return front_end_ok;
}

static std::vector<std::string> sorted_names(const std::unordered_map<NodeId, std::string>& names) {
    std::vector<std::string> out;
    for(const auto& [_, name]: names) {
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> AnalyzedProgram::callables() const {
    return sorted_names(graph.functions);
}

std::vector<std::string> AnalyzedProgram::method_decls() const {
    return sorted_names(graph.method_decls);
}

std::vector<NamedEdge> AnalyzedProgram::named_edges(const std::unordered_set<CallEdge>& edges) const {
    std::vector<NamedEdge> out;
    for(const CallEdge& edge: edges) {
        assert(graph.functions.contains(edge.caller) && graph.functions.contains(edge.callee));
        out.emplace_back(graph.functions.at(edge.caller), graph.functions.at(edge.callee));
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<NamedEdge> AnalyzedProgram::definite_calls() const {
    return named_edges(graph.static_calls);
}

std::vector<NamedEdge> AnalyzedProgram::potential_calls() const {
    return named_edges(graph.potential_calls);
}

std::vector<std::string> AnalyzedProgram::implementers(const std::string& decl_name) const {
    auto decl = std::find_if(graph.method_decls.begin(), graph.method_decls.end(), [&](const auto& entry) {
        return entry.second == decl_name;
    });
    assert(decl != graph.method_decls.end() && "unknown method declaration");
    std::vector<std::string> out;
    for(NodeId impl: graph.method_impls.at(decl->first)) {
        out.push_back(graph.functions.at(impl));
    }
    std::sort(out.begin(), out.end());
    return out;
}

size_t AnalyzedProgram::dropped_calls() const {
    return diagnostics.calls_without_caller.size();
}

bool AnalyzedProgram::edges_closed_before_post_processing() const {
    return closed_before_post_processing;
}

bool AnalyzedProgram::edges_closed_after_post_processing() const {
    return edges_closed(graph);
}

bool AnalyzedProgram::post_processing_idempotent() const {
    CallGraph again = graph;
    post_process(again);
    return again.dynamic_calls.empty()
        && again.static_calls == graph.static_calls
        && again.potential_calls == graph.potential_calls;
}

std::string AnalyzedProgram::text_dump() const {
    std::ostringstream out;
    dump_call_graph(graph, out);
    return out.str();
}

std::string AnalyzedProgram::dot_output(const std::string& unit_name) const {
    std::ostringstream out;
    render_dot(CallGraphView(graph, unit_name), out);
    return out.str();
}
