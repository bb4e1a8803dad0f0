#pragma once
#include "call_graph.hpp"
#include <ostream>

// Whether a call certainly happens (static dispatch) or only might happen (one of the targets of a
// dynamic dispatch)
enum class CallKind { Definite, Potential };

struct DotEdge {
    NodeId caller;
    NodeId callee;
    CallKind kind;
};

// What the diagram sees of a post processed [CallGraph]: the callables as nodes and the union of
// definite and potential calls as edges
class CallGraphView {
private:
    const CallGraph& graph;
    std::string unit_name;
public:
    CallGraphView(const CallGraph& graph, std::string unit_name);
    // "Callgraph_for_<unit>", with characters that are not valid in a DOT id replaced by '_'
    std::string graph_id() const;
    std::vector<NodeId> nodes() const;
    std::vector<DotEdge> edges() const;
    std::string node_id(NodeId node) const;
    const std::string& node_label(NodeId node) const;
    NodeId source(const DotEdge& edge) const;
    NodeId target(const DotEdge& edge) const;
};

void render_dot(const CallGraphView& view, std::ostream& out);
// Reports on stderr and returns false when [path] can't be written
bool write_dot_file(const CallGraphView& view, const std::string& path);
