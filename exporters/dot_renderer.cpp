#include "dot_renderer.hpp"
#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/graphviz.hpp>
#include <algorithm>
#include <cassert>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <tuple>

CallGraphView::CallGraphView(const CallGraph& graph, std::string unit_name)
    : graph(graph), unit_name(std::move(unit_name)) {
    assert(graph.post_processed);
}

std::string CallGraphView::graph_id() const {
    std::string id = "Callgraph_for_" + unit_name;
    std::replace_if(id.begin(), id.end(), [](unsigned char c) {
        return !std::isalnum(c) && c != '_';
    }, '_');
    return id;
}

std::vector<NodeId> CallGraphView::nodes() const {
    std::vector<NodeId> nodes;
    for(const auto& [id, _]: graph.functions) {
        nodes.push_back(id);
    }
    std::sort(nodes.begin(), nodes.end());
    return nodes;
}

std::vector<DotEdge> CallGraphView::edges() const {
    std::vector<DotEdge> edges;
    for(const CallEdge& edge: graph.static_calls) {
        edges.push_back(DotEdge{edge.caller, edge.callee, CallKind::Definite});
    }
    for(const CallEdge& edge: graph.potential_calls) {
        edges.push_back(DotEdge{edge.caller, edge.callee, CallKind::Potential});
    }
    std::sort(edges.begin(), edges.end(), [](const DotEdge& a, const DotEdge& b) {
        return std::tie(a.kind, a.caller, a.callee) < std::tie(b.kind, b.caller, b.callee);
    });
    return edges;
}

std::string CallGraphView::node_id(NodeId node) const {
    return "n_" + std::to_string(node);
}

const std::string& CallGraphView::node_label(NodeId node) const {
    assert(graph.functions.contains(node));
    return graph.functions.at(node);
}

NodeId CallGraphView::source(const DotEdge& edge) const {
    return edge.caller;
}

NodeId CallGraphView::target(const DotEdge& edge) const {
    return edge.callee;
}

struct DotVertex {
    std::string dot_id;
    std::string label;
};

struct DotEdgeProperties {
    CallKind kind;
};

using DotGraph = boost::adjacency_list<
    boost::vecS, boost::vecS, boost::directedS, DotVertex, DotEdgeProperties>;

void render_dot(const CallGraphView& view, std::ostream& out) {
    DotGraph dot_graph;
    std::unordered_map<NodeId, DotGraph::vertex_descriptor> vertices;
    for(NodeId node: view.nodes()) {
        vertices.emplace(node, boost::add_vertex(DotVertex{view.node_id(node), view.node_label(node)}, dot_graph));
    }
    for(const DotEdge& edge: view.edges()) {
        boost::add_edge(
            vertices.at(view.source(edge)),
            vertices.at(view.target(edge)),
            DotEdgeProperties{edge.kind},
            dot_graph);
    }
    std::ostringstream rendered;
    boost::write_graphviz(rendered, dot_graph,
        [&](std::ostream& vertex_out, DotGraph::vertex_descriptor v) {
            vertex_out << "[label=\"" << dot_graph[v].label << "\"]";
        },
        [&](std::ostream& edge_out, DotGraph::edge_descriptor e) {
            if(dot_graph[e].kind == CallKind::Potential) {
                edge_out << "[style=dashed]";
            } else {
                edge_out << "[style=solid]";
            }
        },
        [&](std::ostream& graph_out) {
            graph_out << "label=\"" << view.graph_id() << "\";" << std::endl;
        },
        boost::get(&DotVertex::dot_id, dot_graph));

    // write_graphviz always names the graph G
    std::string dot = rendered.str();
    const std::string default_header = "digraph G {";
    if(dot.starts_with(default_header)) {
        dot.replace(0, default_header.size(), "digraph " + view.graph_id() + " {");
    }
    out << dot;
}

bool write_dot_file(const CallGraphView& view, const std::string& path) {
    std::ofstream out(path);
    if(!out) {
        std::cerr << "Could not open " << path << " for writing" << std::endl;
        return false;
    }
    render_dot(view, out);
    out.flush();
    if(!out) {
        std::cerr << "Failed to write the call graph to " << path << std::endl;
        return false;
    }
    return true;
}
