#include "call_graph_builder.hpp"
#include "pattern_matching_boilerplate.hpp"
#include "utils.hpp"
#include "defer.cpp"
#include <iostream>

struct GraphBuilderEnv {
    const SemanticQuery& query;
    CallGraph& graph;
    BuildDiagnostics& diagnostics;
    // Callable whose body is being walked
    std::optional<NodeId> curr_callable;
};

static void record_node(GraphBuilderEnv& env, const SyntaxNode& node);

static void walk_children(GraphBuilderEnv& env, const SyntaxNode& node) {
    syntax_node_children_walker(node, [&](SyntaxNode child) {
        record_node(env, child);
    });
}

// Every call found below [node] is attributed to [callable_id], until a nested callable is entered
static void walk_body_of(GraphBuilderEnv& env, NodeId callable_id, const SyntaxNode& node) {
    std::optional<NodeId> prev_callable = env.curr_callable;
    env.curr_callable = callable_id;
    Defer d([&](){env.curr_callable = prev_callable;});
    walk_children(env, node);
}

static bool has_caller(GraphBuilderEnv& env, const SyntaxNode& node) {
    if(env.curr_callable) {
        return true;
    }
    const SourceSpan& span = syntax_node_span(node);
    report_warning_location(span);
    std::cerr << "WARNING: call at line " << span.start.line << ", column " << span.start.char_no
    << " without a known enclosing callable" << std::endl;
    env.diagnostics.calls_without_caller.push_back(span);
    return false;
}

// Calls to callables outside of the unit are dropped before checking for a caller
static void record_call_reference(GraphBuilderEnv& env, const SyntaxNode& node, const CallTarget& target) {
    std::visit(Overload{
        [&](const CallTarget::ResolvedTarget& resolved) {
            if(!resolved.is_local || !has_caller(env, node)) {
                return;
            }
            env.graph.static_calls.insert(CallEdge{*env.curr_callable, resolved.callee_id});
        },
        [&](const CallTarget::DispatchTarget& dispatch) {
            if(!dispatch.is_local || !has_caller(env, node)) {
                return;
            }
            env.graph.dynamic_calls.insert(CallEdge{*env.curr_callable, dispatch.declaration_id});
        }
    }, target.t);
}

static void record_node(GraphBuilderEnv& env, const SyntaxNode& node) {
    if(env.query.is_generated_code(syntax_node_span(node))) {
        return;
    }
    CallGraph& graph = env.graph;
    std::visit(Overload{
        [&](const Classification::FunctionDefinition& func_def) {
            graph.functions.try_emplace(func_def.id, func_def.qualified_name);
            walk_body_of(env, func_def.id, node);
        },
        [&](const Classification::MethodDeclaration& method_decl) {
            graph.method_decls.try_emplace(method_decl.id, method_decl.qualified_name);
            // An implementation seen earlier may have created the entry already
            graph.method_impls.try_emplace(method_decl.id);
            if(!method_decl.has_default_body) {
                return;
            }
            graph.functions.try_emplace(method_decl.id, method_decl.qualified_name);
            append_method_impl(graph, method_decl.id, method_decl.id);
            walk_body_of(env, method_decl.id, node);
        },
        [&](const Classification::MethodImplementation& method_impl) {
            graph.functions.try_emplace(method_impl.id, method_impl.qualified_name);
            if(method_impl.overridden_declaration && method_impl.overridden_declaration->is_local) {
                append_method_impl(graph, method_impl.overridden_declaration->id, method_impl.id);
            }
            walk_body_of(env, method_impl.id, node);
        },
        [&](const Classification::Other&) {
            std::optional<CallTarget> target = env.query.resolve_call_reference(node);
            if(target) {
                record_call_reference(env, node, *target);
            }
            walk_children(env, node);
        }
    }, env.query.classify(node).t);
}

void build_call_graph(
    Program* root,
    const SemanticQuery& query,
    CallGraph& graph,
    BuildDiagnostics& diagnostics) {
    GraphBuilderEnv env{query, graph, diagnostics, std::nullopt};
    for(std::shared_ptr<Item> item: root->items) {
        record_node(env, item);
    }
}
