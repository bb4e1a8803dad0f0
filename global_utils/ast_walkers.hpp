#pragma once
#include <functional>
#include "top_level.hpp"

// Any node of the syntax tree. Lets a single recursive function walk the whole tree
using SyntaxNode = std::variant<
    std::shared_ptr<Item>,
    std::shared_ptr<Stmt>,
    std::shared_ptr<ValExpr>>;

NodeId syntax_node_id(const SyntaxNode& node);
const SourceSpan& syntax_node_span(const SyntaxNode& node);

bool predicate_valexpr_walker(
    std::shared_ptr<ValExpr> val_expr,
    std::function<bool(std::shared_ptr<ValExpr>)> predicate);
void visitor_valexpr_walker(
    std::shared_ptr<ValExpr> val_expr,
    std::function<void(std::shared_ptr<ValExpr>)> visitor);
void syntax_node_children_walker(
    const SyntaxNode& node,
    std::function<void(SyntaxNode)> visitor);
