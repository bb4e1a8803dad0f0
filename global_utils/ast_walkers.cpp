#include "ast_walkers.hpp"
#include "pattern_matching_boilerplate.hpp"

NodeId syntax_node_id(const SyntaxNode& node) {
    return std::visit([](const auto& n) { return n->id; }, node);
}

const SourceSpan& syntax_node_span(const SyntaxNode& node) {
    return std::visit([](const auto& n) -> const SourceSpan& { return n->source_span; }, node);
}

// Unwraps a valexpr once and applies the function to the direct subexpressions, in evaluation
// order. Follows predicate logic and stops early.
bool predicate_valexpr_walker(
    std::shared_ptr<ValExpr> val_expr,
    std::function<bool(std::shared_ptr<ValExpr>)> predicate) {
    return std::visit(Overload{
        [&](const ValExpr::Call& call) {
            if(!predicate(call.callee)) {
                return false;
            }
            for(auto arg: call.args) {
                if(!predicate(arg)) {
                    return false;
                }
            }
            return true;
        },
        [&](const ValExpr::MethodCall& method_call) {
            if(!predicate(method_call.receiver)) {
                return false;
            }
            for(auto arg: method_call.args) {
                if(!predicate(arg)) {
                    return false;
                }
            }
            return true;
        },
        [&](const ValExpr::Field& field_access) {
            return predicate(field_access.base);
        },
        [&](const ValExpr::Assignment& assignment) {
            return predicate(assignment.lhs) && predicate(assignment.rhs);
        },
        [&](const ValExpr::BinOpExpr& bin_op_expr) {
            return predicate(bin_op_expr.lhs) && predicate(bin_op_expr.rhs);
        },
        [&](const ValExpr::UnOpExpr& un_op_expr) {
            return predicate(un_op_expr.operand);
        },
        [&](const auto&) {return true;}
    }, val_expr->t);
}

// Same as above but applies it fully
void visitor_valexpr_walker(
    std::shared_ptr<ValExpr> val_expr,
    std::function<void(std::shared_ptr<ValExpr>)> visitor) {
    predicate_valexpr_walker(
        val_expr,
        [&](std::shared_ptr<ValExpr> val_expr) {
            visitor(val_expr);
            return true;
        });
}

static void visit_stmt_list(
    const std::vector<std::shared_ptr<Stmt>>& stmts,
    std::function<void(SyntaxNode)>& visitor) {
    for(std::shared_ptr<Stmt> stmt: stmts) {
        visitor(stmt);
    }
}

// Applies [visitor] to every direct child of [node] in source order. Types, parameters and names
// are not nodes and are not visited
void syntax_node_children_walker(
    const SyntaxNode& node,
    std::function<void(SyntaxNode)> visitor) {
    std::visit(Overload{
        [&](const std::shared_ptr<Item>& item) {
            std::visit(Overload{
                [&](const std::shared_ptr<Item::Func>& func) {
                    if(func->body) {
                        visit_stmt_list(*func->body, visitor);
                    }
                },
                [&](const Item::Mod& mod) {
                    for(std::shared_ptr<Item> mod_item: mod.items) {
                        visitor(mod_item);
                    }
                },
                [&](const Item::Trait& trait_def) {
                    for(std::shared_ptr<Item> method: trait_def.methods) {
                        visitor(method);
                    }
                },
                [&](const Item::Impl& impl_def) {
                    for(std::shared_ptr<Item> method: impl_def.methods) {
                        visitor(method);
                    }
                },
                [&](const Item::Static& static_def) {
                    visitor(static_def.init);
                },
                [&](const Item::Struct&) {}
            }, item->t);
        },
        [&](const std::shared_ptr<Stmt>& stmt) {
            std::visit(Overload{
                [&](const Stmt::Let& let) {
                    if(let.init) {
                        visitor(let.init);
                    }
                },
                [&](const Stmt::Expr& expr) {
                    visitor(expr.expr);
                },
                [&](const Stmt::If& if_stmt) {
                    visitor(if_stmt.cond);
                    visit_stmt_list(if_stmt.then_body, visitor);
                    if(if_stmt.else_body) {
                        visit_stmt_list(*if_stmt.else_body, visitor);
                    }
                },
                [&](const Stmt::While& while_stmt) {
                    visitor(while_stmt.cond);
                    visit_stmt_list(while_stmt.body, visitor);
                },
                [&](const Stmt::Block& block) {
                    visit_stmt_list(block.body, visitor);
                },
                [&](const Stmt::Return& return_stmt) {
                    if(return_stmt.expr) {
                        visitor(return_stmt.expr);
                    }
                },
                [&](const Stmt::LocalFunc& local_func) {
                    visitor(local_func.item);
                }
            }, stmt->t);
        },
        [&](const std::shared_ptr<ValExpr>& val_expr) {
            visitor_valexpr_walker(val_expr, [&](std::shared_ptr<ValExpr> child) {
                visitor(child);
            });
        }
    }, node);
}
