#include "reference_resolver.hpp"
#include "pattern_matching_boilerplate.hpp"
#include "scoped_store.cpp"
#include "defer.cpp"
#include "utils.hpp"
#include <iostream>

// Everything that belongs to one function body. Nested functions get a fresh one, they can't see
// the variables of the enclosing function
struct CallableScope {
    ScopedStore<std::string, ReceiverType> locals;
    GenericBounds generic_bounds;
    std::optional<ReceiverType> self_type;
    std::shared_ptr<Scope> module_scope;
};

struct ResolverEnv {
    std::shared_ptr<DeclCollection> decl_collection;
    // Nested functions stay visible inside the functions nested in them
    ScopedStore<std::string, NodeId> local_funcs;
    std::shared_ptr<CallableScope> callable_scope;
};

static const ReceiverType unknown_type{ReceiverType::Unknown{}};

static void record_func_reference(ResolverEnv& env, NodeId ref_id, NodeId func_id) {
    env.decl_collection->call_targets.insert_or_assign(
        ref_id, resolved_call_target(*env.decl_collection, func_id));
}

// The type a call evaluates to, if its callee was resolved
static ReceiverType type_of_call_result(ResolverEnv& env, NodeId ref_id) {
    const DeclCollection& decls = *env.decl_collection;
    if(!decls.call_targets.contains(ref_id)) {
        return unknown_type;
    }
    NodeId func_id = std::visit(Overload{
        [](const CallTarget::ResolvedTarget& target) { return target.callee_id; },
        [](const CallTarget::DispatchTarget& target) { return target.declaration_id; }
    }, decls.call_targets.at(ref_id).t);
    return return_type_of(decls, func_id);
}

// Looks up [method] on a receiver of type [receiver_type]. Receivers of unknown type and generic
// parameters without local bounds resolve to nothing
static bool resolve_member(
    ResolverEnv& env,
    const ReceiverType& receiver_type,
    const std::string& method,
    const SourceSpan& span,
    NodeId ref_id) {
    const DeclCollection& decls = *env.decl_collection;
    return std::visit(Overload{
        [&](const ReceiverType::Unknown&) {
            return true;
        },
        [&](const ReceiverType::Struct& struct_type) {
            std::optional<NodeId> method_id = find_struct_method(decls, struct_type.struct_id, method);
            if(!method_id) {
                report_error_location(span);
                std::cerr << "No method " << method << " for struct "
                << decls.structs.at(struct_type.struct_id).qualified_name << std::endl;
                return false;
            }
            env.decl_collection->call_targets.insert_or_assign(ref_id, resolved_call_target(decls, *method_id));
            return true;
        },
        [&](const ReceiverType::TraitObject& trait_object) {
            if(trait_object.trait_ids.empty()) {
                return true;
            }
            std::optional<NodeId> decl_id = find_trait_method(decls, trait_object.trait_ids, method);
            if(!decl_id) {
                report_error_location(span);
                std::cerr << "No method " << method << " in trait "
                << decls.traits.at(trait_object.trait_ids[0]).qualified_name;
                if(trait_object.trait_ids.size() > 1) {
                    std::cerr << " or its sibling bounds";
                }
                std::cerr << std::endl;
                return false;
            }
            env.decl_collection->call_targets.insert_or_assign(ref_id, dispatch_call_target(decls, *decl_id));
            return true;
        }
    }, receiver_type.t);
}

static std::optional<ReceiverType> resolve_value_path(ResolverEnv& env, const ValExpr& expr, const Path& path) {
    const DeclCollection& decls = *env.decl_collection;
    CallableScope& callable_scope = *env.callable_scope;
    const std::vector<std::string>& segments = path.segments;

    if(segments.size() == 1) {
        const std::string& name = segments[0];
        std::optional<ReceiverType> local_type = callable_scope.locals.get_value(name);
        if(local_type) {
            return local_type;
        }
        std::optional<NodeId> local_func = env.local_funcs.get_value(name);
        if(local_func) {
            record_func_reference(env, expr.id, *local_func);
            return unknown_type;
        }
    }

    // `Self::m` and `G::m` for a generic parameter [G]
    if(segments.size() == 2 && (segments[0] == "Self" || callable_scope.generic_bounds.contains(segments[0]))) {
        if(segments[0] == "Self" && !callable_scope.self_type) {
            report_error_location(expr.source_span);
            std::cerr << "Self used outside of a trait or an impl" << std::endl;
            return std::nullopt;
        }
        ReceiverType owner_type = segments[0] == "Self"
            ? *callable_scope.self_type
            : ReceiverType{ReceiverType::TraitObject{callable_scope.generic_bounds.at(segments[0])}};
        if(!resolve_member(env, owner_type, segments[1], expr.source_span, expr.id)) {
            return std::nullopt;
        }
        return unknown_type;
    }

    std::optional<NodeId> item_id = resolve_item_path(decls, callable_scope.module_scope, path);
    if(item_id) {
        if(decls.funcs.contains(*item_id)) {
            record_func_reference(env, expr.id, *item_id);
        }
        // Statics, structs, traits and modules used as values don't refer to any callable
        return unknown_type;
    }

    // `S::m` and `T::m`, with [S] or [T] possibly qualified through modules
    if(segments.size() > 1) {
        Path owner_path{std::vector<std::string>(segments.begin(), segments.end() - 1)};
        std::optional<NodeId> owner_id = resolve_item_path(decls, callable_scope.module_scope, owner_path);
        if(owner_id && decls.structs.contains(*owner_id)) {
            if(!resolve_member(env, ReceiverType{ReceiverType::Struct{*owner_id}}, segments.back(), expr.source_span, expr.id)) {
                return std::nullopt;
            }
            return unknown_type;
        }
        if(owner_id && decls.traits.contains(*owner_id)) {
            if(!resolve_member(env, ReceiverType{ReceiverType::TraitObject{{*owner_id}}}, segments.back(), expr.source_span, expr.id)) {
                return std::nullopt;
            }
            return unknown_type;
        }
    }
    report_error_location(expr.source_span);
    std::cerr << "Unknown name " << path_to_string(path) << std::endl;
    return std::nullopt;
}

static std::optional<ReceiverType> resolve_expr(ResolverEnv& env, std::shared_ptr<ValExpr> expr) {
    const DeclCollection& decls = *env.decl_collection;
    auto resolve_all = [&](const std::vector<std::shared_ptr<ValExpr>>& exprs) {
        for(std::shared_ptr<ValExpr> e: exprs) {
            if(!resolve_expr(env, e)) {
                return false;
            }
        }
        return true;
    };
    return std::visit(Overload{
        [&](const ValExpr::VPath& v_path) {
            return resolve_value_path(env, *expr, v_path.path);
        },
        [&](const ValExpr::Call& call) -> std::optional<ReceiverType> {
            if(!resolve_expr(env, call.callee) || !resolve_all(call.args)) {
                return std::nullopt;
            }
            return type_of_call_result(env, call.callee->id);
        },
        [&](const ValExpr::MethodCall& method_call) -> std::optional<ReceiverType> {
            std::optional<ReceiverType> receiver_type = resolve_expr(env, method_call.receiver);
            if(!receiver_type || !resolve_all(method_call.args)) {
                return std::nullopt;
            }
            if(!resolve_member(env, *receiver_type, method_call.method, expr->source_span, expr->id)) {
                return std::nullopt;
            }
            return type_of_call_result(env, expr->id);
        },
        [&](const ValExpr::Field& field) -> std::optional<ReceiverType> {
            std::optional<ReceiverType> base_type = resolve_expr(env, field.base);
            if(!base_type) {
                return std::nullopt;
            }
            if(!std::holds_alternative<ReceiverType::Struct>(base_type->t)) {
                return unknown_type;
            }
            const StructInfo& struct_info = decls.structs.at(std::get<ReceiverType::Struct>(base_type->t).struct_id);
            for(const auto& [field_name, field_type]: struct_info.fields) {
                if(field_name == field.field) {
                    return resolve_type(decls, field_type, struct_info.scope, {}, *base_type);
                }
            }
            return unknown_type;
        },
        [&](const ValExpr::Assignment& assignment) -> std::optional<ReceiverType> {
            if(!resolve_expr(env, assignment.lhs) || !resolve_expr(env, assignment.rhs)) {
                return std::nullopt;
            }
            return unknown_type;
        },
        [&](const ValExpr::BinOpExpr& bin_op) -> std::optional<ReceiverType> {
            if(!resolve_expr(env, bin_op.lhs) || !resolve_expr(env, bin_op.rhs)) {
                return std::nullopt;
            }
            return unknown_type;
        },
        [&](const ValExpr::UnOpExpr& un_op) -> std::optional<ReceiverType> {
            std::optional<ReceiverType> operand_type = resolve_expr(env, un_op.operand);
            if(!operand_type) {
                return std::nullopt;
            }
            // References are transparent to method calls
            if(un_op.op == UnOp::Ref) {
                return operand_type;
            }
            return unknown_type;
        },
        [&](const auto&) -> std::optional<ReceiverType> {
            return unknown_type;
        }
    }, expr->t);
}

static bool resolve_callable(ResolverEnv& env, const FuncInfo& func_info);
static bool resolve_stmts(ResolverEnv& env, const std::vector<std::shared_ptr<Stmt>>& stmts);

static bool resolve_stmt(ResolverEnv& env, std::shared_ptr<Stmt> stmt) {
    CallableScope& callable_scope = *env.callable_scope;
    return std::visit(Overload{
        [&](const Stmt::Let& let) {
            ReceiverType var_type = unknown_type;
            if(let.init) {
                std::optional<ReceiverType> init_type = resolve_expr(env, let.init);
                if(!init_type) {
                    return false;
                }
                var_type = *init_type;
            }
            if(let.type) {
                var_type = resolve_type(
                    *env.decl_collection, *let.type, callable_scope.module_scope,
                    callable_scope.generic_bounds, callable_scope.self_type);
            }
            callable_scope.locals.insert_or_replace(let.name, var_type);
            return true;
        },
        [&](const Stmt::Expr& expr_stmt) {
            return resolve_expr(env, expr_stmt.expr).has_value();
        },
        [&](const Stmt::If& if_stmt) {
            if(!resolve_expr(env, if_stmt.cond) || !resolve_stmts(env, if_stmt.then_body)) {
                return false;
            }
            return !if_stmt.else_body || resolve_stmts(env, *if_stmt.else_body);
        },
        [&](const Stmt::While& while_stmt) {
            return resolve_expr(env, while_stmt.cond) && resolve_stmts(env, while_stmt.body);
        },
        [&](const Stmt::Block& block) {
            return resolve_stmts(env, block.body);
        },
        [&](const Stmt::Return& return_stmt) {
            return !return_stmt.expr || resolve_expr(env, return_stmt.expr).has_value();
        },
        [&](const Stmt::LocalFunc& local_func) {
            return resolve_callable(env, env.decl_collection->funcs.at(local_func.item->id));
        }
    }, stmt->t);
}

// Nested functions are visible in the whole statement list that declares them
static bool resolve_stmts(ResolverEnv& env, const std::vector<std::shared_ptr<Stmt>>& stmts) {
    ScopeGuard locals_guard(env.callable_scope->locals);
    ScopeGuard funcs_guard(env.local_funcs);
    for(std::shared_ptr<Stmt> stmt: stmts) {
        if(!std::holds_alternative<Stmt::LocalFunc>(stmt->t)) {
            continue;
        }
        std::shared_ptr<Item> item = std::get<Stmt::LocalFunc>(stmt->t).item;
        const std::string& name = std::get<std::shared_ptr<Item::Func>>(item->t)->name;
        if(env.local_funcs.key_in_curr_scope(name)) {
            report_error_location(item->source_span);
            std::cerr << "Function " << name << " already defined in this block" << std::endl;
            return false;
        }
        env.local_funcs.insert(name, item->id);
    }
    for(std::shared_ptr<Stmt> stmt: stmts) {
        if(!resolve_stmt(env, stmt)) {
            return false;
        }
    }
    return true;
}

static bool resolve_callable(ResolverEnv& env, const FuncInfo& func_info) {
    if(!func_info.def->body) {
        return true;
    }
    std::shared_ptr<CallableScope> prev_scope = env.callable_scope;
    env.callable_scope = std::make_shared<CallableScope>();
    Defer d([&](){env.callable_scope = prev_scope;});

    CallableScope& callable_scope = *env.callable_scope;
    callable_scope.generic_bounds = generic_bounds_of(*env.decl_collection, func_info);
    callable_scope.self_type = self_type_of(*env.decl_collection, func_info);
    callable_scope.module_scope = func_info.scope;

    ScopeGuard params_guard(callable_scope.locals);
    for(const Item::Param& param: func_info.def->params) {
        ReceiverType param_type = unknown_type;
        if(!param.type) {
            // `self`
            param_type = callable_scope.self_type.value_or(unknown_type);
        } else {
            param_type = resolve_type(
                *env.decl_collection, *param.type, callable_scope.module_scope,
                callable_scope.generic_bounds, callable_scope.self_type);
        }
        callable_scope.locals.insert_or_replace(param.name, param_type);
    }
    return resolve_stmts(env, *func_info.def->body);
}

static bool resolve_items(
    ResolverEnv& env,
    const std::vector<std::shared_ptr<Item>>& items,
    std::shared_ptr<Scope> scope) {
    const DeclCollection& decls = *env.decl_collection;
    auto resolve_methods = [&](const std::vector<std::shared_ptr<Item>>& methods) {
        for(std::shared_ptr<Item> method: methods) {
            if(!resolve_callable(env, decls.funcs.at(method->id))) {
                return false;
            }
        }
        return true;
    };
    for(std::shared_ptr<Item> item: items) {
        bool result = std::visit(Overload{
            [&](const std::shared_ptr<Item::Func>&) {
                return resolve_callable(env, decls.funcs.at(item->id));
            },
            [&](const Item::Mod& mod) {
                return resolve_items(env, mod.items, decls.module_scopes.at(item->id));
            },
            [&](const Item::Struct&) {
                return true;
            },
            [&](const Item::Trait& trait_def) {
                return resolve_methods(trait_def.methods);
            },
            [&](const Item::Impl& impl_def) {
                return resolve_methods(impl_def.methods);
            },
            [&](const Item::Static& static_def) {
                // Initializers run outside of any function
                std::shared_ptr<CallableScope> prev_scope = env.callable_scope;
                env.callable_scope = std::make_shared<CallableScope>();
                env.callable_scope->module_scope = scope;
                Defer d([&](){env.callable_scope = prev_scope;});
                ScopeGuard guard(env.callable_scope->locals);
                return resolve_expr(env, static_def.init).has_value();
            }
        }, item->t);
        if(!result) {
            return false;
        }
    }
    return true;
}

bool resolve_references(Program* root, std::shared_ptr<DeclCollection> decl_collection) {
    ResolverEnv env{decl_collection, {}, nullptr};
    ScopeGuard root_funcs_guard(env.local_funcs);
    return resolve_items(env, root->items, decl_collection->root_scope);
}
