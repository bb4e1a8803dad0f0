#include "declaration_collector.hpp"
#include "pattern_matching_boilerplate.hpp"
#include <iostream>
#include <cassert>
#include "utils.hpp"

// Impls can name structs and traits declared after them, so they are linked once every module has
// been collected
struct PendingImpl {
    std::shared_ptr<Item> item;
    std::shared_ptr<Scope> scope;
    bool is_local;
};

struct CollectorEnv {
    std::shared_ptr<DeclCollection> decl_collection;
    std::vector<PendingImpl> pending_impls;
};

static std::string qualify(const std::string& prefix, const std::string& name) {
    if(prefix.empty()) {
        return name;
    }
    return prefix + "::" + name;
}

// Generated items are recorded so that later stages can skip them
static bool enter_item_locality(CollectorEnv& env, const Item& item, bool parent_local) {
    if(item.is_generated) {
        env.decl_collection->generated_spans.push_back(item.source_span);
    }
    return parent_local && !item.is_extern && !item.is_generated;
}

static bool declare_name(std::shared_ptr<Scope> scope, const std::string& name, const Item& item) {
    if(scope->names.contains(name)) {
        report_error_location(item.source_span);
        std::cerr << "Name " << qualify(scope->qualified_prefix, name) << " already defined" << std::endl;
        return false;
    }
    scope->names.emplace(name, item.id);
    return true;
}

static bool check_body_presence(const Item& item, const Item::Func& func, bool is_extern, bool body_required) {
    if(is_extern && func.body) {
        report_error_location(item.source_span);
        std::cerr << "Extern function " << func.name << " has a body" << std::endl;
        return false;
    }
    if(!is_extern && body_required && !func.body) {
        report_error_location(item.source_span);
        std::cerr << "Function " << func.name << " has no body" << std::endl;
        return false;
    }
    return true;
}

static bool register_func(CollectorEnv& env, FuncInfo func_info);

static bool collect_nested_funcs(
    CollectorEnv& env,
    const std::vector<std::shared_ptr<Stmt>>& body,
    const FuncInfo& outer) {
    for(std::shared_ptr<Stmt> stmt: body) {
        bool result = std::visit(Overload{
            [&](const Stmt::If& if_stmt) {
                if(!collect_nested_funcs(env, if_stmt.then_body, outer)) {
                    return false;
                }
                return !if_stmt.else_body || collect_nested_funcs(env, *if_stmt.else_body, outer);
            },
            [&](const Stmt::While& while_stmt) {
                return collect_nested_funcs(env, while_stmt.body, outer);
            },
            [&](const Stmt::Block& block) {
                return collect_nested_funcs(env, block.body, outer);
            },
            [&](const Stmt::LocalFunc& local_func) {
                std::shared_ptr<Item> item = local_func.item;
                bool is_local = enter_item_locality(env, *item, outer.is_local);
                auto func = std::get<std::shared_ptr<Item::Func>>(item->t);
                if(!check_body_presence(*item, *func, false, true)) {
                    return false;
                }
                return register_func(env, FuncInfo{
                    item->id, qualify(outer.qualified_name, func->name), FuncKind::Free,
                    is_local, func, std::nullopt, std::nullopt, outer.scope});
            },
            [&](const auto&) {return true;}
        }, stmt->t);
        if(!result) {
            return false;
        }
    }
    return true;
}

static bool register_func(CollectorEnv& env, FuncInfo func_info) {
    auto [it, inserted] = env.decl_collection->funcs.emplace(func_info.id, std::move(func_info));
    assert(inserted);
    const FuncInfo& registered = it->second;
    if(!registered.def->body) {
        return true;
    }
    return collect_nested_funcs(env, *registered.def->body, registered);
}

static bool collect_trait(
    CollectorEnv& env,
    std::shared_ptr<Item> item,
    const Item::Trait& trait_def,
    std::shared_ptr<Scope> scope,
    bool is_local) {
    TraitInfo trait_info{item->id, qualify(scope->qualified_prefix, trait_def.name), is_local, {}};
    for(std::shared_ptr<Item> method: trait_def.methods) {
        bool method_local = enter_item_locality(env, *method, is_local);
        auto func = std::get<std::shared_ptr<Item::Func>>(method->t);
        if(trait_info.methods.contains(func->name)) {
            report_error_location(method->source_span);
            std::cerr << "Method " << func->name << " already declared in trait " << trait_info.qualified_name << std::endl;
            return false;
        }
        if(!check_body_presence(*method, *func, item->is_extern, false)) {
            return false;
        }
        trait_info.methods.emplace(func->name, method->id);
        bool result = register_func(env, FuncInfo{
            method->id, qualify(trait_info.qualified_name, func->name), FuncKind::TraitMethod,
            method_local, func, item->id, std::nullopt, scope});
        if(!result) {
            return false;
        }
    }
    env.decl_collection->traits.emplace(item->id, std::move(trait_info));
    return true;
}

static bool collect_items(
    CollectorEnv& env,
    const std::vector<std::shared_ptr<Item>>& items,
    std::shared_ptr<Scope> scope,
    bool parent_local) {
    for(std::shared_ptr<Item> item: items) {
        bool is_local = enter_item_locality(env, *item, parent_local);
        bool result = std::visit(Overload{
            [&](const std::shared_ptr<Item::Func>& func) {
                if(!declare_name(scope, func->name, *item)) {
                    return false;
                }
                if(!check_body_presence(*item, *func, item->is_extern, true)) {
                    return false;
                }
                return register_func(env, FuncInfo{
                    item->id, qualify(scope->qualified_prefix, func->name), FuncKind::Free,
                    is_local, func, std::nullopt, std::nullopt, scope});
            },
            [&](const Item::Mod& mod) {
                if(!declare_name(scope, mod.name, *item)) {
                    return false;
                }
                std::shared_ptr<Scope> mod_scope = std::make_shared<Scope>(
                    Scope{qualify(scope->qualified_prefix, mod.name), {}, scope});
                env.decl_collection->module_scopes.emplace(item->id, mod_scope);
                return collect_items(env, mod.items, mod_scope, is_local);
            },
            [&](const Item::Struct& struct_def) {
                if(!declare_name(scope, struct_def.name, *item)) {
                    return false;
                }
                env.decl_collection->structs.emplace(item->id, StructInfo{
                    item->id, qualify(scope->qualified_prefix, struct_def.name), is_local, scope,
                    struct_def.fields, {}, {}});
                return true;
            },
            [&](const Item::Trait& trait_def) {
                if(!declare_name(scope, trait_def.name, *item)) {
                    return false;
                }
                return collect_trait(env, item, trait_def, scope, is_local);
            },
            [&](const Item::Impl&) {
                env.pending_impls.push_back(PendingImpl{item, scope, is_local});
                return true;
            },
            [&](const Item::Static& static_def) {
                if(!declare_name(scope, static_def.name, *item)) {
                    return false;
                }
                env.decl_collection->statics.insert(item->id);
                return true;
            }
        }, item->t);
        if(!result) {
            return false;
        }
    }
    return true;
}

static bool link_impl(CollectorEnv& env, const PendingImpl& pending) {
    DeclCollection& decls = *env.decl_collection;
    const Item::Impl& impl_def = std::get<Item::Impl>(pending.item->t);
    std::optional<NodeId> struct_id = resolve_item_path(decls, pending.scope, impl_def.type_path);
    if(!struct_id || !decls.structs.contains(*struct_id)) {
        report_error_location(pending.item->source_span);
        std::cerr << "Impl for unknown struct " << path_to_string(impl_def.type_path) << std::endl;
        return false;
    }
    std::optional<NodeId> trait_id;
    if(impl_def.trait_path) {
        trait_id = resolve_item_path(decls, pending.scope, *impl_def.trait_path);
        if(!trait_id || !decls.traits.contains(*trait_id)) {
            report_error_location(pending.item->source_span);
            std::cerr << "Impl of unknown trait " << path_to_string(*impl_def.trait_path) << std::endl;
            return false;
        }
    }
    StructInfo& struct_info = decls.structs.at(*struct_id);
    std::string method_prefix = struct_info.qualified_name;
    if(trait_id) {
        method_prefix = "<" + struct_info.qualified_name + " as " + decls.traits.at(*trait_id).qualified_name + ">";
        struct_info.trait_impls.push_back(pending.item->id);
    }

    ImplInfo impl_info{pending.item->id, *struct_id, trait_id, {}};
    for(std::shared_ptr<Item> method: impl_def.methods) {
        bool method_local = enter_item_locality(env, *method, pending.is_local);
        auto func = std::get<std::shared_ptr<Item::Func>>(method->t);
        if(!check_body_presence(*method, *func, pending.item->is_extern, true)) {
            return false;
        }
        if(impl_info.methods.contains(func->name) ||
           (!trait_id && struct_info.inherent_methods.contains(func->name))) {
            report_error_location(method->source_span);
            std::cerr << "Method " << func->name << " already defined for " << struct_info.qualified_name << std::endl;
            return false;
        }
        std::optional<NodeId> overridden_decl;
        if(trait_id) {
            const TraitInfo& trait_info = decls.traits.at(*trait_id);
            if(!trait_info.methods.contains(func->name)) {
                report_error_location(method->source_span);
                std::cerr << "Method " << func->name << " is not a member of trait " << trait_info.qualified_name << std::endl;
                return false;
            }
            overridden_decl = trait_info.methods.at(func->name);
        } else {
            struct_info.inherent_methods.emplace(func->name, method->id);
        }
        impl_info.methods.emplace(func->name, method->id);
        bool result = register_func(env, FuncInfo{
            method->id, method_prefix + "::" + func->name, FuncKind::ImplMethod,
            method_local, func, pending.item->id, overridden_decl, pending.scope});
        if(!result) {
            return false;
        }
    }
    decls.impls.emplace(pending.item->id, std::move(impl_info));
    return true;
}

bool collect_declarations(Program* root, std::shared_ptr<DeclCollection> decl_collection) {
    decl_collection->root_scope = std::make_shared<Scope>();
    CollectorEnv env{decl_collection, {}};
    if(!collect_items(env, root->items, decl_collection->root_scope, true)) {
        return false;
    }
    for(const PendingImpl& pending: env.pending_impls) {
        if(!link_impl(env, pending)) {
            return false;
        }
    }
    return true;
}
