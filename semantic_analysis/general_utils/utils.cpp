#include <iostream>
#include <cassert>
#include "utils.hpp"
#include "pattern_matching_boilerplate.hpp"

void report_error_location(const SourceSpan& span) {
    std::cerr << "Error between line " << span.start.line << ", column " << span.start.char_no
    << " and line " << span.end.line << ", column " << span.end.char_no << std::endl;
}

void report_warning_location(const SourceSpan& span) {
    std::cerr << "Warning between line " << span.start.line << ", column " << span.start.char_no
    << " and line " << span.end.line << ", column " << span.end.char_no << std::endl;
}

std::string path_to_string(const Path& path) {
    std::string out;
    for(const std::string& segment: path.segments) {
        if(!out.empty()) {
            out += "::";
        }
        out += segment;
    }
    return out;
}

static bool loc_before_or_at(const SourceLoc& a, const SourceLoc& b) {
    return a.line < b.line || (a.line == b.line && a.char_no <= b.char_no);
}

bool span_contains(const SourceSpan& outer, const SourceSpan& inner) {
    return loc_before_or_at(outer.start, inner.start) && loc_before_or_at(inner.end, outer.end);
}

std::optional<NodeId> lookup_scoped_name(std::shared_ptr<Scope> scope, const std::string& name) {
    for(; scope != nullptr; scope = scope->parent) {
        if(scope->names.contains(name)) {
            return scope->names.at(name);
        }
    }
    return std::nullopt;
}

// Only the first segment is looked up through enclosing modules, the rest must name members of
// the module named so far
std::optional<NodeId> resolve_item_path(
    const DeclCollection& decl_collection,
    std::shared_ptr<Scope> scope,
    const Path& path) {
    assert(!path.segments.empty());
    std::optional<NodeId> item_id = lookup_scoped_name(scope, path.segments[0]);
    for(size_t i = 1; i < path.segments.size(); i++) {
        if(!item_id || !decl_collection.module_scopes.contains(*item_id)) {
            return std::nullopt;
        }
        const Scope& mod_scope = *decl_collection.module_scopes.at(*item_id);
        if(!mod_scope.names.contains(path.segments[i])) {
            return std::nullopt;
        }
        item_id = mod_scope.names.at(path.segments[i]);
    }
    return item_id;
}

// Inherent methods first, then methods of trait impls, then default methods of implemented traits
std::optional<NodeId> find_struct_method(
    const DeclCollection& decl_collection,
    NodeId struct_id,
    const std::string& method) {
    const StructInfo& struct_info = decl_collection.structs.at(struct_id);
    if(struct_info.inherent_methods.contains(method)) {
        return struct_info.inherent_methods.at(method);
    }
    for(NodeId impl_id: struct_info.trait_impls) {
        const ImplInfo& impl_info = decl_collection.impls.at(impl_id);
        if(impl_info.methods.contains(method)) {
            return impl_info.methods.at(method);
        }
    }
    for(NodeId impl_id: struct_info.trait_impls) {
        const ImplInfo& impl_info = decl_collection.impls.at(impl_id);
        const TraitInfo& trait_info = decl_collection.traits.at(*impl_info.trait_id);
        if(!trait_info.methods.contains(method)) {
            continue;
        }
        NodeId decl_id = trait_info.methods.at(method);
        if(decl_collection.funcs.at(decl_id).def->body) {
            return decl_id;
        }
    }
    return std::nullopt;
}

std::optional<NodeId> find_trait_method(
    const DeclCollection& decl_collection,
    const std::vector<NodeId>& trait_ids,
    const std::string& method) {
    for(NodeId trait_id: trait_ids) {
        const TraitInfo& trait_info = decl_collection.traits.at(trait_id);
        if(trait_info.methods.contains(method)) {
            return trait_info.methods.at(method);
        }
    }
    return std::nullopt;
}

CallTarget resolved_call_target(const DeclCollection& decl_collection, NodeId func_id) {
    return CallTarget{CallTarget::ResolvedTarget{
        func_id, decl_collection.funcs.at(func_id).is_local}};
}

CallTarget dispatch_call_target(const DeclCollection& decl_collection, NodeId decl_id) {
    return CallTarget{CallTarget::DispatchTarget{
        decl_id, decl_collection.funcs.at(decl_id).is_local}};
}

GenericBounds generic_bounds_of(const DeclCollection& decl_collection, const FuncInfo& func_info) {
    GenericBounds generic_bounds;
    for(const GenericParam& generic_param: func_info.def->generics) {
        std::vector<NodeId>& trait_ids = generic_bounds[generic_param.name];
        for(const Path& bound: generic_param.bounds) {
            std::optional<NodeId> trait_id = resolve_item_path(decl_collection, func_info.scope, bound);
            // Bounds on traits outside of the unit still make the parameter a trait object
            if(trait_id && decl_collection.traits.contains(*trait_id)) {
                trait_ids.push_back(*trait_id);
            }
        }
    }
    return generic_bounds;
}

std::optional<ReceiverType> self_type_of(const DeclCollection& decl_collection, const FuncInfo& func_info) {
    switch(func_info.kind) {
        case FuncKind::Free:
            return std::nullopt;
        case FuncKind::TraitMethod:
            return ReceiverType{ReceiverType::TraitObject{{*func_info.owner}}};
        case FuncKind::ImplMethod:
            return ReceiverType{ReceiverType::Struct{decl_collection.impls.at(*func_info.owner).struct_id}};
    }
    return std::nullopt;
}

// Types naming anything other than a struct, a trait, a bounded generic parameter or `Self` (eg
// primitives) are unknown
ReceiverType resolve_type(
    const DeclCollection& decl_collection,
    const TypeExpr& type,
    std::shared_ptr<Scope> scope,
    const GenericBounds& generic_bounds,
    const std::optional<ReceiverType>& self_type) {
    auto trait_object_of = [&](const Path& path) -> ReceiverType {
        std::optional<NodeId> item_id = resolve_item_path(decl_collection, scope, path);
        if(item_id && decl_collection.traits.contains(*item_id)) {
            return ReceiverType{ReceiverType::TraitObject{{*item_id}}};
        }
        return ReceiverType{ReceiverType::Unknown{}};
    };
    return std::visit(Overload{
        [&](const TypeExpr::Ref& ref) {
            return resolve_type(decl_collection, *ref.inner, scope, generic_bounds, self_type);
        },
        [&](const TypeExpr::DynTrait& dyn_trait) {
            return trait_object_of(dyn_trait.trait_path);
        },
        [&](const TypeExpr::Named& named) {
            if(named.path.segments.size() == 1) {
                const std::string& name = named.path.segments[0];
                if(name == "Self") {
                    return self_type.value_or(ReceiverType{ReceiverType::Unknown{}});
                }
                if(generic_bounds.contains(name)) {
                    return ReceiverType{ReceiverType::TraitObject{generic_bounds.at(name)}};
                }
            }
            std::optional<NodeId> item_id = resolve_item_path(decl_collection, scope, named.path);
            if(item_id && decl_collection.structs.contains(*item_id)) {
                return ReceiverType{ReceiverType::Struct{*item_id}};
            }
            // Bare trait names are trait objects
            return trait_object_of(named.path);
        }
    }, type.t);
}

ReceiverType return_type_of(const DeclCollection& decl_collection, NodeId func_id) {
    const FuncInfo& func_info = decl_collection.funcs.at(func_id);
    if(!func_info.def->return_type) {
        return ReceiverType{ReceiverType::Unknown{}};
    }
    return resolve_type(
        decl_collection,
        *func_info.def->return_type,
        func_info.scope,
        generic_bounds_of(decl_collection, func_info),
        self_type_of(decl_collection, func_info));
}
