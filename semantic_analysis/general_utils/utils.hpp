#pragma once
#include "top_level.hpp"
#include "semantic_structs.hpp"

void report_error_location(const SourceSpan& span);
void report_warning_location(const SourceSpan& span);
std::string path_to_string(const Path& path);
bool span_contains(const SourceSpan& outer, const SourceSpan& inner);

std::optional<NodeId> lookup_scoped_name(std::shared_ptr<Scope> scope, const std::string& name);
std::optional<NodeId> resolve_item_path(
    const DeclCollection& decl_collection,
    std::shared_ptr<Scope> scope,
    const Path& path);

std::optional<NodeId> find_struct_method(
    const DeclCollection& decl_collection,
    NodeId struct_id,
    const std::string& method);
std::optional<NodeId> find_trait_method(
    const DeclCollection& decl_collection,
    const std::vector<NodeId>& trait_ids,
    const std::string& method);
CallTarget resolved_call_target(const DeclCollection& decl_collection, NodeId func_id);
CallTarget dispatch_call_target(const DeclCollection& decl_collection, NodeId decl_id);

GenericBounds generic_bounds_of(const DeclCollection& decl_collection, const FuncInfo& func_info);
std::optional<ReceiverType> self_type_of(const DeclCollection& decl_collection, const FuncInfo& func_info);
ReceiverType resolve_type(
    const DeclCollection& decl_collection,
    const TypeExpr& type,
    std::shared_ptr<Scope> scope,
    const GenericBounds& generic_bounds,
    const std::optional<ReceiverType>& self_type);
ReceiverType return_type_of(const DeclCollection& decl_collection, NodeId func_id);
