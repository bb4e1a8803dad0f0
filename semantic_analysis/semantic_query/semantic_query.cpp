#include "semantic_query.hpp"
#include "utils.hpp"

SemanticQuery::SemanticQuery(std::shared_ptr<DeclCollection> decl_collection)
    : decl_collection(std::move(decl_collection)) {}

Classification SemanticQuery::classify(const SyntaxNode& node) const {
    const Classification other{Classification::Other{}};
    if(!std::holds_alternative<std::shared_ptr<Item>>(node)) {
        return other;
    }
    NodeId id = syntax_node_id(node);
    if(!decl_collection->funcs.contains(id)) {
        return other;
    }
    const FuncInfo& func_info = decl_collection->funcs.at(id);
    if(!func_info.is_local) {
        return other;
    }
    switch(func_info.kind) {
        case FuncKind::Free:
            return Classification{Classification::FunctionDefinition{id, func_info.qualified_name}};
        case FuncKind::TraitMethod:
            return Classification{Classification::MethodDeclaration{
                id, func_info.qualified_name, func_info.def->body.has_value()}};
        case FuncKind::ImplMethod: {
            std::optional<DeclRef> overridden_declaration;
            if(func_info.overridden_decl) {
                NodeId decl_id = *func_info.overridden_decl;
                overridden_declaration = DeclRef{decl_id, decl_collection->funcs.at(decl_id).is_local};
            }
            return Classification{Classification::MethodImplementation{
                id, func_info.qualified_name, overridden_declaration}};
        }
    }
    return other;
}

std::optional<CallTarget> SemanticQuery::resolve_call_reference(const SyntaxNode& node) const {
    if(!std::holds_alternative<std::shared_ptr<ValExpr>>(node)) {
        return std::nullopt;
    }
    auto it = decl_collection->call_targets.find(syntax_node_id(node));
    if(it == decl_collection->call_targets.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SemanticQuery::is_generated_code(const SourceSpan& span) const {
    for(const SourceSpan& generated_span: decl_collection->generated_spans) {
        if(span_contains(generated_span, span)) {
            return true;
        }
    }
    return false;
}
