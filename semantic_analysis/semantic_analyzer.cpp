#include "semantic_analyzer.hpp"
#include "declaration_collector.hpp"
#include "reference_resolver.hpp"

std::shared_ptr<DeclCollection> analyze_program(Program* root) {
    // 1. Collect the declarations and link the impls
    std::shared_ptr<DeclCollection> decl_collection = std::make_shared<DeclCollection>();
    if(!collect_declarations(root, decl_collection)) {
        return nullptr;
    }
    // 2. Resolve every reference to a callable
    if(!resolve_references(root, decl_collection)) {
        return nullptr;
    }
    return decl_collection;
}
