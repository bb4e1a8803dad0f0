#pragma once
#include "semantic_structs.hpp"
#include "ast_walkers.hpp"

struct DeclRef {
    NodeId id;
    bool is_local;
};

// What a syntax node defines, as far as the call graph is concerned
struct Classification {
    struct FunctionDefinition {
        NodeId id;
        std::string qualified_name;
    };
    // A trait method. With a default body it is a definition as well
    struct MethodDeclaration {
        NodeId id;
        std::string qualified_name;
        bool has_default_body;
    };
    struct MethodImplementation {
        NodeId id;
        std::string qualified_name;
        // Not present for inherent methods
        std::optional<DeclRef> overridden_declaration;
    };
    struct Other {};
    std::variant<FunctionDefinition, MethodDeclaration, MethodImplementation, Other> t;
};

// Read only view of the front end results. Only definitions local to the unit (not extern and not
// generated) are classified, everything else is [Other]
class SemanticQuery {
private:
    std::shared_ptr<DeclCollection> decl_collection;
public:
    explicit SemanticQuery(std::shared_ptr<DeclCollection> decl_collection);
    Classification classify(const SyntaxNode& node) const;
    // Present for path expressions and method calls that refer to a function or a method
    std::optional<CallTarget> resolve_call_reference(const SyntaxNode& node) const;
    bool is_generated_code(const SourceSpan& span) const;
};
