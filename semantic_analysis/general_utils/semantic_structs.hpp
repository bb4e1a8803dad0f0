#pragma once
#include "top_level.hpp"
#include <unordered_map>
#include <unordered_set>

// Results of the front end. Filled by the declaration collector and the reference resolver, then
// only read through [SemanticQuery].

// Names visible in a module. Lookups that miss continue in the parent module
struct Scope {
    // "" at the root, "a::b" inside module a::b
    std::string qualified_prefix;
    std::unordered_map<std::string, NodeId> names;
    std::shared_ptr<Scope> parent;
};

enum class FuncKind { Free, TraitMethod, ImplMethod };

struct FuncInfo {
    NodeId id;
    std::string qualified_name;
    FuncKind kind;
    // False for extern definitions and anything inside generated code
    bool is_local;
    std::shared_ptr<Item::Func> def;
    // Trait or impl the method belongs to
    std::optional<NodeId> owner;
    // For impl methods of trait impls, the trait declaration the method implements
    std::optional<NodeId> overridden_decl;
    // Module scope the signature is written in
    std::shared_ptr<Scope> scope;
};

struct StructInfo {
    NodeId id;
    std::string qualified_name;
    bool is_local;
    std::shared_ptr<Scope> scope;
    std::vector<std::pair<std::string, TypeExpr>> fields;
    std::unordered_map<std::string, NodeId> inherent_methods;
    // Impl ids, in source order
    std::vector<NodeId> trait_impls;
};

struct TraitInfo {
    NodeId id;
    std::string qualified_name;
    bool is_local;
    // Method name to declaration id
    std::unordered_map<std::string, NodeId> methods;
};

struct ImplInfo {
    NodeId id;
    NodeId struct_id;
    std::optional<NodeId> trait_id;
    // Method name to definition id
    std::unordered_map<std::string, NodeId> methods;
};

// What a path expression or a method call refers to, when it refers to a callable
struct CallTarget {
    // The callee is known exactly
    struct ResolvedTarget { NodeId callee_id; bool is_local; };
    // Only the trait declaration is known, the callee depends on the receiver at runtime
    struct DispatchTarget { NodeId declaration_id; bool is_local; };
    std::variant<ResolvedTarget, DispatchTarget> t;
};

// Type of a value used as a method call receiver
struct ReceiverType {
    struct Unknown {};
    struct Struct { NodeId struct_id; };
    // `dyn Trait`, a generic parameter with bounds or `self` inside a trait
    struct TraitObject { std::vector<NodeId> trait_ids; };
    std::variant<Unknown, Struct, TraitObject> t;
};

using GenericBounds = std::unordered_map<std::string, std::vector<NodeId>>;

struct DeclCollection {
    std::shared_ptr<Scope> root_scope;
    std::unordered_map<NodeId, FuncInfo> funcs;
    std::unordered_map<NodeId, std::shared_ptr<Scope>> module_scopes;
    std::unordered_map<NodeId, StructInfo> structs;
    std::unordered_map<NodeId, TraitInfo> traits;
    std::unordered_map<NodeId, ImplInfo> impls;
    std::unordered_set<NodeId> statics;
    // Spans of `#[generated]` items
    std::vector<SourceSpan> generated_spans;
    // Keyed by the id of the path expression or method call
    std::unordered_map<NodeId, CallTarget> call_targets;
};
