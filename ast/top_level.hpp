#pragma once
#include "stmts.hpp"

struct Item {
    struct Param {
        std::string name;
        // Not present for `self`
        std::optional<TypeExpr> type;
    };
    struct Func {
        std::string name;
        std::vector<GenericParam> generics;
        std::vector<Param> params;
        std::optional<TypeExpr> return_type;
        // Not present for method declarations and extern functions
        std::optional<std::vector<std::shared_ptr<Stmt>>> body;
    };
    struct Mod {
        std::string name;
        std::vector<std::shared_ptr<Item>> items;
    };
    struct Struct {
        std::string name;
        std::vector<std::pair<std::string, TypeExpr>> fields;
    };
    // Every member is a Func item
    struct Trait {
        std::string name;
        std::vector<std::shared_ptr<Item>> methods;
    };
    struct Impl {
        Path type_path;
        std::optional<Path> trait_path;
        std::vector<std::shared_ptr<Item>> methods;
    };
    // Initializer code that runs outside of any function
    struct Static {
        std::string name;
        std::optional<TypeExpr> type;
        std::shared_ptr<ValExpr> init;
    };
    NodeId id = 0;
    SourceSpan source_span;
    // Defined outside of the analyzed unit, only the signature is known
    bool is_extern = false;
    // Marked with `#[generated]`, skipped by every analysis
    bool is_generated = false;
    std::variant<std::shared_ptr<Func>, Mod, Struct, Trait, Impl, Static> t;
};

struct Program {
    std::vector<std::shared_ptr<Item>> items;
};
