#pragma once
#include "expr.hpp"

struct Item;

// Everything that can appear as a part of a body. Nested function definitions are statements too,
// they are visible in the whole statement list that contains them
struct Stmt {
    struct Let {
        std::string name;
        std::optional<TypeExpr> type;
        // nullptr when the variable is declared without an initializer
        std::shared_ptr<ValExpr> init;
    };
    struct Expr { std::shared_ptr<ValExpr> expr; };
    struct If {
        std::shared_ptr<ValExpr> cond;
        std::vector<std::shared_ptr<Stmt>> then_body;
        std::optional<std::vector<std::shared_ptr<Stmt>>> else_body;
    };
    struct While {
        std::shared_ptr<ValExpr> cond;
        std::vector<std::shared_ptr<Stmt>> body;
    };
    struct Block { std::vector<std::shared_ptr<Stmt>> body; };
    // [expr] is nullptr for a bare `return;`
    struct Return { std::shared_ptr<ValExpr> expr; };
    struct LocalFunc { std::shared_ptr<Item> item; };
    NodeId id = 0;
    SourceSpan source_span;
    std::variant<Let, Expr, If, While, Block, Return, LocalFunc> t;
};
