#pragma once
#include "types.hpp"
#include <cstdint>

// Identity of a syntax construct. Assigned once per node after parsing and never reused
using NodeId = uint32_t;

// Struct for storing additional information for error messages
struct SourceLoc {
    int line;
    int char_no;
};

struct SourceSpan {
    SourceLoc start;
    SourceLoc end;
};

enum class BinOp { Add, Sub, Mul, Div, Geq, Leq, Eq, Neq, Gt, Lt };

enum class UnOp { Neg, Ref };

struct ValExpr {
    // Simple values
    struct VInt { long v; };
    struct VBool { bool v; };
    struct VString { std::string v; };

    // Named values: variables, `self`, functions, `Type::method` and `Trait::method`
    struct VPath { Path path; };

    // Calls. The callee of a [Call] is any expression, usually a [VPath]
    struct Call {
        std::shared_ptr<ValExpr> callee;
        std::vector<std::shared_ptr<ValExpr>> args;
    };
    struct MethodCall {
        std::shared_ptr<ValExpr> receiver;
        std::string method;
        std::vector<std::shared_ptr<ValExpr>> args;
    };

    // Accesses
    struct Field { std::shared_ptr<ValExpr> base;
                   std::string field; };

    // Assignments
    struct Assignment {
        std::shared_ptr<ValExpr> lhs;
        std::shared_ptr<ValExpr> rhs;
    };

    // Operations
    struct BinOpExpr { std::shared_ptr<ValExpr> lhs; BinOp op; std::shared_ptr<ValExpr> rhs; };
    struct UnOpExpr { UnOp op; std::shared_ptr<ValExpr> operand; };

    NodeId id = 0;
    SourceSpan source_span;
    std::variant<VInt, VBool, VString, VPath, Call, MethodCall, Field, Assignment,
    BinOpExpr, UnOpExpr> t;
};
