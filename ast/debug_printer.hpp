#pragma once
#include "top_level.hpp"

void print_path(const Path& path);
void print_type(const TypeExpr& type);
void print_binop(BinOp op);
void print_val_expr(const ValExpr& v);
void print_stmt(const Stmt& s);
void print_func(const Item::Func& f);
void print_item(const Item& item);
void print_program(const Program& program);
