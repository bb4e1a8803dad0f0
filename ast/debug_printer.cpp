#include "debug_printer.hpp"
#include "pattern_matching_boilerplate.hpp"
#include <iostream>

// Types
void print_path(const Path& path) {
    for (size_t i = 0; i < path.segments.size(); i++) {
        if (i > 0) std::cout << "::";
        std::cout << path.segments[i];
    }
}

void print_type(const TypeExpr& type) {
    std::visit(Overload{
        [&](const TypeExpr::Named& n) {
            std::cout << "Named{";
            print_path(n.path);
            std::cout << "}";
        },
        [&](const TypeExpr::DynTrait& d) {
            std::cout << "DynTrait{";
            print_path(d.trait_path);
            std::cout << "}";
        },
        [&](const TypeExpr::Ref& r) {
            std::cout << "Ref(";
            print_type(*r.inner);
            std::cout << ")";
        }
    }, type.t);
}

// Value expressions
void print_binop(BinOp op) {
    switch (op) {
        case BinOp::Add: std::cout << "Add"; break;
        case BinOp::Sub: std::cout << "Sub"; break;
        case BinOp::Mul: std::cout << "Mul"; break;
        case BinOp::Div: std::cout << "Div"; break;
        case BinOp::Geq: std::cout << "Geq"; break;
        case BinOp::Leq: std::cout << "Leq"; break;
        case BinOp::Eq:  std::cout << "Eq"; break;
        case BinOp::Neq: std::cout << "Neq"; break;
        case BinOp::Gt:  std::cout << "Gt"; break;
        case BinOp::Lt:  std::cout << "Lt"; break;
    }
}

static void print_args(const std::vector<std::shared_ptr<ValExpr>>& args) {
    std::cout << "args=[";
    for (size_t i = 0; i < args.size(); i++) {
        if (i > 0) std::cout << ", ";
        print_val_expr(*args[i]);
    }
    std::cout << "]";
}

void print_val_expr(const ValExpr& v) {
    std::cout << "#" << v.id << " ";
    std::visit(Overload{

        // --- Simple values ---
        [&](const ValExpr::VInt& x) {
            std::cout << "VInt{v=" << x.v << "}";
        },
        [&](const ValExpr::VBool& x) {
            std::cout << "VBool{v=" << (x.v ? "true" : "false") << "}";
        },
        [&](const ValExpr::VString& x) {
            std::cout << "VString{v=\"" << x.v << "\"}";
        },

        // --- Names ---
        [&](const ValExpr::VPath& p) {
            std::cout << "VPath{";
            print_path(p.path);
            std::cout << "}";
        },

        // --- Calls ---
        [&](const ValExpr::Call& c) {
            std::cout << "Call{callee=";
            print_val_expr(*c.callee);
            std::cout << ", ";
            print_args(c.args);
            std::cout << "}";
        },
        [&](const ValExpr::MethodCall& m) {
            std::cout << "MethodCall{receiver=";
            print_val_expr(*m.receiver);
            std::cout << ", method=" << m.method << ", ";
            print_args(m.args);
            std::cout << "}";
        },

        // --- Struct field access ---
        [&](const ValExpr::Field& f) {
            std::cout << "Field{base=";
            print_val_expr(*f.base);
            std::cout << ", field=" << f.field << "}";
        },

        // --- Assignment ---
        [&](const ValExpr::Assignment& a) {
            std::cout << "Assignment{lhs=";
            print_val_expr(*a.lhs);
            std::cout << ", rhs=";
            print_val_expr(*a.rhs);
            std::cout << "}";
        },

        // --- Operators ---
        [&](const ValExpr::BinOpExpr& b) {
            std::cout << "BinOpExpr{lhs=";
            print_val_expr(*b.lhs);
            std::cout << ", op=";
            print_binop(b.op);
            std::cout << ", rhs=";
            print_val_expr(*b.rhs);
            std::cout << "}";
        },
        [&](const ValExpr::UnOpExpr& u) {
            std::cout << "UnOpExpr{op=" << (u.op == UnOp::Neg ? "Neg" : "Ref") << ", operand=";
            print_val_expr(*u.operand);
            std::cout << "}";
        }
    }, v.t);
}

static void print_body(const std::vector<std::shared_ptr<Stmt>>& body) {
    for (const auto& stmt : body) {
        print_stmt(*stmt);
    }
}

void print_stmt(const Stmt& s) {
    std::visit(Overload{

        [&](const Stmt::Let& l) {
            std::cout << "Let{name=" << l.name;
            if (l.type) {
                std::cout << ", type=";
                print_type(*l.type);
            }
            if (l.init) {
                std::cout << ", init=";
                print_val_expr(*l.init);
            }
            std::cout << "}\n";
        },

        [&](const Stmt::Expr& e) {
            std::cout << "Expr{";
            print_val_expr(*e.expr);
            std::cout << "}\n";
        },

        [&](const Stmt::If& i) {
            std::cout << "If{cond=";
            print_val_expr(*i.cond);
            std::cout << "}\n";

            std::cout << "Then:\n";
            print_body(i.then_body);

            if (i.else_body) {
                std::cout << "Else:\n";
                print_body(*i.else_body);
            }
        },

        [&](const Stmt::While& w) {
            std::cout << "While{cond=";
            print_val_expr(*w.cond);
            std::cout << "}\n";

            std::cout << "Body:\n";
            print_body(w.body);
        },

        [&](const Stmt::Block& b) {
            std::cout << "Block:\n";
            print_body(b.body);
        },

        [&](const Stmt::Return& r) {
            std::cout << "Return{";
            if (r.expr) {
                std::cout << "expr=";
                print_val_expr(*r.expr);
            }
            std::cout << "}\n";
        },

        [&](const Stmt::LocalFunc& f) {
            std::cout << "LocalFunc ";
            print_item(*f.item);
        }

    }, s.t);
}

void print_func(const Item::Func& f) {
    std::cout << "Func{name=" << f.name;
    if (f.return_type) {
        std::cout << ", return_type=";
        print_type(*f.return_type);
    }
    std::cout << "}\n";

    if (!f.generics.empty()) {
        std::cout << "Generics:\n";
        for (const GenericParam& generic : f.generics) {
            std::cout << generic.name << ": [";
            for (size_t i = 0; i < generic.bounds.size(); i++) {
                if (i > 0) std::cout << ", ";
                print_path(generic.bounds[i]);
            }
            std::cout << "]\n";
        }
    }

    std::cout << "Params:\n";
    for (const Item::Param& param : f.params) {
        std::cout << "Param{name=" << param.name;
        if (param.type) {
            std::cout << ", type=";
            print_type(*param.type);
        }
        std::cout << "}\n";
    }

    if (f.body) {
        std::cout << "Body:\n";
        print_body(*f.body);
    }
}

static void print_members(const std::vector<std::shared_ptr<Item>>& members) {
    std::cout << "Members:\n";
    for (const auto& member : members) {
        print_item(*member);
    }
}

void print_item(const Item& item) {
    std::cout << "#" << item.id << " ";
    if (item.is_generated) std::cout << "generated ";
    if (item.is_extern) std::cout << "extern ";
    std::visit(Overload{
        [&](const std::shared_ptr<Item::Func>& f) {
            print_func(*f);
        },
        [&](const Item::Mod& m) {
            std::cout << "Mod{name=" << m.name << "}\n";
            for (const auto& inner : m.items) {
                print_item(*inner);
            }
            std::cout << "EndMod{name=" << m.name << "}\n";
        },
        [&](const Item::Struct& s) {
            std::cout << "Struct{name=" << s.name << "}\n";
            for (const auto& [name, type] : s.fields) {
                std::cout << name << ": ";
                print_type(type);
                std::cout << "\n";
            }
        },
        [&](const Item::Trait& t) {
            std::cout << "Trait{name=" << t.name << "}\n";
            print_members(t.methods);
        },
        [&](const Item::Impl& i) {
            std::cout << "Impl{type=";
            print_path(i.type_path);
            if (i.trait_path) {
                std::cout << ", trait=";
                print_path(*i.trait_path);
            }
            std::cout << "}\n";
            print_members(i.methods);
        },
        [&](const Item::Static& s) {
            std::cout << "Static{name=" << s.name << ", init=";
            print_val_expr(*s.init);
            std::cout << "}\n";
        }
    }, item.t);
}

void print_program(const Program& program) {
    std::cout << "Program\n";
    for (const auto& item : program.items) {
        print_item(*item);
    }
}
