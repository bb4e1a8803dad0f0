#pragma once
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <memory>

// A name as written in the source, possibly qualified through modules (eg `shapes::Circle::new`)
struct Path {
    std::vector<std::string> segments;
};

// [TypeExpr] represents types that can be present textually in parameters, lets, fields and
// return types. There is no type checking, types are only used to find the receiver of a method call
struct TypeExpr {
    // Structs, traits written without `dyn`, generic parameters, `Self` and primitives alike
    struct Named { Path path; };
    struct DynTrait { Path trait_path; };
    struct Ref { std::shared_ptr<TypeExpr> inner; };
    std::variant<Named, DynTrait, Ref> t;
};

struct GenericParam {
    std::string name;
    std::vector<Path> bounds;
};
