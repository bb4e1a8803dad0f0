#pragma once
#include "semantic_structs.hpp"

// Records a [CallTarget] for every path expression and method call that refers to a function or a
// method. Fails on names that do not resolve and on methods missing from a known receiver type
bool resolve_references(Program* root, std::shared_ptr<DeclCollection> decl_collection);
