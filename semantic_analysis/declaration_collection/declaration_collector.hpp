#pragma once
#include "semantic_structs.hpp"

bool collect_declarations(Program* root, std::shared_ptr<DeclCollection> decl_collection);
