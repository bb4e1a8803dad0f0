#pragma once
#include "semantic_structs.hpp"

// Runs the front end checks in order. nullptr if any of them fails, the errors are already reported
std::shared_ptr<DeclCollection> analyze_program(Program* root);
