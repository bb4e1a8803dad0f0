#pragma once
#include "top_level.hpp"

// Gives every item, statement and expression of [root] its identity, in pre-order starting at 1
void number_program_nodes(Program* root);
