#pragma once
#include <cstdio>
#include "top_level.hpp"

// Parses the whole of [input] and numbers the nodes of the resulting tree. Closes [input].
// Returns nullptr after reporting on a lexical or syntax error
Program* parse_file(FILE* input);
