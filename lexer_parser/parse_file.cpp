#include <iostream>
#include "parse_file.hpp"
#include "node_numbering.hpp"
#include "parser.tab.hpp"
#include "lex.yy.h"

extern Program* program_root;

Program* parse_file(FILE* input) {
    program_root = nullptr;
    yyscan_t scanner;
    if (yylex_init(&scanner)) {
        std::cerr << "Error: Could not initialize scanner.\n";
        fclose(input);
        return nullptr;
    }
    yyset_in(input, scanner);

    if (yyparse(scanner) != 0) {
        std::cerr << "Parse failed.\n";
        yylex_destroy(scanner);
        fclose(input);
        return nullptr;
    }
    fclose(input);
    yylex_destroy(scanner);
    if (!program_root) {
        std::cerr << "Error: No program produced by parser.\n";
        return nullptr;
    }
    number_program_nodes(program_root);
    return program_root;
}
