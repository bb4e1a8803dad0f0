#include <iostream>
#include <string>
#include <filesystem>
#include <cstdio>
#include "top_level.hpp"
#include "parse_file.hpp"
#include "debug_printer.hpp"
#include "semantic_analyzer.hpp"
#include "semantic_query.hpp"
#include "call_graph_builder.hpp"
#include "text_dump.hpp"
#include "dot_renderer.hpp"
#include "defer.cpp"

#include <boost/program_options.hpp>
namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help", "produce help message")
        ("input-file", po::value<std::string>()->required(), "program to analyze")
        ("output", po::value<std::string>()->default_value(CALLMAP_DEFAULT_DOT_PATH), "where the Graphviz diagram is written")
        ("no-dump", po::bool_switch(), "don't print the found callables and calls")
        ("print-ast", po::bool_switch(), "print the parsed program");
    po::positional_options_description positional;
    positional.add("input-file", 1);
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        if(vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        po::notify(vm);
    } catch(const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    std::filesystem::path input_file(vm["input-file"].as<std::string>());
    if (!std::filesystem::exists(input_file)) {
        std::cerr << "Error: Input file not found: " << input_file << "\n";
        return 1;
    }

    FILE* input = fopen(input_file.c_str(), "r");
    if (!input) {
        std::cerr << "Error: Cannot open input file " << input_file << "\n";
        return 1;
    }

    Program* program = parse_file(input);
    if (!program) {
        return 1;
    }
    Defer d([&](){delete program;});

    if (vm["print-ast"].as<bool>()) {
        print_program(*program);
    }

    std::shared_ptr<DeclCollection> decl_collection = analyze_program(program);
    if (!decl_collection) {
        std::cerr << "Semantic analysis failed.\n";
        return 1;
    }

    SemanticQuery query(decl_collection);
    CallGraph graph;
    BuildDiagnostics diagnostics;
    build_call_graph(program, query, graph, diagnostics);
    post_process(graph);

    if (!vm["no-dump"].as<bool>()) {
        dump_call_graph(graph, std::cout);
    }

    std::string output_path = vm["output"].as<std::string>();
    CallGraphView view(graph, input_file.stem().string());
    if (!write_dot_file(view, output_path)) {
        return 1;
    }
    return 0;
}
