#include <algorithm>
#include <cassert>
#include <cstdio>
#include <fstream>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <map>
#include <ranges>

#include "analyzed_program.hpp"
#include "nlohmann/json.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

struct Expectation {
    bool expect_failure = false;
    std::optional<std::vector<std::string>> callables;
    std::optional<std::vector<std::string>> method_decls;
    std::optional<std::vector<NamedEdge>> definite;
    std::optional<std::vector<NamedEdge>> potential;
    std::map<std::string, std::vector<std::string>> implementers;
    std::optional<size_t> dropped_calls;
    std::vector<std::string> dot_contains;
    std::vector<std::string> dump_contains;
};

static void print_vec(const std::vector<std::string>& vec) {
    if(vec.size() == 0) {
        std::cerr << "[]" << std::endl;
        return;
    }
    std::cerr << "[" << vec[0];
    for(const std::string& ele: std::views::drop(vec, 1)) {
        std::cerr << ", " << ele;
    }
    std::cerr << "]" << std::endl;
}

static std::vector<std::string> edge_strings(const std::vector<NamedEdge>& edges) {
    std::vector<std::string> out;
    for(const auto& [caller, callee]: edges) {
        out.push_back(caller + " -> " + callee);
    }
    return out;
}

static std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    return std::string((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
}

static std::vector<std::string> sorted_strings(const json& arr) {
    std::vector<std::string> out = arr.get<std::vector<std::string>>();
    std::sort(out.begin(), out.end());
    return out;
}

static std::vector<NamedEdge> sorted_edges(const json& arr) {
    std::vector<NamedEdge> out;
    for(const auto& pair: arr) {
        out.emplace_back(pair.at(0).get<std::string>(), pair.at(1).get<std::string>());
    }
    std::sort(out.begin(), out.end());
    return out;
}

static Expectation load_expectation(const fs::path& p) {
    json o = json::parse(slurp(p));
    Expectation e;
    e.expect_failure = o.value("expect_failure", false);
    if(o.contains("callables")) e.callables = sorted_strings(o.at("callables"));
    if(o.contains("method_decls")) e.method_decls = sorted_strings(o.at("method_decls"));
    if(o.contains("definite")) e.definite = sorted_edges(o.at("definite"));
    if(o.contains("potential")) e.potential = sorted_edges(o.at("potential"));
    if(o.contains("implementers")) {
        for(const auto& [decl, impls]: o.at("implementers").items()) {
            e.implementers[decl] = sorted_strings(impls);
        }
    }
    if(o.contains("dropped_calls")) e.dropped_calls = o.at("dropped_calls").get<size_t>();
    if(o.contains("dot_contains")) e.dot_contains = o.at("dot_contains").get<std::vector<std::string>>();
    if(o.contains("dump_contains")) e.dump_contains = o.at("dump_contains").get<std::vector<std::string>>();
    return e;
}

static bool check_equal(
    const fs::path& case_dir,
    const std::string& what,
    const std::vector<std::string>& expected,
    const std::vector<std::string>& got) {
    if(expected == got) {
        return true;
    }
    std::cerr << "------Test case-------" << std::endl;
    std::cerr << "Filename: " << case_dir.string() << std::endl;
    std::cerr << "Checking " << what << std::endl;
    std::cerr << "Expected: ";
    print_vec(expected);
    std::cerr << "Present: ";
    print_vec(got);
    return false;
}

static bool check_contains(
    const fs::path& case_dir,
    const std::string& what,
    const std::string& output,
    const std::vector<std::string>& needles) {
    bool ok = true;
    for(const std::string& needle: needles) {
        if(output.find(needle) == std::string::npos) {
            std::cerr << "------Test case-------" << std::endl;
            std::cerr << "Filename: " << case_dir.string() << std::endl;
            std::cerr << what << " is missing: " << needle << std::endl;
            std::cerr << output << std::endl;
            ok = false;
        }
    }
    return ok;
}

static bool check_property(const fs::path& case_dir, const std::string& property, bool holds) {
    if(!holds) {
        std::cerr << "------Test case-------" << std::endl;
        std::cerr << "Filename: " << case_dir.string() << std::endl;
        std::cerr << "Property does not hold: " << property << std::endl;
    }
    return holds;
}

int main(int argc, char** argv) {
    assert(argc == 2);

    fs::path case_dir = argv[1];
    fs::path prog = case_dir / "prog.cmap";
    fs::path exp  = case_dir / "expected.json";

    Expectation e = load_expectation(exp);

    FILE* f = std::fopen(prog.string().c_str(), "rb");
    assert(f && "failed to open prog.cmap");

    AnalyzedProgram info(f);
    if(e.expect_failure) {
        return check_property(case_dir, "the program is rejected", !info.analysis_succeeded()) ? 0 : 1;
    }
    if(!check_property(case_dir, "the program is accepted", info.analysis_succeeded())) {
        return 1;
    }

    bool ok = true;
    if(e.callables) {
        ok = check_equal(case_dir, "callables", *e.callables, info.callables()) && ok;
    }
    if(e.method_decls) {
        ok = check_equal(case_dir, "method declarations", *e.method_decls, info.method_decls()) && ok;
    }
    if(e.definite) {
        ok = check_equal(case_dir, "definite calls", edge_strings(*e.definite), edge_strings(info.definite_calls())) && ok;
    }
    if(e.potential) {
        ok = check_equal(case_dir, "potential calls", edge_strings(*e.potential), edge_strings(info.potential_calls())) && ok;
    }
    for(const auto& [decl, impls]: e.implementers) {
        ok = check_equal(case_dir, "implementers of " + decl, impls, info.implementers(decl)) && ok;
    }
    if(e.dropped_calls) {
        ok = check_property(
            case_dir,
            "dropped " + std::to_string(*e.dropped_calls) + " calls without a caller",
            info.dropped_calls() == *e.dropped_calls) && ok;
    }
    ok = check_contains(case_dir, "Diagram", info.dot_output(case_dir.filename().string()), e.dot_contains) && ok;
    ok = check_contains(case_dir, "Dump", info.text_dump(), e.dump_contains) && ok;

    // Hold for every program
    ok = check_property(case_dir, "edges closed before post processing", info.edges_closed_before_post_processing()) && ok;
    ok = check_property(case_dir, "edges closed after post processing", info.edges_closed_after_post_processing()) && ok;
    ok = check_property(case_dir, "post processing is idempotent", info.post_processing_idempotent()) && ok;
    return ok ? 0 : 1;
}
