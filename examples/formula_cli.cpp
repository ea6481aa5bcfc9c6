#include <calcexpr/calculator.hpp>
#include <calcexpr/json.hpp>
#include <calcexpr/parser.hpp>
#include <calcexpr/render.hpp>

#include <cstdio>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

static void usage(const char* argv0) {
    fmt::print(stderr, "usage: {} [--strict] <formula> [name=value ...]\n", argv0);
}

int main(int argc, char** argv) {
    calcexpr::LexOptions opts;
    int arg = 1;
    if (arg < argc && std::string_view(argv[arg]) == "--strict") {
        opts.strict = true;
        ++arg;
    }
    if (arg >= argc) {
        usage(argv[0]);
        return 2;
    }

    std::string_view text = argv[arg++];

    // name=value pairs become declared inputs, raw values go through the
    // same cleaning the calculator screen applies to its fields
    std::vector<calcexpr::CalculatorInput> inputs;
    std::map<std::string, std::string> raw;
    for (; arg < argc; ++arg) {
        std::string_view pair = argv[arg];
        auto eq = pair.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            fmt::print(stderr, "error: expected name=value, got '{}'\n", pair);
            usage(argv[0]);
            return 2;
        }
        std::string name(pair.substr(0, eq));
        inputs.push_back({name, name, std::nullopt});
        raw[name] = std::string(pair.substr(eq + 1));
    }

    try {
        auto tree = calcexpr::compile_formula(text, inputs, opts);
        if (!tree) {
            fmt::print("no formula\n");
            return 0;
        }

        fmt::print("formula = {}\n", calcexpr::render(*tree));
        fmt::print("json    = {}\n", calcexpr::to_json(*tree));

        for (const auto& name : calcexpr::unknown_variables(*tree, inputs)) {
            fmt::print(stderr, "warning: '{}' has no value\n", name);
        }

        double result = calcexpr::evaluate(*tree, calcexpr::collect_bindings(inputs, raw));
        fmt::print("result  = {}\n", result);
    } catch (const calcexpr::ParseError& e) {
        fmt::print(stderr, "parse error: {}\n", e.what());
        return 1;
    } catch (const calcexpr::EvalError& e) {
        fmt::print(stderr, "evaluation error: {}\n", e.what());
        return 1;
    }

    return 0;
}
