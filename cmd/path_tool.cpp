#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "src/path/paths.hpp"
#include "src/span/source_manager.hpp"
#include "src/utils/error.hpp"

namespace {

struct Options {
    std::string kind = "path";
    char escape = path::DEFAULT_ESCAPE;
    std::optional<std::string> match;
    std::string input;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--kind path|matrix|pattern|matrix-pattern] [--escape C] [--match PATTERN] <text>"
              << std::endl;
}

std::optional<Options> parse_arguments(int argc, char* argv[]) {
    Options options;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--kind" && has_value) {
            options.kind = argv[++i];
        } else if (arg == "--escape" && has_value) {
            std::string value = argv[++i];
            if (value.size() != 1) return std::nullopt;
            options.escape = value[0];
        } else if (arg == "--match" && has_value) {
            options.match = argv[++i];
        } else if (arg.rfind("--", 0) == 0) {
            return std::nullopt;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() != 1) return std::nullopt;
    if (options.kind != "path" && options.kind != "matrix" && options.kind != "pattern" &&
        options.kind != "matrix-pattern") {
        return std::nullopt;
    }
    if (options.match && (options.kind == "pattern" || options.kind == "matrix-pattern")) {
        return std::nullopt;
    }
    options.input = positional.front();
    return options;
}

void print_syntax_error(const SyntaxError& error, const span::SourceManager& sources, span::SourceId source) {
    std::cerr << "Error: " << error.what() << std::endl;
    auto error_span = error.span();
    if (!error_span.is_valid()) {
        std::cerr << " (no location information)" << std::endl;
        return;
    }
    error_span.source = source;
    std::cerr << "--> " << sources.format_span(error_span) << std::endl;
}

template <typename PathT>
void print_plain(const PathT& parsed) {
    for (size_t i = 0; i < parsed.size(); ++i) {
        std::cout << "[" << i << "] " << parsed.element(i) << std::endl;
    }
}

template <typename PathT>
void print_matrix(const PathT& parsed, char escape) {
    for (size_t i = 0; i < parsed.size(); ++i) {
        const auto& element = parsed.element(i);
        std::cout << "[" << i << "] " << element.name << std::endl;
        for (const auto& [key, value] : element.attr) {
            std::cout << "    " << key;
            if (value) std::cout << " = " << *value;
            std::cout << std::endl;
        }
    }
    std::cout << "rendered: " << parsed.to_string(escape) << std::endl;
}

// Returns the process exit code: 0 on success or match, 2 on no match.
template <typename PathT, typename PatternT>
int run_match(const PathT& parsed, const Options& options, span::SourceManager& sources) {
    auto source = sources.add_source("--match", *options.match);
    try {
        auto patterns = PatternT::parse(*options.match, options.escape);
        bool matched = parsed.matches(patterns);
        std::cout << (matched ? "match" : "no match") << std::endl;
        return matched ? 0 : 2;
    } catch (const SyntaxError& e) {
        print_syntax_error(e, sources, source);
        return 1;
    }
}

int run(const Options& options, span::SourceManager& sources) {
    if (options.kind == "path") {
        auto parsed = path::StringPath::parse(options.input, options.escape);
        print_plain(parsed);
        std::cout << "rendered: " << parsed.to_string(options.escape) << std::endl;
        return options.match ? run_match<path::StringPath, path::PatternPath>(parsed, options, sources) : 0;
    }
    if (options.kind == "pattern") {
        auto parsed = path::PatternPath::parse(options.input, options.escape);
        print_plain(parsed);
        std::cout << "rendered: " << parsed.to_string(options.escape) << std::endl;
        return 0;
    }
    if (options.kind == "matrix") {
        auto parsed = path::MatrixPath::parse(options.input, options.escape);
        print_matrix(parsed, options.escape);
        return options.match ? run_match<path::MatrixPath, path::MatrixPathPattern>(parsed, options, sources) : 0;
    }
    print_matrix(path::MatrixPathPattern::parse(options.input, options.escape), options.escape);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = parse_arguments(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 1;
    }

    span::SourceManager sources;
    auto input_source = sources.add_source("<input>", options->input);

    try {
        return run(*options, sources);
    } catch (const SyntaxError& e) {
        print_syntax_error(e, sources, input_source);
        return 1;
    }
}
