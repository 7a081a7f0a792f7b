// cli/cli_options.h — Command-line configuration for the injgraph tool
// Part of the injgraph dependency-graph library (C++20)
//
// ACCEPTED SYNTAX:
//   -i, --input <path>        declarations JSON, "-" for stdin
//   -f, --format <format>     json | mermaid
//   -e, --entry <symbol...>   one or more entry nodes; repeatable
//   -d, --direction <dir>     upstream | downstream | both
//   --include-decorators      keep Optional/Self/SkipSelf/Host flags
//   --out <file>              output file (stdout if omitted)
//   -v, --verbose             diagnostics on stderr
//   -h, --help / --version
//
// Long options also accept `--name=value`.  --entry consumes arguments
// up to the next one that starts with '-'.  Every violation throws
// cli_error(error_code::invalid_arguments).

#ifndef INJGRAPH_CLI_OPTIONS_H
#define INJGRAPH_CLI_OPTIONS_H

#include "cli_error.h"

#include <injgraph/graph/adjacency_index.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace injgraph::cli {

inline constexpr std::string_view program_name = "injgraph";
inline constexpr std::string_view program_version = "0.1.0";

enum class output_format : std::uint8_t {
    json,
    mermaid
};

[[nodiscard]] constexpr std::string_view to_string(output_format f) noexcept {
    return f == output_format::mermaid ? "mermaid" : "json";
}

struct cli_options {
    std::string input = "-";
    output_format format = output_format::json;
    std::vector<std::string> entries;
    graph::traversal_direction direction = graph::traversal_direction::downstream;
    bool include_decorators = false;
    std::optional<std::string> out;
    bool verbose = false;
    bool show_help = false;
    bool show_version = false;
};

[[nodiscard]] inline std::string usage() {
    std::string s;
    s += "Usage: ";
    s += program_name;
    s += " [options]\n\n"
         "Dependency-injection graph tool\n\n"
         "Options:\n"
         "  -i, --input <path>        declarations JSON file, \"-\" for stdin (default: \"-\")\n"
         "  -f, --format <format>     output format: json | mermaid (default: \"json\")\n"
         "  -e, --entry <symbol...>   starting nodes for sub-graph\n"
         "  -d, --direction <dir>     filtering direction: upstream|downstream|both (default: \"downstream\")\n"
         "  --include-decorators      include Optional/Self/SkipSelf/Host flags\n"
         "  --out <file>              output file (stdout if omitted)\n"
         "  -v, --verbose             show detailed diagnostics\n"
         "  --version                 output the version number\n"
         "  -h, --help                display help for command\n";
    return s;
}

namespace detail {

[[nodiscard]] inline bool is_option(std::string_view arg) noexcept {
    return arg.size() > 1 && arg[0] == '-';
}

[[nodiscard]] inline output_format parse_format(std::string_view s) {
    if (s == "json") return output_format::json;
    if (s == "mermaid") return output_format::mermaid;
    throw cli_error("Invalid format: " + std::string(s) + ". Must be 'json' or 'mermaid'",
                    error_code::invalid_arguments);
}

} // namespace detail

/// Parse arguments (program name excluded).
[[nodiscard]] inline cli_options parse_arguments(std::vector<std::string> const& args) {
    cli_options opts;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string name = args[i];
        std::optional<std::string> inline_value;
        if (name.rfind("--", 0) == 0) {
            auto const eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name.erase(eq);
            }
        }

        auto const take_value = [&]() -> std::string {
            if (inline_value) return *inline_value;
            if (i + 1 >= args.size() || detail::is_option(args[i + 1])) {
                throw cli_error("option '" + name + "' argument missing",
                                error_code::invalid_arguments);
            }
            return args[++i];
        };

        auto const reject_value = [&]() {
            if (inline_value) {
                throw cli_error("option '" + name + "' does not take a value",
                                error_code::invalid_arguments);
            }
        };

        if (name == "-i" || name == "--input") {
            opts.input = take_value();
        } else if (name == "-f" || name == "--format") {
            opts.format = detail::parse_format(take_value());
        } else if (name == "-d" || name == "--direction") {
            auto const value = take_value();
            try {
                opts.direction = graph::parse_direction(value);
            } catch (std::invalid_argument const& e) {
                throw cli_error(e.what(), error_code::invalid_arguments);
            }
        } else if (name == "-e" || name == "--entry") {
            if (inline_value) {
                opts.entries.push_back(*inline_value);
                continue;
            }
            std::size_t taken = 0;
            while (i + 1 < args.size() && !detail::is_option(args[i + 1])) {
                opts.entries.push_back(args[++i]);
                ++taken;
            }
            if (taken == 0) {
                throw cli_error("option '" + name + "' argument missing",
                                error_code::invalid_arguments);
            }
        } else if (name == "--out") {
            opts.out = take_value();
        } else if (name == "--include-decorators") {
            reject_value();
            opts.include_decorators = true;
        } else if (name == "-v" || name == "--verbose") {
            reject_value();
            opts.verbose = true;
        } else if (name == "-h" || name == "--help") {
            opts.show_help = true;
        } else if (name == "--version") {
            opts.show_version = true;
        } else if (detail::is_option(name)) {
            throw cli_error("unknown option '" + name + "'", error_code::invalid_arguments);
        } else {
            throw cli_error("too many arguments: unexpected '" + name + "'",
                            error_code::invalid_arguments);
        }
    }

    return opts;
}

[[nodiscard]] inline cli_options parse_arguments(int argc, char const* const* argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_arguments(args);
}

} // namespace injgraph::cli

#endif // INJGRAPH_CLI_OPTIONS_H
