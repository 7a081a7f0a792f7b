// cli/cli_app.h — The injgraph command-line pipeline
// Part of the injgraph dependency-graph library (C++20)
//
// PIPELINE:
//   read declarations → (drop flags) → build_graph → filter_graph
//   → format (json | mermaid) → write_output
//
// run() takes its streams and an optional log sink as parameters so the
// whole pipeline can be driven from tests.  Every failure becomes a
// cli_error, is printed with format_error() and mapped to an exit code;
// run() itself does not throw for pipeline failures.

#ifndef INJGRAPH_CLI_APP_H
#define INJGRAPH_CLI_APP_H

#include "cli_error.h"
#include "cli_logging.h"
#include "cli_options.h"
#include "output_handler.h"

#include <injgraph/graph/graph.h>
#include <injgraph/graph/graph_io.h>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>
#include <spdlog/stopwatch.h>

#include <exception>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace injgraph::cli {

/// Read declaration records from `path` ("-" reads `in`).
///
/// Maps failures to cli_error: missing file → file_not_found, unreadable
/// file → permission_denied, malformed JSON or records → file_parse_error.
[[nodiscard]] inline std::vector<graph::class_declaration>
load_declarations(std::string const& path, std::istream& in,
                  std::shared_ptr<spdlog::logger> const& logger) {
    auto const parse = [&](std::istream& is) {
        try {
            return graph::io::read_declarations(is);
        } catch (nlohmann::json::parse_error const& e) {
            throw cli_error("Invalid declarations JSON", error_code::file_parse_error,
                            path, {{"detail", e.what()}});
        } catch (graph::graph_input_error const& e) {
            throw cli_error(e.what(), error_code::file_parse_error, path);
        } catch (std::invalid_argument const& e) {
            throw cli_error(e.what(), error_code::file_parse_error, path);
        }
    };

    if (path == "-") {
        logger->debug("[file-processing] Reading declarations from stdin");
        return parse(in);
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw cli_error("Declarations file not found: " + path,
                        error_code::file_not_found, path);
    }
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs) {
        throw cli_error("Cannot read declarations file: " + path,
                        error_code::permission_denied, path);
    }
    logger->debug("[file-processing] Reading declarations from {}", path);
    return parse(ifs);
}

/// Drop every dependency's flags.
inline void strip_flags(std::vector<graph::class_declaration>& decls) {
    for (auto& d : decls) {
        if (!d.dependencies) continue;
        for (auto& dep : *d.dependencies) {
            dep.flags.reset();
        }
    }
}

/// Run the tool with parsed options.  Returns the process exit status.
[[nodiscard]] inline int run(cli_options const& opts,
                             std::istream& in, std::ostream& out, std::ostream& err,
                             spdlog::sink_ptr log_sink = nullptr) {
    if (opts.show_help) {
        out << usage();
        return static_cast<int>(exit_code::success);
    }
    if (opts.show_version) {
        out << program_version << '\n';
        return static_cast<int>(exit_code::success);
    }

    auto const logger = make_logger(opts.verbose, std::move(log_sink));
    auto const engine_logger = opts.verbose ? logger : nullptr;
    spdlog::stopwatch total;

    try {
        logger->info("[file-processing] CLI execution started: input={} format={} "
                     "direction={} entries={} include-decorators={}",
                     opts.input, to_string(opts.format), graph::to_string(opts.direction),
                     opts.entries.size(), opts.include_decorators);

        auto decls = load_declarations(opts.input, in, logger);
        logger->info("[file-processing] Found {} declarations", decls.size());

        if (!opts.include_decorators) {
            strip_flags(decls);
        }

        graph::dependency_graph g;
        try {
            g = graph::build_graph(decls, engine_logger);
        } catch (graph::graph_input_error const& e) {
            throw cli_error(e.what(), error_code::file_parse_error, opts.input);
        }

        if (!opts.entries.empty()) {
            g = graph::filter_graph(g, {opts.direction, opts.entries, engine_logger});
        }

        auto const content = opts.format == output_format::mermaid
            ? graph::io::format_mermaid(g, engine_logger)
            : graph::io::format_json(g, engine_logger);

        write_output(content, opts.out, out);
        if (opts.out) {
            logger->info("[file-processing] Output written to: {}", *opts.out);
        }

        logger->info("[performance] Total time: {:.2f} ms", total.elapsed().count() * 1000.0);
        return static_cast<int>(exit_code::success);
    } catch (cli_error const& e) {
        err << format_error(e, opts.verbose) << '\n';
        return static_cast<int>(classify_exit_code(e.code()));
    } catch (std::exception const& e) {
        cli_error const wrapped(e.what(), error_code::internal_error);
        err << format_error(wrapped, opts.verbose) << '\n';
        return static_cast<int>(classify_exit_code(wrapped.code()));
    }
}

/// Entry point for main(): parse argv, then run against the process streams.
[[nodiscard]] inline int run_main(int argc, char const* const* argv,
                                  std::istream& in, std::ostream& out, std::ostream& err) {
    cli_options opts;
    try {
        opts = parse_arguments(argc, argv);
    } catch (cli_error const& e) {
        err << format_error(e) << '\n';
        return static_cast<int>(classify_exit_code(e.code()));
    }
    return run(opts, in, out, err);
}

} // namespace injgraph::cli

#endif // INJGRAPH_CLI_APP_H
