// cli/output_handler.h — Write formatted output to stdout or a file
// Part of the injgraph dependency-graph library (C++20)

#ifndef INJGRAPH_CLI_OUTPUT_HANDLER_H
#define INJGRAPH_CLI_OUTPUT_HANDLER_H

#include "cli_error.h"

#include <filesystem>
#include <fstream>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>

namespace injgraph::cli {

/// Write `content` verbatim to `out` when `path` is empty, otherwise to
/// the file at `path`, creating missing parent directories.
///
/// Throws cli_error(error_code::output_write_error) on failure.
inline void write_output(std::string const& content,
                         std::optional<std::string> const& path,
                         std::ostream& out) {
    if (!path) {
        out << content;
        out.flush();
        return;
    }

    namespace fs = std::filesystem;
    fs::path const target(*path);
    auto const dir = target.parent_path();

    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw cli_error("Failed to write output file: " + ec.message(),
                            error_code::output_write_error, *path);
        }
    }

    std::ofstream ofs(target, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw cli_error("Failed to write output file: cannot open for writing",
                        error_code::output_write_error, *path);
    }
    ofs << content;
    ofs.flush();
    if (!ofs) {
        throw cli_error("Failed to write output file: write failed",
                        error_code::output_write_error, *path);
    }
}

} // namespace injgraph::cli

#endif // INJGRAPH_CLI_OUTPUT_HANDLER_H
