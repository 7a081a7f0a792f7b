// cli/cli_error.h — Structured command-line errors and exit codes
// Part of the injgraph dependency-graph library (C++20)
//
// Every failure the command-line shell reports is a cli_error: a message,
// an error_code, an optional file path and string key/value context.
// The code decides the process exit status and the recovery hints shown
// to the user.

#ifndef INJGRAPH_CLI_ERROR_H
#define INJGRAPH_CLI_ERROR_H

#include <cstdint>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace injgraph::cli {

enum class exit_code : int {
    success = 0,
    general_error = 1,
    invalid_arguments = 2,
    parsing_error = 4,
    file_not_found = 7,
    permission_error = 8
};

enum class error_code : std::uint8_t {
    invalid_arguments,
    file_not_found,
    file_parse_error,
    permission_denied,
    output_write_error,
    internal_error
};

[[nodiscard]] constexpr std::string_view to_string(error_code c) noexcept {
    switch (c) {
        case error_code::invalid_arguments:  return "INVALID_ARGUMENTS";
        case error_code::file_not_found:     return "FILE_NOT_FOUND";
        case error_code::file_parse_error:   return "FILE_PARSE_ERROR";
        case error_code::permission_denied:  return "PERMISSION_DENIED";
        case error_code::output_write_error: return "OUTPUT_WRITE_ERROR";
        case error_code::internal_error:     return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

class cli_error : public std::runtime_error {
public:
    using context_map = std::map<std::string, std::string>;

    cli_error(std::string const& message, error_code code,
              std::optional<std::string> file_path = std::nullopt,
              context_map context = {})
        : std::runtime_error(message),
          code_(code),
          file_path_(std::move(file_path)),
          context_(std::move(context)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] std::optional<std::string> const& file_path() const noexcept { return file_path_; }
    [[nodiscard]] context_map const& context() const noexcept { return context_; }

    /// Fatal errors stop the run; the rest are warnings.
    [[nodiscard]] bool is_fatal() const noexcept {
        switch (code_) {
            case error_code::invalid_arguments:
            case error_code::file_parse_error:
            case error_code::permission_denied:
            case error_code::internal_error:
                return true;
            case error_code::file_not_found:
            case error_code::output_write_error:
                return false;
        }
        return true;
    }

    [[nodiscard]] bool is_recoverable() const noexcept { return !is_fatal(); }

private:
    error_code code_;
    std::optional<std::string> file_path_;
    context_map context_;
};

[[nodiscard]] constexpr exit_code classify_exit_code(error_code c) noexcept {
    switch (c) {
        case error_code::invalid_arguments:  return exit_code::invalid_arguments;
        case error_code::file_not_found:     return exit_code::file_not_found;
        case error_code::file_parse_error:   return exit_code::parsing_error;
        case error_code::permission_denied:  return exit_code::permission_error;
        case error_code::output_write_error:
        case error_code::internal_error:     return exit_code::general_error;
    }
    return exit_code::general_error;
}

/// One suggestion per line.
[[nodiscard]] inline std::string_view recovery_guidance(error_code c) noexcept {
    switch (c) {
        case error_code::invalid_arguments:
            return "Check CLI argument syntax\n"
                   "Review --help for valid options\n"
                   "Verify argument values are in correct format";
        case error_code::file_not_found:
            return "Verify file path is correct\n"
                   "Check file exists in the specified location\n"
                   "Try using absolute path instead of relative";
        case error_code::file_parse_error:
            return "Validate the declarations file with a JSON validator\n"
                   "Check every declaration has a name, kind and dependencies array\n"
                   "Use --verbose to see detailed diagnostics";
        case error_code::permission_denied:
            return "Check file and directory permissions\n"
                   "Ensure you have read access to the input file\n"
                   "Verify write access to output location";
        case error_code::output_write_error:
            return "Check file permissions for the output location\n"
                   "Try writing to a different location\n"
                   "Use stdout instead of file output as workaround";
        case error_code::internal_error:
            return "Review the error message for specific details\n"
                   "Try running with --verbose for more information\n"
                   "Consider filing an issue if the problem persists";
    }
    return {};
}

/// Render an error for the terminal.
inline std::string format_error(cli_error const& err, bool verbose = false) {
    std::ostringstream os;

    os << (err.is_fatal() ? "Fatal Error" : "Warning") << "\n\n";
    os << "Message: " << err.what() << '\n';
    if (err.file_path()) {
        os << "File: " << *err.file_path() << '\n';
    }
    os << "Code: " << to_string(err.code()) << '\n';

    if (!err.context().empty()) {
        os << "\nContext:\n";
        for (auto const& [key, value] : err.context()) {
            os << "  " << key << ": " << value << '\n';
        }
    }

    os << "\nSuggestions:\n";
    std::istringstream hints{std::string(recovery_guidance(err.code()))};
    std::string line;
    while (std::getline(hints, line)) {
        if (!line.empty()) os << "  - " << line << '\n';
    }

    if (verbose) {
        os << "\nExit code: " << static_cast<int>(classify_exit_code(err.code())) << '\n';
    }

    os << "\nRun with --help for usage information\n";
    os << "Use --verbose for detailed debugging information";
    return os.str();
}

} // namespace injgraph::cli

#endif // INJGRAPH_CLI_ERROR_H
