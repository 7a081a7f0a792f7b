// cli/cli_logging.h — Logger set-up for the command-line tool
// Part of the injgraph dependency-graph library (C++20)
//
// The tool logs through one spdlog logger named "injgraph".  Diagnostics
// go to stderr so that stdout carries only the formatted graph.  The
// logger is not registered globally; callers own it.
//
// Verbose mode lowers the level to debug and hands the same logger to the
// graph engine.  Otherwise the level is warn and the engine runs silent.

#ifndef INJGRAPH_CLI_LOGGING_H
#define INJGRAPH_CLI_LOGGING_H

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <utility>

namespace injgraph::cli {

inline constexpr char const* log_pattern = "[%Y-%m-%dT%H:%M:%S.%e] [%l] %v";

/// Create the tool logger.  `sink` defaults to a colour stderr sink.
[[nodiscard]] inline std::shared_ptr<spdlog::logger>
make_logger(bool verbose, spdlog::sink_ptr sink = nullptr) {
    if (!sink) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    auto logger = std::make_shared<spdlog::logger>("injgraph", std::move(sink));
    logger->set_pattern(log_pattern);
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
    return logger;
}

} // namespace injgraph::cli

#endif // INJGRAPH_CLI_LOGGING_H
