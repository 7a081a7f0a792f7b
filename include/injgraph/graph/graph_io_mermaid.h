// graph/graph_io_mermaid.h — Mermaid flowchart export
// Part of the injgraph dependency-graph library (C++20)
//
// Writes a `flowchart LR` that renders in the Mermaid live editor.
// Circular edges are drawn dashed and labelled; detected cycles are
// listed as `%%` comments after the edges.  Output has no trailing
// newline.
//
// Example output:
//   flowchart LR
//     A -.->|circular| B
//     B -.->|circular| A
//
//     %% Circular Dependencies Detected:
//     %% A -> B -> A -> A

#ifndef INJGRAPH_GRAPH_IO_MERMAID_H
#define INJGRAPH_GRAPH_IO_MERMAID_H

#include "graph_types.h"

#include <spdlog/logger.h>
#include <spdlog/stopwatch.h>

#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace injgraph::graph::io {

/// Make a node id safe as a Mermaid identifier: '.' and '-' become '_',
/// then anything outside [A-Za-z0-9_] is dropped.
[[nodiscard]] inline std::string sanitize_node_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '.' || c == '-') {
            out.push_back('_');
        } else if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                   (c >= '0' && c <= '9') || c == '_') {
            out.push_back(c);
        }
    }
    return out;
}

inline void write_mermaid(std::ostream& os, dependency_graph const& g) {
    if (g.nodes.empty()) {
        os << "flowchart LR\n  %% Empty graph - no nodes to display";
        return;
    }

    os << "flowchart LR";
    for (auto const& e : g.edges) {
        os << "\n  " << sanitize_node_name(e.from);
        if (e.is_circular.value_or(false)) {
            os << " -.->|circular| ";
        } else {
            os << " --> ";
        }
        os << sanitize_node_name(e.to);
    }

    if (!g.circular_dependencies.empty()) {
        os << "\n\n  %% Circular Dependencies Detected:";
        for (auto const& c : g.circular_dependencies) {
            os << "\n  %% ";
            for (auto const& id : c) {
                os << id << " -> ";
            }
            if (!c.empty()) os << c.front();
        }
    }
}

[[nodiscard]] inline std::string
format_mermaid(dependency_graph const& g,
               std::shared_ptr<spdlog::logger> const& logger = nullptr) {
    spdlog::stopwatch sw;
    if (logger) {
        logger->info("[performance] Generating Mermaid output ({} nodes, {} edges)",
                     g.nodes.size(), g.edges.size());
    }

    std::ostringstream oss;
    write_mermaid(oss, g);
    auto result = oss.str();

    if (logger) {
        logger->info("[performance] Mermaid output complete ({} bytes, {:.3f} ms)",
                     result.size(), sw.elapsed().count() * 1000.0);
    }
    return result;
}

} // namespace injgraph::graph::io

#endif // INJGRAPH_GRAPH_IO_MERMAID_H
