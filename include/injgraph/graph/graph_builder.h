// graph/graph_builder.h — Build a dependency graph from class declarations
// Part of the injgraph dependency-graph library (C++20)
//
// DESIGN RATIONALE:
// build_graph() separates validation from construction: the whole input
// is checked first, so a caller gets either a complete graph or a
// graph_input_error, never a partial result.
//
// build_graph() CANONICALISATION RULES:
// 1. One node per declared name.  The first declaration of a name wins;
//    later duplicates do not change its kind.
// 2. Every dependency token that is not a node becomes an `unknown` node.
// 3. One edge per dependency, duplicates and self-edges kept.  Flags are
//    copied only when the dependency has them.
// 4. Nodes sorted by id, edges stable-sorted by (from, to), both with
//    ordinal byte comparison.
// 5. Cycles detected over the sorted graph; every edge that is a step of
//    a cycle gets is_circular = true.  Other edges leave it unset.

#ifndef INJGRAPH_GRAPH_BUILDER_H
#define INJGRAPH_GRAPH_BUILDER_H

#include "cycle_detector.h"
#include "graph_error.h"
#include "graph_types.h"

#include <spdlog/logger.h>
#include <spdlog/stopwatch.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace injgraph::graph {

namespace detail {

/// Unicode white space, line terminators and U+FEFF.
constexpr bool is_space_code_point(char32_t c) noexcept {
    switch (c) {
        case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
        case 0x0020: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F:
        case 0x3000: case 0xFEFF:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

/// True if UTF-8 `s` is empty or only white space.  A malformed byte
/// sequence counts as content.
constexpr bool is_blank(std::string_view s) noexcept {
    std::size_t i = 0;
    while (i < s.size()) {
        auto const b0 = static_cast<unsigned char>(s[i]);
        std::size_t len = 0;
        char32_t cp = 0;
        if (b0 < 0x80)                { len = 1; cp = b0; }
        else if ((b0 & 0xE0) == 0xC0) { len = 2; cp = b0 & 0x1F; }
        else if ((b0 & 0xF0) == 0xE0) { len = 3; cp = b0 & 0x0F; }
        else                          { return false; }  // no white space above U+FFFF
        if (i + len > s.size()) return false;
        for (std::size_t k = 1; k < len; ++k) {
            auto const b = static_cast<unsigned char>(s[i + k]);
            if ((b & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (b & 0x3F);
        }
        if (!is_space_code_point(cp)) return false;
        i += len;
    }
    return true;
}

} // namespace detail

/// Check every declaration, in order, against the input contract.
///
/// Per declaration: name present, name not blank, kind present,
/// dependencies present and a sequence, then each dependency token
/// present.
/// Throws graph_input_error for the first violation found.
inline void validate_declarations(std::vector<class_declaration> const& decls) {
    for (auto const& d : decls) {
        if (!d.name) {
            throw graph_input_error(input_violation::invalid_name);
        }
        if (detail::is_blank(*d.name)) {
            throw graph_input_error(input_violation::empty_name);
        }
        if (!d.kind) {
            throw graph_input_error(input_violation::invalid_kind);
        }
        if (!d.dependencies) {
            throw graph_input_error(d.dependencies_not_array
                                        ? input_violation::dependencies_not_array
                                        : input_violation::missing_dependencies);
        }
        for (auto const& dep : *d.dependencies) {
            if (!dep.token) {
                throw graph_input_error(input_violation::invalid_token);
            }
        }
    }
}

/// Build the dependency graph for `decls`.
///
/// `logger` is optional; when set it receives construction progress,
/// statistics and timing.  It never affects the result.
///
/// Example:
/// ```cpp
/// std::vector<class_declaration> decls{
///     {"A", "service", std::vector<dependency_declaration>{{"B"}}},
///     {"B", "service", std::vector<dependency_declaration>{{"A"}}},
/// };
/// auto g = build_graph(decls);
/// // g.circular_dependencies == {{"A", "B", "A"}}
/// ```
[[nodiscard]] inline dependency_graph
build_graph(std::vector<class_declaration> const& decls,
            std::shared_ptr<spdlog::logger> const& logger = nullptr) {
    spdlog::stopwatch sw;
    if (logger) {
        logger->info("[graph-construction] Starting graph construction ({} declarations)",
                     decls.size());
    }

    validate_declarations(decls);

    dependency_graph g;
    std::unordered_set<std::string> known;

    // Pass 1: declared classes.
    for (auto const& d : decls) {
        if (known.insert(*d.name).second) {
            g.nodes.push_back(node{*d.name, parse_node_kind(*d.kind)});
        }
    }
    auto const declared_count = g.nodes.size();

    // Pass 2: edges, plus unknown nodes for undeclared tokens.
    for (auto const& d : decls) {
        for (auto const& dep : *d.dependencies) {
            if (known.insert(*dep.token).second) {
                g.nodes.push_back(node{*dep.token, node_kind::unknown});
                if (logger) {
                    logger->debug("[graph-construction] Created unknown node: {}", *dep.token);
                }
            }
            edge e;
            e.from = *d.name;
            e.to = *dep.token;
            e.flags = dep.flags;
            g.edges.push_back(std::move(e));
        }
    }

    if (logger) {
        logger->info("[graph-construction] Created {} nodes ({} declared, {} unknown)",
                     g.nodes.size(), declared_count, g.nodes.size() - declared_count);
        logger->info("[graph-construction] Created {} edges", g.edges.size());
    }

    std::sort(g.nodes.begin(), g.nodes.end(),
        [](node const& a, node const& b) { return a.id < b.id; });
    std::stable_sort(g.edges.begin(), g.edges.end(),
        [](edge const& a, edge const& b) {
            if (a.from != b.from) return a.from < b.from;
            return a.to < b.to;
        });

    auto report = detect_cycles(g.nodes, g.edges);
    for (auto& e : g.edges) {
        if (report.is_circular(e.from, e.to)) {
            e.is_circular = true;
        }
    }
    g.circular_dependencies = std::move(report.cycles);

    if (logger) {
        if (!g.circular_dependencies.empty()) {
            logger->warn("[graph-construction] Detected {} circular dependencies",
                         g.circular_dependencies.size());
        }
        logger->info("[performance] Graph construction complete: {} nodes, {} edges "
                     "(duration {:.3f} ms)",
                     g.nodes.size(), g.edges.size(), sw.elapsed().count() * 1000.0);
    }

    return g;
}

} // namespace injgraph::graph

#endif // INJGRAPH_GRAPH_BUILDER_H
