// graph/graph_types.h — Value types for dependency-injection graphs
// Part of the injgraph dependency-graph library (C++20)
//
// DESIGN RATIONALE:
// Every type here is a plain value: no back-pointers, no per-node
// traversal state, defaulted equality.  Algorithms keep their working
// sets (visited flags, DFS paths) in local index-keyed arrays, so a
// dependency_graph can be copied, compared and filtered freely.
//
// Optional members model "absent" as distinct from "present but empty".
// An edge built from a dependency without flags carries no flags at all,
// while `{}` flags survive as an engaged, all-empty edge_flags.
//
// The declaration records mirror what a declaration extractor emits.
// Their fields are optional so that a record with a missing field can
// be represented and rejected by validation instead of being defaulted.
// A reader that meets a field of the wrong type leaves it empty, so
// validation reports it in the same order as a missing one.

#ifndef INJGRAPH_GRAPH_TYPES_H
#define INJGRAPH_GRAPH_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace injgraph::graph {

// =============================================================================
// Node kinds
// =============================================================================

/// Role of a node.  `unknown` marks a node that exists only because
/// something depends on it.
enum class node_kind : std::uint8_t {
    service,
    component,
    directive,
    unknown
};

[[nodiscard]] constexpr std::string_view to_string(node_kind k) noexcept {
    switch (k) {
        case node_kind::service:   return "service";
        case node_kind::component: return "component";
        case node_kind::directive: return "directive";
        case node_kind::unknown:   return "unknown";
    }
    return "unknown";
}

/// Match a declared kind string.  Anything unrecognised is `unknown`.
[[nodiscard]] constexpr node_kind parse_node_kind(std::string_view s) noexcept {
    if (s == "service")   return node_kind::service;
    if (s == "component") return node_kind::component;
    if (s == "directive") return node_kind::directive;
    return node_kind::unknown;
}

// =============================================================================
// Graph values
// =============================================================================

/// Injection flags attached to a dependency.  Propagated, never
/// interpreted.  Each flag is independently absent or present.
struct edge_flags {
    std::optional<bool> optional;
    std::optional<bool> self;
    std::optional<bool> skip_self;
    std::optional<bool> host;

    bool operator==(edge_flags const&) const = default;
};

struct node {
    std::string id;
    node_kind kind = node_kind::unknown;

    bool operator==(node const&) const = default;
};

/// Directed dependency: `from` depends on `to`.
struct edge {
    std::string from;
    std::string to;
    std::optional<edge_flags> flags;
    std::optional<bool> is_circular;

    bool operator==(edge const&) const = default;
};

/// Node ids of a closed (`[A, B, A]`) or open (`[A, B]` meaning A→B→A) walk.
using cycle = std::vector<std::string>;

/// Nodes sorted by id, edges sorted by (from, to), plus every detected cycle.
struct dependency_graph {
    std::vector<node> nodes;
    std::vector<edge> edges;
    std::vector<cycle> circular_dependencies;

    [[nodiscard]] std::size_t node_count() const noexcept { return nodes.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return edges.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes.empty(); }

    bool operator==(dependency_graph const&) const = default;
};

// =============================================================================
// Declaration records (builder input)
// =============================================================================

struct dependency_declaration {
    std::optional<std::string> token;
    std::optional<edge_flags> flags;
    std::string parameter_name;
};

struct class_declaration {
    std::optional<std::string> name;
    std::optional<std::string> kind;
    std::optional<std::vector<dependency_declaration>> dependencies;
    std::string file_path;
    // Set by readers when `dependencies` was present but not a sequence.
    bool dependencies_not_array = false;
};

} // namespace injgraph::graph

#endif // INJGRAPH_GRAPH_TYPES_H
