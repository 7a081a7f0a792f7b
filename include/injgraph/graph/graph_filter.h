// graph/graph_filter.h — Reachability sub-graph from entry points
// Part of the injgraph dependency-graph library (C++20)
//
// ALGORITHM:
// Given a built dependency_graph G, a direction and a set of entry ids,
// produce G' containing:
// - every node reachable from some entry (entries included)
// - every edge of G whose endpoints are both reachable
// - every cycle of G whose ids are all reachable, whose shape is valid
//   (see cycle_shape.h) and whose steps are all edges of G
//
// downstream and upstream are single flood fills over one adjacency
// index.  both runs the two fills independently and unions the results;
// it is NOT a traversal over the undirected graph (a sibling reachable
// only via a shared ancestor is excluded).
//
// COMPLEXITY: O(V + E) for the fills, plus the total length of all cycles.
//
// DESIGN RATIONALE:
// Like induced subgraph extraction, filtering only removes.  Output
// nodes, edges and cycles are copies of input values, in input order, so
// filtering is deterministic and idempotent.  Entry ids that are not
// nodes and cycles that reference stale edges are data-quality issues of
// extracted graphs and are skipped, not reported as errors.

#ifndef INJGRAPH_GRAPH_FILTER_H
#define INJGRAPH_GRAPH_FILTER_H

#include "adjacency_index.h"
#include "cycle_shape.h"
#include "graph_types.h"

#include <spdlog/logger.h>

#include <cstddef>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace injgraph::graph {

struct filter_options {
    traversal_direction direction = traversal_direction::downstream;
    std::vector<std::string> entries;
    std::shared_ptr<spdlog::logger> logger;
};

namespace detail {

/// Iterative flood fill from `start`, marking every reached index.
inline void flood_fill(adjacency_index const& adj,
                       adjacency_index::index_type start,
                       std::vector<bool>& reached) {
    std::vector<adjacency_index::index_type> stack{start};
    while (!stack.empty()) {
        auto const u = stack.back();
        stack.pop_back();
        if (reached[u]) continue;
        reached[u] = true;
        for (auto v : adj.neighbors(u)) {
            if (!reached[v]) stack.push_back(v);
        }
    }
}

/// Union of the sets reachable from each entry in one direction.
inline std::vector<bool> reachable_from(adjacency_index const& adj,
                                        std::vector<std::string> const& entries) {
    std::vector<bool> reached(adj.node_count(), false);
    for (auto const& entry : entries) {
        auto const idx = adj.index_of(entry);
        if (idx != adjacency_index::npos) {
            flood_fill(adj, idx, reached);
        }
    }
    return reached;
}

} // namespace detail

/// Filter `g` down to what is reachable from `opts.entries`.
///
/// With no entries the graph is returned unchanged.  Throws
/// std::invalid_argument if `opts.direction` is not a valid enumerator.
///
/// Example:
/// ```cpp
/// // Diamond: Top→Left, Top→Right, Left→Bottom, Right→Bottom
/// auto sub = filter_graph(g, {traversal_direction::both, {"Left"}});
/// // sub.nodes: Bottom, Left, Top   (Right is a sibling, not related)
/// ```
[[nodiscard]] inline dependency_graph
filter_graph(dependency_graph const& g, filter_options const& opts) {
    if (opts.entries.empty()) {
        return g;
    }

    auto const& logger = opts.logger;
    std::vector<bool> reached;

    switch (opts.direction) {
        case traversal_direction::downstream:
        case traversal_direction::upstream: {
            adjacency_index const adj(g.nodes, g.edges, opts.direction);
            reached = detail::reachable_from(adj, opts.entries);
            break;
        }
        case traversal_direction::both: {
            adjacency_index const down(g.nodes, g.edges, traversal_direction::downstream);
            adjacency_index const up(g.nodes, g.edges, traversal_direction::upstream);
            reached = detail::reachable_from(down, opts.entries);
            auto const up_reached = detail::reachable_from(up, opts.entries);
            for (std::size_t i = 0; i < reached.size(); ++i) {
                if (up_reached[i]) reached[i] = true;
            }
            break;
        }
        default:
            throw std::invalid_argument("filter_graph: invalid traversal direction");
    }

    // Same node order in every index built from g.nodes.
    adjacency_index const lookup(g.nodes, {}, traversal_direction::downstream);

    if (logger) {
        for (auto const& entry : opts.entries) {
            if (!lookup.contains(entry)) {
                logger->warn("[filtering] Entry point '{}' not found in graph", entry);
            }
        }
    }

    auto const is_reached = [&](std::string const& id) {
        auto const idx = lookup.index_of(id);
        return idx != adjacency_index::npos && reached[idx];
    };

    dependency_graph out;

    for (auto const& n : g.nodes) {
        if (is_reached(n.id)) out.nodes.push_back(n);
    }

    for (auto const& e : g.edges) {
        if (is_reached(e.from) && is_reached(e.to)) out.edges.push_back(e);
    }

    std::set<std::pair<std::string, std::string>> input_edges;
    for (auto const& e : g.edges) {
        input_edges.emplace(e.from, e.to);
    }

    for (auto const& c : g.circular_dependencies) {
        bool keep = true;
        for (auto const& id : c) {
            if (!is_reached(id)) {
                keep = false;
                break;
            }
        }
        if (!keep) continue;

        auto const shape = classify_cycle(c);
        if (shape == cycle_shape::invalid) continue;

        for (auto const& step : cycle_steps(c, shape)) {
            if (input_edges.find(step) == input_edges.end()) {
                keep = false;
                break;
            }
        }
        if (keep) out.circular_dependencies.push_back(c);
    }

    if (logger) {
        std::string joined;
        for (auto const& entry : opts.entries) {
            if (!joined.empty()) joined += ", ";
            joined += entry;
        }
        logger->info("[filtering] Filtered graph: {} nodes, {} edges",
                     out.nodes.size(), out.edges.size());
        logger->info("[filtering] Entry points: {} (direction {})",
                     joined, to_string(opts.direction));
    }

    return out;
}

} // namespace injgraph::graph

#endif // INJGRAPH_GRAPH_FILTER_H
