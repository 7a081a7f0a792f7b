// graph/cycle_detector.h — Enumerate dependency cycles
// Part of the injgraph dependency-graph library (C++20)
//
// ALGORITHM: Three-colour depth-first search with an explicit call stack.
// Complexity: O(V + E) visits, plus the length of every reported cycle.
// Determinism: roots are taken in node order, neighbours in edge order.
//
// COLOURS (index-keyed, never stored on nodes):
//   white  — not yet reached
//   gray   — on the current DFS path  (on_path)
//   black  — fully processed          (done)
//
// Reaching a gray node closes a cycle: the path slice from that node's
// position, with the node appended again (`[A, B, C, A]`, `[A, A]` for a
// self-loop).  The gray node is not expanded again from there.  Reaching
// a black node does nothing.
//
// A cycle is reported once per re-entry into the DFS path, so the same
// cycle can appear more than once when several paths lead into it.
// unique_cycles() is the explicit, opt-in way to collapse repeats.
//
// DESIGN RATIONALE:
// Iterative (not recursive) so that long dependency chains cannot
// exhaust the call stack.  Each frame remembers which neighbour to try
// next, mirroring the frame layout used for iterative Tarjan.

#ifndef INJGRAPH_GRAPH_CYCLE_DETECTOR_H
#define INJGRAPH_GRAPH_CYCLE_DETECTOR_H

#include "adjacency_index.h"
#include "graph_types.h"

#include <cstddef>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace injgraph::graph {

/// Result of cycle detection.
///
/// - cycles: every cycle in discovery order, closed form
/// - circular_edges: (from, to) pairs that are a step of some cycle
struct cycle_report {
    std::vector<cycle> cycles;
    std::set<std::pair<std::string, std::string>> circular_edges;

    [[nodiscard]] bool has_cycles() const noexcept { return !cycles.empty(); }

    [[nodiscard]] bool is_circular(std::string const& from, std::string const& to) const {
        return circular_edges.find({from, to}) != circular_edges.end();
    }
};

/// Find every cycle reachable in a downstream adjacency index.
///
/// Example:
/// ```cpp
/// // A→B, B→A, C→C
/// auto report = detect_cycles(nodes, edges);
/// // report.cycles == {{"A", "B", "A"}, {"C", "C"}}
/// ```
[[nodiscard]] inline cycle_report detect_cycles(adjacency_index const& adj) {
    using index_type = adjacency_index::index_type;

    cycle_report report;
    auto const V = adj.node_count();
    if (V == 0) {
        return report;
    }

    std::vector<bool> on_path(V, false);
    std::vector<bool> done(V, false);
    std::vector<std::size_t> path_pos(V, 0);  // valid while on_path
    std::vector<index_type> path;

    struct frame {
        index_type node;
        std::size_t next;  // which neighbour to try next
    };
    std::vector<frame> call_stack;

    auto const record_cycle = [&](index_type w) {
        cycle c;
        c.reserve(path.size() - path_pos[w] + 1);
        for (std::size_t i = path_pos[w]; i < path.size(); ++i) {
            c.push_back(adj.id_of(path[i]));
        }
        c.push_back(adj.id_of(w));

        for (std::size_t i = 0; i + 1 < c.size(); ++i) {
            report.circular_edges.emplace(c[i], c[i + 1]);
        }
        report.cycles.push_back(std::move(c));
    };

    auto const enter = [&](index_type u) {
        on_path[u] = true;
        path_pos[u] = path.size();
        path.push_back(u);
        call_stack.push_back(frame{u, 0});
    };

    for (std::size_t start = 0; start < V; ++start) {
        if (done[start]) {
            continue;
        }

        enter(static_cast<index_type>(start));

        while (!call_stack.empty()) {
            auto& top = call_stack.back();
            auto const nbrs = adj.neighbors(top.node);

            if (top.next < nbrs.size()) {
                auto const w = nbrs.begin()[top.next];
                top.next++;

                if (done[w]) {
                    continue;
                }
                if (on_path[w]) {
                    record_cycle(w);
                    continue;
                }
                enter(w);  // invalidates `top`
            } else {
                auto const u = top.node;
                call_stack.pop_back();
                path.pop_back();
                on_path[u] = false;
                done[u] = true;
            }
        }
    }

    return report;
}

/// Convenience overload: index `edges` downstream over `nodes` first.
[[nodiscard]] inline cycle_report
detect_cycles(std::vector<node> const& nodes, std::vector<edge> const& edges) {
    return detect_cycles(adjacency_index(nodes, edges, traversal_direction::downstream));
}

/// Drop exact repeats (same id sequence), keeping the first occurrence
/// and the relative order of the rest.
///
/// Not applied by detect_cycles or build_graph.
[[nodiscard]] inline std::vector<cycle> unique_cycles(std::vector<cycle> const& cycles) {
    std::vector<cycle> out;
    out.reserve(cycles.size());
    std::set<cycle> seen;
    for (auto const& c : cycles) {
        if (seen.insert(c).second) {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace injgraph::graph

#endif // INJGRAPH_GRAPH_CYCLE_DETECTOR_H
