// graph/cycle_shape.h — Classify cycle sequences and expand their steps
// Part of the injgraph dependency-graph library (C++20)
//
// A cycle list may come from build_graph() or from other tooling, so two
// textual shapes are accepted:
//
//   self_loop  [X, X]                      steps: X→X
//   closed     [A, B, C, A]   (len >= 3)   steps: A→B, B→C, C→A
//   open       [A, B, C]      (len >= 3)   steps: A→B, B→C, C→A (wrap)
//
// Everything else (empty, single id, [A, B] with A != B) is invalid and
// has no steps.

#ifndef INJGRAPH_GRAPH_CYCLE_SHAPE_H
#define INJGRAPH_GRAPH_CYCLE_SHAPE_H

#include "graph_types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace injgraph::graph {

enum class cycle_shape : std::uint8_t {
    invalid,
    self_loop,
    closed,
    open
};

[[nodiscard]] inline cycle_shape classify_cycle(cycle const& c) noexcept {
    if (c.size() == 2 && c[0] == c[1]) return cycle_shape::self_loop;
    if (c.size() >= 3) {
        return c.front() == c.back() ? cycle_shape::closed : cycle_shape::open;
    }
    return cycle_shape::invalid;
}

/// The (from, to) steps a cycle of the given shape walks.
[[nodiscard]] inline std::vector<std::pair<std::string, std::string>>
cycle_steps(cycle const& c, cycle_shape shape) {
    std::vector<std::pair<std::string, std::string>> steps;
    switch (shape) {
        case cycle_shape::self_loop:
        case cycle_shape::closed:
            steps.reserve(c.size() - 1);
            for (std::size_t i = 0; i + 1 < c.size(); ++i) {
                steps.emplace_back(c[i], c[i + 1]);
            }
            break;
        case cycle_shape::open:
            steps.reserve(c.size());
            for (std::size_t i = 0; i < c.size(); ++i) {
                steps.emplace_back(c[i], c[(i + 1) % c.size()]);
            }
            break;
        case cycle_shape::invalid:
            break;
    }
    return steps;
}

[[nodiscard]] inline std::vector<std::pair<std::string, std::string>>
cycle_steps(cycle const& c) {
    return cycle_steps(c, classify_cycle(c));
}

} // namespace injgraph::graph

#endif // INJGRAPH_GRAPH_CYCLE_SHAPE_H
