// graph/adjacency_index.h — Id-keyed CSR neighbour index
// Part of the injgraph dependency-graph library (C++20)
//
// DESIGN RATIONALE:
// Cycle detection and reachability filtering both need "neighbours of
// node X" in one edge direction.  adjacency_index builds that lookup once
// per call in compressed sparse row form, keyed by dense integer indices:
//
//   index i        = position of the node in the input node list
//   offsets_[i]    = first slot of node i's neighbours in neighbors_
//   neighbors_[k]  = neighbour index
//
// Ids are translated to indices at the boundary (index_of / id_of), so
// traversal state can live in plain std::vector<bool> arrays.
//
// CONSTRUCTION ORDER:
// Neighbour lists keep edge order.  The bucket fill is stable, so for a
// graph whose edges are sorted by (from, to) the downstream neighbours of
// each node come out sorted by target id.
//
// Edges whose endpoints are not in the node list are not indexed.

#ifndef INJGRAPH_GRAPH_ADJACENCY_INDEX_H
#define INJGRAPH_GRAPH_ADJACENCY_INDEX_H

#include "graph_types.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace injgraph::graph {

// =============================================================================
// Traversal direction
// =============================================================================

/// downstream: follow from→to (what an entry depends on).
/// upstream:   follow to→from (what depends on an entry).
/// both:       union of the two, each computed on its own.
enum class traversal_direction : std::uint8_t {
    downstream,
    upstream,
    both
};

[[nodiscard]] constexpr std::string_view to_string(traversal_direction d) noexcept {
    switch (d) {
        case traversal_direction::downstream: return "downstream";
        case traversal_direction::upstream:   return "upstream";
        case traversal_direction::both:       return "both";
    }
    return "invalid";
}

/// Parse a direction name.  Throws std::invalid_argument for anything
/// other than "downstream", "upstream" or "both".
[[nodiscard]] inline traversal_direction parse_direction(std::string_view s) {
    if (s == "downstream") return traversal_direction::downstream;
    if (s == "upstream")   return traversal_direction::upstream;
    if (s == "both")       return traversal_direction::both;
    throw std::invalid_argument(
        "Invalid direction: " + std::string(s) +
        ". Must be 'upstream', 'downstream', or 'both'");
}

// =============================================================================
// adjacency_index
// =============================================================================

class adjacency_index {
public:
    using index_type = std::uint32_t;

    static constexpr index_type npos = std::numeric_limits<index_type>::max();

    struct neighbor_range {
        index_type const* begin_;
        index_type const* end_;

        [[nodiscard]] index_type const* begin() const noexcept { return begin_; }
        [[nodiscard]] index_type const* end() const noexcept { return end_; }
        [[nodiscard]] std::size_t size() const noexcept {
            return static_cast<std::size_t>(end_ - begin_);
        }
        [[nodiscard]] bool empty() const noexcept { return begin_ == end_; }
    };

    adjacency_index() = default;

    /// Index `edges` over `nodes` in one direction.
    ///
    /// Throws std::invalid_argument for traversal_direction::both, which
    /// has no single neighbour relation.
    adjacency_index(std::vector<node> const& nodes,
                    std::vector<edge> const& edges,
                    traversal_direction dir = traversal_direction::downstream)
        : direction_(dir)
    {
        if (dir != traversal_direction::downstream &&
            dir != traversal_direction::upstream) {
            throw std::invalid_argument(
                "adjacency_index: direction must be downstream or upstream");
        }
        if (nodes.size() >= static_cast<std::size_t>(npos)) {
            throw std::length_error("adjacency_index: node count exceeds index range");
        }

        auto const V = nodes.size();
        ids_.reserve(V);
        index_.reserve(V);
        for (std::size_t i = 0; i < V; ++i) {
            ids_.push_back(nodes[i].id);
            // Duplicate ids: the first position owns the id.
            index_.emplace(nodes[i].id, static_cast<index_type>(i));
        }

        // Resolve each edge to (source, target) in traversal direction.
        struct link {
            index_type src;
            index_type dst;
        };
        std::vector<link> links;
        links.reserve(edges.size());
        for (auto const& e : edges) {
            auto const f = index_of(e.from);
            auto const t = index_of(e.to);
            if (f == npos || t == npos) continue;
            if (dir == traversal_direction::downstream) {
                links.push_back(link{f, t});
            } else {
                links.push_back(link{t, f});
            }
        }

        // Count per source, prefix sum, then a stable bucket fill.
        offsets_.assign(V + 1, 0);
        for (auto const& l : links) {
            offsets_[l.src + 1]++;
        }
        for (std::size_t i = 1; i <= V; ++i) {
            offsets_[i] += offsets_[i - 1];
        }

        neighbors_.resize(links.size());
        std::vector<index_type> cursor(offsets_.begin(), offsets_.end() - 1);
        for (auto const& l : links) {
            neighbors_[cursor[l.src]++] = l.dst;
        }
    }

    // =========================================================================
    // Size queries
    // =========================================================================

    [[nodiscard]] std::size_t node_count() const noexcept { return ids_.size(); }
    [[nodiscard]] std::size_t edge_count() const noexcept { return neighbors_.size(); }
    [[nodiscard]] bool empty() const noexcept { return ids_.empty(); }
    [[nodiscard]] traversal_direction direction() const noexcept { return direction_; }

    // =========================================================================
    // Id <-> index translation
    // =========================================================================

    [[nodiscard]] bool contains(std::string const& id) const {
        return index_.find(id) != index_.end();
    }

    /// Index of `id`, or npos if the id is not a node.
    [[nodiscard]] index_type index_of(std::string const& id) const {
        auto const it = index_.find(id);
        return it == index_.end() ? npos : it->second;
    }

    [[nodiscard]] std::string const& id_of(index_type i) const {
        if (static_cast<std::size_t>(i) >= ids_.size()) {
            throw std::out_of_range("adjacency_index::id_of: index not in graph");
        }
        return ids_[i];
    }

    // =========================================================================
    // Adjacency access
    // =========================================================================

    [[nodiscard]] neighbor_range neighbors(index_type u) const noexcept {
        auto const b = static_cast<std::size_t>(offsets_[u]);
        auto const e = static_cast<std::size_t>(offsets_[u + 1]);
        return {neighbors_.data() + b, neighbors_.data() + e};
    }

    [[nodiscard]] std::size_t degree(index_type u) const noexcept {
        return static_cast<std::size_t>(offsets_[u + 1] - offsets_[u]);
    }

private:
    traversal_direction direction_ = traversal_direction::downstream;
    std::vector<std::string> ids_;
    std::unordered_map<std::string, index_type> index_;
    std::vector<index_type> offsets_;
    std::vector<index_type> neighbors_;
};

} // namespace injgraph::graph

#endif // INJGRAPH_GRAPH_ADJACENCY_INDEX_H
