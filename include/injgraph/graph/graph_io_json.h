// graph/graph_io_json.h — JSON graph output and declaration input
// Part of the injgraph dependency-graph library (C++20)
//
// OUTPUT FORMAT (2-space indent, key order fixed):
//   {
//     "nodes": [ { "id": "A", "kind": "service" }, ... ],
//     "edges": [ { "from": "A", "to": "B",
//                  "flags": { "optional": true },      (only if present)
//                  "isCircular": true }, ... ],        (only if present)
//     "circularDependencies": [ [ "A", "B", "A" ], ... ]
//   }
// Flag keys appear only when set, in the order optional, self, skipSelf,
// host.  Uses nlohmann::ordered_json so insertion order is output order.
//
// read_json() reads that layout back into a dependency_graph.
//
// INPUT FORMAT (declaration extractor output):
//   [ { "name": "A", "kind": "service", "filePath": "a.ts",
//       "dependencies": [ { "token": "B", "flags": { ... },
//                           "parameterName": "b" } ] } ]
// The reader does not reject records.  A missing or wrongly typed
// name, kind or token becomes an empty optional, a non-array
// `dependencies` sets dependencies_not_array, and validate_declarations
// reports the first violation in record order.  A non-object `flags`
// is treated as absent; non-boolean flag values are dropped one by one.

#ifndef INJGRAPH_GRAPH_IO_JSON_H
#define INJGRAPH_GRAPH_IO_JSON_H

#include "graph_error.h"
#include "graph_types.h"

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>
#include <spdlog/stopwatch.h>

#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace injgraph::graph {

// =============================================================================
// nlohmann::ordered_json serialisers (found by ADL)
// =============================================================================

inline void to_json(nlohmann::ordered_json& j, edge_flags const& f) {
    j = nlohmann::ordered_json::object();
    if (f.optional)  j["optional"] = *f.optional;
    if (f.self)      j["self"] = *f.self;
    if (f.skip_self) j["skipSelf"] = *f.skip_self;
    if (f.host)      j["host"] = *f.host;
}

inline void to_json(nlohmann::ordered_json& j, node const& n) {
    j = nlohmann::ordered_json::object();
    j["id"] = n.id;
    j["kind"] = std::string(to_string(n.kind));
}

inline void to_json(nlohmann::ordered_json& j, edge const& e) {
    j = nlohmann::ordered_json::object();
    j["from"] = e.from;
    j["to"] = e.to;
    if (e.flags)       j["flags"] = *e.flags;
    if (e.is_circular) j["isCircular"] = *e.is_circular;
}

inline void to_json(nlohmann::ordered_json& j, dependency_graph const& g) {
    j = nlohmann::ordered_json::object();
    j["nodes"] = nlohmann::ordered_json::array();
    for (auto const& n : g.nodes) j["nodes"].push_back(n);
    j["edges"] = nlohmann::ordered_json::array();
    for (auto const& e : g.edges) j["edges"].push_back(e);
    j["circularDependencies"] = nlohmann::ordered_json::array();
    for (auto const& c : g.circular_dependencies) j["circularDependencies"].push_back(c);
}

// Readers accept what the serialisers above write.  Required keys are
// read with at(), so a missing key or a wrong type surfaces as
// nlohmann::json::exception.

inline void from_json(nlohmann::json const& j, edge_flags& f) {
    f = edge_flags{};
    if (auto const it = j.find("optional"); it != j.end()) f.optional = it->get<bool>();
    if (auto const it = j.find("self"); it != j.end()) f.self = it->get<bool>();
    if (auto const it = j.find("skipSelf"); it != j.end()) f.skip_self = it->get<bool>();
    if (auto const it = j.find("host"); it != j.end()) f.host = it->get<bool>();
}

inline void from_json(nlohmann::json const& j, node& n) {
    n.id = j.at("id").get<std::string>();
    n.kind = parse_node_kind(j.at("kind").get<std::string>());
}

inline void from_json(nlohmann::json const& j, edge& e) {
    e.from = j.at("from").get<std::string>();
    e.to = j.at("to").get<std::string>();
    e.flags.reset();
    e.is_circular.reset();
    if (auto const it = j.find("flags"); it != j.end()) e.flags = it->get<edge_flags>();
    if (auto const it = j.find("isCircular"); it != j.end()) e.is_circular = it->get<bool>();
}

inline void from_json(nlohmann::json const& j, dependency_graph& g) {
    g.nodes = j.at("nodes").get<std::vector<node>>();
    g.edges = j.at("edges").get<std::vector<edge>>();
    g.circular_dependencies = j.at("circularDependencies").get<std::vector<cycle>>();
}

namespace io {

// =============================================================================
// Graph output
// =============================================================================

/// Pretty-printed JSON for `g` (no trailing newline).
[[nodiscard]] inline std::string
format_json(dependency_graph const& g,
            std::shared_ptr<spdlog::logger> const& logger = nullptr) {
    spdlog::stopwatch sw;
    if (logger) {
        logger->info("[performance] Generating JSON output ({} nodes, {} edges)",
                     g.nodes.size(), g.edges.size());
    }

    nlohmann::ordered_json j = g;
    auto result = j.dump(2);

    if (logger) {
        logger->info("[performance] JSON output complete ({} bytes, {:.3f} ms)",
                     result.size(), sw.elapsed().count() * 1000.0);
    }
    return result;
}

inline void write_json(std::ostream& os, dependency_graph const& g) {
    os << format_json(g);
}

/// Read a graph written by format_json / write_json.
[[nodiscard]] inline dependency_graph read_json(std::istream& is) {
    return nlohmann::json::parse(is).get<dependency_graph>();
}

// =============================================================================
// Declaration input
// =============================================================================

namespace detail {

inline std::optional<edge_flags> flags_from_json(nlohmann::json const& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    edge_flags f;
    auto const read = [&j](char const* key, std::optional<bool>& out) {
        auto const it = j.find(key);
        if (it != j.end() && it->is_boolean()) {
            out = it->get<bool>();
        }
    };
    read("optional", f.optional);
    read("self", f.self);
    read("skipSelf", f.skip_self);
    read("host", f.host);
    return f;
}

inline dependency_declaration dependency_from_json(nlohmann::json const& j) {
    dependency_declaration dep;
    if (!j.is_object()) {
        return dep;
    }
    if (auto const it = j.find("token"); it != j.end() && it->is_string()) {
        dep.token = it->get<std::string>();
    }
    if (auto const it = j.find("flags"); it != j.end()) {
        dep.flags = flags_from_json(*it);
    }
    if (auto const it = j.find("parameterName"); it != j.end() && it->is_string()) {
        dep.parameter_name = it->get<std::string>();
    }
    return dep;
}

inline class_declaration declaration_from_json(nlohmann::json const& j) {
    class_declaration d;
    if (!j.is_object()) {
        return d;
    }
    if (auto const it = j.find("name"); it != j.end() && it->is_string()) {
        d.name = it->get<std::string>();
    }
    if (auto const it = j.find("kind"); it != j.end() && it->is_string()) {
        d.kind = it->get<std::string>();
    }
    if (auto const it = j.find("filePath"); it != j.end() && it->is_string()) {
        d.file_path = it->get<std::string>();
    }
    if (auto const it = j.find("dependencies"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            d.dependencies_not_array = true;
            return d;
        }
        std::vector<dependency_declaration> deps;
        deps.reserve(it->size());
        for (auto const& jd : *it) {
            deps.push_back(dependency_from_json(jd));
        }
        d.dependencies = std::move(deps);
    }
    return d;
}

} // namespace detail

/// Convert a parsed JSON document into declaration records.
///
/// Throws graph_input_error(null_input) for a top-level null and
/// std::invalid_argument for any other non-array document.
[[nodiscard]] inline std::vector<class_declaration>
declarations_from_json(nlohmann::json const& j) {
    if (j.is_null()) {
        throw graph_input_error(input_violation::null_input);
    }
    if (!j.is_array()) {
        throw std::invalid_argument("read_declarations: expected a JSON array");
    }
    std::vector<class_declaration> decls;
    decls.reserve(j.size());
    for (auto const& jc : j) {
        decls.push_back(detail::declaration_from_json(jc));
    }
    return decls;
}

/// Parse declaration records from a stream.
///
/// JSON syntax errors propagate as nlohmann::json::parse_error.
[[nodiscard]] inline std::vector<class_declaration> read_declarations(std::istream& is) {
    return declarations_from_json(nlohmann::json::parse(is));
}

} // namespace io
} // namespace injgraph::graph

#endif // INJGRAPH_GRAPH_IO_JSON_H
