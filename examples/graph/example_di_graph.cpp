// examples/graph/example_di_graph.cpp — Dependency Graph: Services and Cycles
//
// An application wires its services through constructor injection.  The
// graph builder turns the declarations into a sorted dependency graph,
// flags the AuthService ⇄ UserService cycle, and the filter extracts
// what one component needs.
//
// Compile:
//   g++ -std=c++20 -O2 -I include -o example_di_graph examples/graph/example_di_graph.cpp \
//       -lspdlog -lfmt

#include <injgraph/graph/graph.h>
#include <injgraph/graph/graph_io_mermaid.h>
#include <iostream>

using namespace injgraph::graph;

// =========================================================================
// Declarations
// =========================================================================

// Application:
//   AppComponent  → UserService, Logger
//   UserService   → HttpClient, AuthService
//   AuthService   → UserService, Logger      (cycle with UserService)
//   Tooltip       → Logger
//   HttpClient is never declared: it becomes an `unknown` node.
static std::vector<class_declaration> make_declarations() {
    auto decl = [](std::string name, std::string kind, std::vector<std::string> tokens) {
        class_declaration c;
        c.name = std::move(name);
        c.kind = std::move(kind);
        std::vector<dependency_declaration> deps;
        for (auto& t : tokens) {
            dependency_declaration d;
            d.token = std::move(t);
            deps.push_back(std::move(d));
        }
        c.dependencies = std::move(deps);
        return c;
    };
    return {
        decl("AppComponent", "component", {"UserService", "Logger"}),
        decl("UserService", "service", {"HttpClient", "AuthService"}),
        decl("AuthService", "service", {"UserService", "Logger"}),
        decl("Logger", "service", {}),
        decl("Tooltip", "directive", {"Logger"}),
    };
}

// =========================================================================
// Runtime: build, report, filter
// =========================================================================

int main() {
    auto const g = build_graph(make_declarations());

    std::cout << "=== Dependency Graph ===\n\n";
    std::cout << "Nodes:\n";
    for (auto const& n : g.nodes)
        std::cout << "  " << n.id << " (" << to_string(n.kind) << ")\n";

    std::cout << "\nEdges:\n";
    for (auto const& e : g.edges) {
        std::cout << "  " << e.from << " → " << e.to;
        if (e.is_circular.value_or(false)) std::cout << "   [circular]";
        std::cout << "\n";
    }

    std::cout << "\nCycles:\n";
    for (auto const& c : g.circular_dependencies) {
        std::cout << " ";
        for (auto const& id : c) std::cout << " " << id;
        std::cout << "\n";
    }

    auto const sub = filter_graph(g, {traversal_direction::downstream, {"UserService"}});
    std::cout << "\nWhat UserService needs (" << sub.node_count() << " nodes):\n";
    io::write_mermaid(std::cout, sub);
    std::cout << "\n";
    return 0;
}
