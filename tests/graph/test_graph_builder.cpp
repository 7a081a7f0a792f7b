// tests/graph/test_graph_builder.cpp
// Tests for validate_declarations / build_graph.
//
// Validates:
//   1. Input contract: one error code and message per violation
//   2. Cycle scenarios: two-node cycle, self-loop
//   3. Unknown nodes for undeclared tokens
//   4. First declaration of a name wins
//   5. Flags: absent stays absent, empty stays empty
//   6. Canonical ordering (ordinal) and kept duplicates
//   7. Structural invariants on a mixed graph
//   8. Logging through an injected spdlog logger

#include "injgraph/graph/graph_builder.h"
#include <gtest/gtest.h>

#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace ig = injgraph::graph;
using ig::input_violation;

// =============================================================================
// Factories
// =============================================================================

static ig::dependency_declaration dep(std::string token,
                                      std::optional<ig::edge_flags> flags = std::nullopt) {
    ig::dependency_declaration d;
    d.token = std::move(token);
    d.flags = flags;
    return d;
}

static ig::class_declaration decl(std::string name,
                                  std::vector<ig::dependency_declaration> deps,
                                  std::string kind = "service") {
    ig::class_declaration c;
    c.name = std::move(name);
    c.kind = std::move(kind);
    c.dependencies = std::move(deps);
    return c;
}

static std::vector<std::string> node_ids(ig::dependency_graph const& g) {
    std::vector<std::string> out;
    for (auto const& n : g.nodes) out.push_back(n.id);
    return out;
}

static input_violation violation_of(std::vector<ig::class_declaration> const& decls) {
    try {
        (void)ig::build_graph(decls);
    } catch (ig::graph_input_error const& e) {
        return e.code();
    }
    ADD_FAILURE() << "expected graph_input_error";
    return input_violation::null_input;
}

// =============================================================================
// 1. Input contract
// =============================================================================

TEST(GraphBuilderValidation, MissingName) {
    auto d = decl("A", {});
    d.name.reset();
    EXPECT_EQ(violation_of({d}), input_violation::invalid_name);
}

TEST(GraphBuilderValidation, BlankName) {
    EXPECT_EQ(violation_of({decl("", {})}), input_violation::empty_name);
    EXPECT_EQ(violation_of({decl("  \t", {})}), input_violation::empty_name);
}

TEST(GraphBuilderValidation, UnicodeBlankName) {
    EXPECT_EQ(violation_of({decl("\xC2\xA0", {})}), input_violation::empty_name);
    EXPECT_EQ(violation_of({decl("\xE2\x80\xA8", {})}), input_violation::empty_name);
    EXPECT_EQ(violation_of({decl("\xEF\xBB\xBF", {})}), input_violation::empty_name);
    EXPECT_EQ(violation_of({decl(" \xE3\x80\x80\t", {})}), input_violation::empty_name);
    EXPECT_EQ(violation_of({decl("\xE2\x80\x8A\xC2\xA0", {})}), input_violation::empty_name);
}

TEST(GraphBuilderValidation, NameWithUnicodeSpaceAccepted) {
    auto const g = ig::build_graph({decl("\xC2\xA0X", {}), decl("\xE2\x80\x8B", {})});
    EXPECT_EQ(g.node_count(), 2u);
    // A lone continuation byte is content, not white space.
    EXPECT_EQ(ig::build_graph({decl("\xA0", {})}).node_count(), 1u);
}

TEST(GraphBuilderValidation, MissingKind) {
    auto d = decl("A", {});
    d.kind.reset();
    EXPECT_EQ(violation_of({d}), input_violation::invalid_kind);
}

TEST(GraphBuilderValidation, MissingDependencies) {
    auto d = decl("A", {});
    d.dependencies.reset();
    EXPECT_EQ(violation_of({d}), input_violation::missing_dependencies);
}

TEST(GraphBuilderValidation, DependenciesNotArray) {
    auto d = decl("A", {});
    d.dependencies.reset();
    d.dependencies_not_array = true;
    EXPECT_EQ(violation_of({d}), input_violation::dependencies_not_array);
}

TEST(GraphBuilderValidation, MissingToken) {
    ig::dependency_declaration bad;
    EXPECT_EQ(violation_of({decl("A", {dep("B"), bad})}), input_violation::invalid_token);
}

TEST(GraphBuilderValidation, NameCheckedBeforeKind) {
    auto d = decl("", {});
    d.kind.reset();
    EXPECT_EQ(violation_of({d}), input_violation::empty_name);
}

TEST(GraphBuilderValidation, FirstInvalidDeclarationReported) {
    auto no_kind = decl("B", {});
    no_kind.kind.reset();
    auto no_deps = decl("C", {});
    no_deps.dependencies.reset();
    EXPECT_EQ(violation_of({decl("A", {}), no_kind, no_deps}), input_violation::invalid_kind);
}

TEST(GraphBuilderValidation, MessagesAreFixed) {
    auto d = decl("A", {});
    d.dependencies.reset();
    try {
        (void)ig::build_graph({d});
        FAIL() << "expected graph_input_error";
    } catch (ig::graph_input_error const& e) {
        EXPECT_STREQ(e.what(), "ParsedClass must have a dependencies array");
    }
    EXPECT_STREQ(ig::violation_message(input_violation::empty_name),
                 "ParsedClass name cannot be empty");
    EXPECT_STREQ(ig::violation_message(input_violation::invalid_token),
                 "ParsedDependency must have a valid token property");
}

TEST(GraphBuilderValidation, ErrorIsInvalidArgument) {
    auto d = decl("A", {});
    d.kind.reset();
    EXPECT_THROW((void)ig::build_graph({d}), std::invalid_argument);
    EXPECT_NO_THROW(ig::validate_declarations({decl("A", {dep("B")})}));
}

// =============================================================================
// 2. Cycle scenarios
// =============================================================================

TEST(GraphBuilder, EmptyInput) {
    auto const g = ig::build_graph({});
    EXPECT_TRUE(g.empty());
    EXPECT_EQ(g.edge_count(), 0u);
    EXPECT_TRUE(g.circular_dependencies.empty());
}

TEST(GraphBuilder, TwoNodeCycle) {
    auto const g = ig::build_graph({decl("A", {dep("B")}), decl("B", {dep("A")})});
    ASSERT_EQ(g.node_count(), 2u);
    ASSERT_EQ(g.edge_count(), 2u);
    EXPECT_EQ(g.edges[0].is_circular, std::optional<bool>(true));
    EXPECT_EQ(g.edges[1].is_circular, std::optional<bool>(true));
    ASSERT_EQ(g.circular_dependencies.size(), 1u);
    EXPECT_EQ(g.circular_dependencies[0], (ig::cycle{"A", "B", "A"}));
}

TEST(GraphBuilder, SelfLoop) {
    auto const g = ig::build_graph({decl("A", {dep("A")})});
    ASSERT_EQ(g.node_count(), 1u);
    ASSERT_EQ(g.edge_count(), 1u);
    EXPECT_EQ(g.edges[0].from, "A");
    EXPECT_EQ(g.edges[0].to, "A");
    EXPECT_EQ(g.edges[0].is_circular, std::optional<bool>(true));
    EXPECT_EQ(g.circular_dependencies, (std::vector<ig::cycle>{{"A", "A"}}));
}

TEST(GraphBuilder, AcyclicEdgesLeaveCircularUnset) {
    auto const g = ig::build_graph({decl("A", {dep("B")}), decl("B", {})});
    ASSERT_EQ(g.edge_count(), 1u);
    EXPECT_FALSE(g.edges[0].is_circular.has_value());
    EXPECT_TRUE(g.circular_dependencies.empty());
}

// =============================================================================
// 3. Unknown nodes
// =============================================================================

TEST(GraphBuilder, UndeclaredTokenBecomesUnknownNode) {
    auto const g = ig::build_graph({decl("A", {}), decl("B", {dep("X")})});
    EXPECT_EQ(node_ids(g), (std::vector<std::string>{"A", "B", "X"}));
    EXPECT_EQ(g.nodes[2], (ig::node{"X", ig::node_kind::unknown}));
}

TEST(GraphBuilder, UnknownNodeCreatedOnce) {
    auto const g = ig::build_graph({decl("A", {dep("X")}), decl("B", {dep("X")})});
    EXPECT_EQ(g.node_count(), 3u);
    EXPECT_EQ(g.edge_count(), 2u);
}

TEST(GraphBuilder, UnrecognisedKindIsUnknown) {
    auto const g = ig::build_graph({decl("P", {}, "pipe")});
    EXPECT_EQ(g.nodes[0].kind, ig::node_kind::unknown);
}

TEST(GraphBuilder, LaterDeclarationReplacesUnknown) {
    // B is referenced before it is declared; its declared kind still wins.
    auto const g = ig::build_graph({decl("A", {dep("B")}), decl("B", {}, "directive")});
    EXPECT_EQ(g.nodes[1], (ig::node{"B", ig::node_kind::directive}));
}

// =============================================================================
// 4. First declaration wins
// =============================================================================

TEST(GraphBuilder, DuplicateNameFirstKindWins) {
    auto const g = ig::build_graph({
        decl("A", {dep("B")}, "component"),
        decl("A", {dep("C")}, "service"),
    });
    ASSERT_EQ(node_ids(g), (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_EQ(g.nodes[0].kind, ig::node_kind::component);
    // Both declarations contribute edges.
    ASSERT_EQ(g.edge_count(), 2u);
    EXPECT_EQ(g.edges[0].to, "B");
    EXPECT_EQ(g.edges[1].to, "C");
}

// =============================================================================
// 5. Flags
// =============================================================================

TEST(GraphBuilder, FlagsAbsentVersusEmpty) {
    auto const g = ig::build_graph({
        decl("A", {dep("B"), dep("C", ig::edge_flags{})}),
    });
    ASSERT_EQ(g.edge_count(), 2u);
    EXPECT_FALSE(g.edges[0].flags.has_value());
    ASSERT_TRUE(g.edges[1].flags.has_value());
    EXPECT_EQ(*g.edges[1].flags, ig::edge_flags{});
}

TEST(GraphBuilder, FlagsCopiedVerbatim) {
    ig::edge_flags f;
    f.optional = true;
    f.host = false;
    auto const g = ig::build_graph({decl("A", {dep("B", f)})});
    ASSERT_TRUE(g.edges[0].flags.has_value());
    EXPECT_EQ(g.edges[0].flags->optional, std::optional<bool>(true));
    EXPECT_EQ(g.edges[0].flags->host, std::optional<bool>(false));
    EXPECT_FALSE(g.edges[0].flags->self.has_value());
    EXPECT_FALSE(g.edges[0].flags->skip_self.has_value());
}

// =============================================================================
// 6. Ordering
// =============================================================================

TEST(GraphBuilder, NodesSortedById) {
    auto const g = ig::build_graph({decl("C", {}), decl("A", {dep("D")}), decl("B", {})});
    EXPECT_EQ(node_ids(g), (std::vector<std::string>{"A", "B", "C", "D"}));
}

TEST(GraphBuilder, OrdinalComparison) {
    auto const g = ig::build_graph({decl("alpha", {}), decl("Beta", {}), decl("_x", {})});
    EXPECT_EQ(node_ids(g), (std::vector<std::string>{"Beta", "_x", "alpha"}));
}

TEST(GraphBuilder, EdgesSortedByFromThenTo) {
    auto const g = ig::build_graph({
        decl("B", {dep("C"), dep("A")}),
        decl("A", {dep("C"), dep("B")}),
    });
    ASSERT_EQ(g.edge_count(), 4u);
    EXPECT_EQ(g.edges[0].from + g.edges[0].to, "AB");
    EXPECT_EQ(g.edges[1].from + g.edges[1].to, "AC");
    EXPECT_EQ(g.edges[2].from + g.edges[2].to, "BA");
    EXPECT_EQ(g.edges[3].from + g.edges[3].to, "BC");
}

TEST(GraphBuilder, ParallelEdgesKeptInDeclarationOrder) {
    ig::edge_flags f;
    f.optional = true;
    auto const g = ig::build_graph({decl("A", {dep("B", f), dep("B")}), decl("B", {})});
    ASSERT_EQ(g.edge_count(), 2u);
    EXPECT_TRUE(g.edges[0].flags.has_value());
    EXPECT_FALSE(g.edges[1].flags.has_value());
}

// =============================================================================
// 7. Invariants
// =============================================================================

TEST(GraphBuilder, StructuralInvariants) {
    auto const g = ig::build_graph({
        decl("AppComponent", {dep("UserService"), dep("Logger")}, "component"),
        decl("UserService", {dep("HttpClient"), dep("AuthService")}),
        decl("AuthService", {dep("UserService"), dep("Logger")}),
        decl("Logger", {dep("Logger")}),
        decl("Tooltip", {}, "directive"),
    });

    auto const ids = node_ids(g);
    EXPECT_TRUE(std::is_sorted(ids.begin(), ids.end()));
    EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()).size(), ids.size());

    EXPECT_TRUE(std::is_sorted(g.edges.begin(), g.edges.end(),
        [](ig::edge const& a, ig::edge const& b) {
            return a.from != b.from ? a.from < b.from : a.to < b.to;
        }));

    std::set<std::pair<std::string, std::string>> steps;
    for (auto const& c : g.circular_dependencies) {
        for (std::size_t i = 0; i + 1 < c.size(); ++i) steps.emplace(c[i], c[i + 1]);
    }
    for (auto const& e : g.edges) {
        EXPECT_TRUE(std::binary_search(ids.begin(), ids.end(), e.from));
        EXPECT_TRUE(std::binary_search(ids.begin(), ids.end(), e.to));
        bool const circular = e.is_circular.value_or(false);
        EXPECT_EQ(circular, steps.count({e.from, e.to}) == 1)
            << e.from << " -> " << e.to;
    }

    EXPECT_EQ(g.circular_dependencies,
              (std::vector<ig::cycle>{{"Logger", "Logger"},
                                      {"UserService", "AuthService", "UserService"}}));
}

// =============================================================================
// 8. Logging
// =============================================================================

TEST(GraphBuilderLogging, ReportsProgressAndCycles) {
    std::ostringstream oss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
    auto logger = std::make_shared<spdlog::logger>("builder-test", sink);
    logger->set_pattern("%l %v");
    logger->set_level(spdlog::level::debug);

    std::vector<ig::class_declaration> const decls{
        decl("A", {dep("B")}), decl("B", {dep("A"), dep("Ghost")})};
    auto const logged = ig::build_graph(decls, logger);
    auto const text = oss.str();

    EXPECT_NE(text.find("Created unknown node: Ghost"), std::string::npos);
    EXPECT_NE(text.find("Created 3 nodes (2 declared, 1 unknown)"), std::string::npos);
    EXPECT_NE(text.find("warning [graph-construction] Detected 1 circular dependencies"),
              std::string::npos);
    EXPECT_NE(text.find("[performance] Graph construction complete"), std::string::npos);

    EXPECT_EQ(logged, ig::build_graph(decls));
}
