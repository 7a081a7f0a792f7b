// graph/graph_error.h — Declaration validation errors
// Part of the injgraph dependency-graph library (C++20)
//
// Contract violations in builder input are programming errors in the
// declaration extractor.  They are reported before any graph is built,
// one code per violated constraint, each with a fixed message that
// downstream tooling matches on.

#ifndef INJGRAPH_GRAPH_ERROR_H
#define INJGRAPH_GRAPH_ERROR_H

#include <cstdint>
#include <stdexcept>

namespace injgraph::graph {

enum class input_violation : std::uint8_t {
    null_input,
    invalid_name,
    empty_name,
    invalid_kind,
    missing_dependencies,
    dependencies_not_array,
    invalid_token
};

/// Fixed, human-readable message for each violation.
[[nodiscard]] constexpr char const* violation_message(input_violation v) noexcept {
    switch (v) {
        case input_violation::null_input:
            return "parsedClasses parameter cannot be null or undefined";
        case input_violation::invalid_name:
            return "ParsedClass must have a valid name property";
        case input_violation::empty_name:
            return "ParsedClass name cannot be empty";
        case input_violation::invalid_kind:
            return "ParsedClass must have a valid kind property";
        case input_violation::missing_dependencies:
            return "ParsedClass must have a dependencies array";
        case input_violation::dependencies_not_array:
            return "ParsedClass dependencies must be an array";
        case input_violation::invalid_token:
            return "ParsedDependency must have a valid token property";
    }
    return "invalid declaration input";
}

/// Thrown by validate_declarations / build_graph / read_declarations.
class graph_input_error : public std::invalid_argument {
public:
    explicit graph_input_error(input_violation v)
        : std::invalid_argument(violation_message(v)), code_(v) {}

    [[nodiscard]] input_violation code() const noexcept { return code_; }

private:
    input_violation code_;
};

} // namespace injgraph::graph

#endif // INJGRAPH_GRAPH_ERROR_H
