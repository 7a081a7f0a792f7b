// graph/graph.h — Umbrella header for the injgraph graph engine
// Part of the injgraph dependency-graph library (C++20)
//
// Single-include convenience header for the engine: value types,
// adjacency index, cycle detection, construction and filtering.
//
// Usage:
//   #include <injgraph/graph/graph.h>
//
// The formatters are not included here because they pull in
// nlohmann/json.hpp.  Include graph_io.h directly when needed:
//   #include <injgraph/graph/graph_io.h>

#ifndef INJGRAPH_GRAPH_GRAPH_H
#define INJGRAPH_GRAPH_GRAPH_H

// --- Core types ---
#include "graph_types.h"
#include "graph_error.h"

// --- Indexing & algorithms ---
#include "adjacency_index.h"
#include "cycle_detector.h"
#include "cycle_shape.h"

// --- Construction & transforms ---
#include "graph_builder.h"
#include "graph_filter.h"

#endif // INJGRAPH_GRAPH_GRAPH_H
