// graph/graph_io.h — I/O layer: JSON output, declaration input, Mermaid export
// Part of the injgraph dependency-graph library (C++20)
//
// Umbrella header.  For compilation-time-sensitive translation units,
// prefer including individual headers:
//
//   graph_io_json.h     — JSON graph output and declaration parsing
//   graph_io_mermaid.h  — Mermaid flowchart export (no JSON dependency)

#ifndef INJGRAPH_GRAPH_IO_H
#define INJGRAPH_GRAPH_IO_H

#include "graph_io_json.h"
#include "graph_io_mermaid.h"

#endif // INJGRAPH_GRAPH_IO_H
