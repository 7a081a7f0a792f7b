// apps/injgraph/main.cpp — injgraph command-line entry point
//
// Reads dependency-injection declarations (JSON), builds the dependency
// graph, optionally filters it from entry points and prints it as JSON
// or a Mermaid flowchart.

#include <injgraph/cli/cli_app.h>

#include <iostream>

int main(int argc, char** argv) {
    return injgraph::cli::run_main(argc, argv, std::cin, std::cout, std::cerr);
}
