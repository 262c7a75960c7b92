#include <strata/strata.h>

#include <cstring>
#include <iostream>

namespace {

void printNodes(const strata::LayoutGraph& graph) {
    for (const auto& v : graph.nodes()) {
        const auto& node = graph.node(v);
        std::cout << "  " << v << ": x=" << node.x.value_or(0.0) << " y=" << node.y.value_or(0.0)
                  << " " << node.width << "x" << node.height << "\n";
    }
}

int layoutFile(const char* path, bool conservative) {
    auto graph = strata::LayoutSerializer::loadFromFile(path);
    if (!graph) {
        std::cerr << "Could not load " << path << "\n";
        return 1;
    }
    if (conservative) {
        strata::layout(*graph);
    } else {
        strata::layoutDagreish(*graph);
    }
    std::cout << strata::LayoutSerializer::toJson(*graph) << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    using namespace strata;

    Logger::initialize();

    // layout_demo [--conservative] graph.json
    if (argc > 1) {
        bool conservative = std::strcmp(argv[1], "--conservative") == 0;
        int pathIndex = conservative ? 2 : 1;
        if (pathIndex >= argc) {
            std::cerr << "usage: layout_demo [--conservative] graph.json\n";
            return 2;
        }
        return layoutFile(argv[pathIndex], conservative);
    }

    std::cout << "strata " << versionString() << "\n";

    // 1. Simple graph
    {
        LayoutGraph graph(GraphOptions{true, true, false});
        graph.setNode("Start", NodeLabel(80, 40));
        graph.setNode("Process A", NodeLabel(100, 40));
        graph.setNode("Process B", NodeLabel(100, 40));
        graph.setNode("End", NodeLabel(80, 40));

        graph.setEdge("Start", "Process A");
        graph.setEdge("Start", "Process B");
        graph.setEdge("Process A", "End");
        graph.setEdge("Process B", "End");

        layoutDagreish(graph);
        std::cout << "Simple graph:\n";
        printNodes(graph);
    }

    // 2. Compound graph (state machine style)
    {
        LayoutGraph graph(GraphOptions{true, true, true});
        graph.setNode("Idle", NodeLabel(100, 50));
        graph.setNode("Running");
        graph.setNode("Finished", NodeLabel(100, 50));
        graph.setNode("Init", NodeLabel(80, 40));
        graph.setNode("Execute", NodeLabel(80, 40));
        graph.setNode("Cleanup", NodeLabel(80, 40));

        graph.setParent("Init", "Running");
        graph.setParent("Execute", "Running");
        graph.setParent("Cleanup", "Running");

        graph.setEdge("Idle", "Init");
        graph.setEdge("Init", "Execute");
        graph.setEdge("Execute", "Cleanup");
        graph.setEdge("Cleanup", "Finished");

        layoutDagreish(graph);
        std::cout << "Compound graph:\n";
        printNodes(graph);
    }

    // 3. Graph with a cycle, left to right
    {
        LayoutGraph graph(GraphOptions{true, true, false});
        graph.graph().rankdir = Direction::LeftToRight;
        for (const char* id : {"A", "B", "C", "D", "E"}) {
            graph.setNode(id, NodeLabel(60, 40));
        }
        graph.setEdge("A", "B");
        graph.setEdge("A", "C");
        graph.setEdge("B", "D");
        graph.setEdge("C", "D");
        graph.setEdge("D", "E");
        graph.setEdge("E", "A");  // cycle back

        SugiyamaLayout engine;
        engine.layoutDagreish(graph);
        std::cout << "Cycle graph - reversed edges: " << engine.lastStats().reversedEdges
                  << ", crossings: " << engine.lastStats().crossings << "\n";
        printNodes(graph);
    }

    return 0;
}
