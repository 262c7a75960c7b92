#include "strata/layout/util/LayoutSerializer.h"
#include "strata/common/Logger.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace strata {

namespace {

json optionsObject(const LayoutOptions& options) {
    json j;
    j["rankdir"] = toString(options.rankdir);
    j["nodesep"] = options.nodesep;
    j["ranksep"] = options.ranksep;
    j["edgesep"] = options.edgesep;
    j["marginx"] = options.marginx;
    j["marginy"] = options.marginy;
    j["acyclicer"] = options.acyclicer == CycleRemovalStrategy::Greedy ? "greedy" : "dfs";
    j["ranker"] = toString(options.ranker);
    if (options.align) {
        j["align"] = toString(*options.align);
    }
    return j;
}

void readOptions(const json& j, LayoutOptions& options) {
    if (j.contains("rankdir")) {
        std::string text = j["rankdir"].get<std::string>();
        if (auto dir = directionFromString(text)) {
            options.rankdir = *dir;
        } else {
            LOG_WARN("Unknown rankdir '{}', keeping {}", text, toString(options.rankdir));
        }
    }
    options.nodesep = j.value("nodesep", options.nodesep);
    options.ranksep = j.value("ranksep", options.ranksep);
    options.edgesep = j.value("edgesep", options.edgesep);
    options.marginx = j.value("marginx", options.marginx);
    options.marginy = j.value("marginy", options.marginy);
    if (j.contains("acyclicer")) {
        options.acyclicer = j["acyclicer"].get<std::string>() == "greedy"
                                ? CycleRemovalStrategy::Greedy
                                : CycleRemovalStrategy::DepthFirst;
    }
    if (j.contains("ranker")) {
        std::string text = j["ranker"].get<std::string>();
        if (auto ranker = rankingStrategyFromString(text)) {
            options.ranker = *ranker;
        } else {
            LOG_WARN("Unknown ranker '{}', keeping {}", text, toString(options.ranker));
        }
    }
    if (j.contains("align")) {
        std::string text = j["align"].get<std::string>();
        options.align = alignmentFromString(text);
        if (!options.align) {
            LOG_WARN("Unknown align '{}', balancing all alignments", text);
        }
    }
}

template <typename T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename T>
std::optional<T> getOptional(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    return j[key].get<T>();
}

}  // namespace

std::string LayoutSerializer::optionsToJson(const LayoutOptions& options) {
    return optionsObject(options).dump(2);
}

std::optional<LayoutOptions> LayoutSerializer::optionsFromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            LOG_ERROR("Layout options must be a JSON object");
            return std::nullopt;
        }
        LayoutOptions options;
        readOptions(j, options);
        return options;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse layout options: {}", e.what());
        return std::nullopt;
    }
}

std::string LayoutSerializer::toJson(const LayoutGraph& graph) {
    json j;
    j["options"] = optionsObject(graph.graph());
    j["graph"] = {{"multigraph", graph.isMultigraph()}, {"compound", graph.isCompound()}};

    json nodes = json::array();
    for (const auto& v : graph.nodes()) {
        const NodeLabel& node = graph.node(v);
        json nodeJson;
        nodeJson["id"] = v;
        nodeJson["width"] = node.width;
        nodeJson["height"] = node.height;
        putOptional(nodeJson, "parent", graph.parent(v));
        putOptional(nodeJson, "x", node.x);
        putOptional(nodeJson, "y", node.y);
        putOptional(nodeJson, "rank", node.rank);
        putOptional(nodeJson, "order", node.order);
        nodes.push_back(nodeJson);
    }
    j["nodes"] = nodes;

    json edges = json::array();
    for (const auto& e : graph.edges()) {
        const EdgeLabel& edge = graph.edge(e);
        json edgeJson;
        edgeJson["v"] = e.v;
        edgeJson["w"] = e.w;
        putOptional(edgeJson, "name", e.name);
        edgeJson["weight"] = edge.weight;
        edgeJson["minlen"] = edge.minlen;
        edgeJson["width"] = edge.width;
        edgeJson["height"] = edge.height;
        edgeJson["labelpos"] = toString(edge.labelpos);
        edgeJson["labeloffset"] = edge.labeloffset;
        if (!edge.points.empty()) {
            json points = json::array();
            for (const auto& p : edge.points) {
                points.push_back({{"x", p.x}, {"y", p.y}});
            }
            edgeJson["points"] = points;
        }
        putOptional(edgeJson, "x", edge.x);
        putOptional(edgeJson, "y", edge.y);
        edges.push_back(edgeJson);
    }
    j["edges"] = edges;

    return j.dump(2);
}

std::optional<LayoutGraph> LayoutSerializer::graphFromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        bool anyParent = false;
        if (j.contains("nodes")) {
            for (const auto& nodeJson : j["nodes"]) {
                anyParent = anyParent || nodeJson.contains("parent");
            }
        }
        GraphOptions graphOptions;
        if (j.contains("graph")) {
            graphOptions.multigraph = j["graph"].value("multigraph", false);
            graphOptions.compound = j["graph"].value("compound", false);
        }
        graphOptions.compound = graphOptions.compound || anyParent;

        LayoutGraph graph(graphOptions);
        GraphLabel label;
        if (j.contains("options")) {
            readOptions(j["options"], label);
        }
        graph.setGraph(std::move(label));

        if (j.contains("nodes")) {
            for (const auto& nodeJson : j["nodes"]) {
                NodeLabel node(nodeJson.value("width", 0.0), nodeJson.value("height", 0.0));
                node.x = getOptional<double>(nodeJson, "x");
                node.y = getOptional<double>(nodeJson, "y");
                node.rank = getOptional<int>(nodeJson, "rank");
                node.order = getOptional<int>(nodeJson, "order");
                graph.setNode(nodeJson.at("id").get<std::string>(), std::move(node));
            }
            for (const auto& nodeJson : j["nodes"]) {
                if (auto parent = getOptional<std::string>(nodeJson, "parent")) {
                    graph.setParent(nodeJson.at("id").get<std::string>(), *parent);
                }
            }
        }

        if (j.contains("edges")) {
            for (const auto& edgeJson : j["edges"]) {
                EdgeLabel edge;
                edge.weight = edgeJson.value("weight", edge.weight);
                edge.minlen = edgeJson.value("minlen", edge.minlen);
                edge.width = edgeJson.value("width", edge.width);
                edge.height = edgeJson.value("height", edge.height);
                edge.labeloffset = edgeJson.value("labeloffset", edge.labeloffset);
                if (edgeJson.contains("labelpos")) {
                    std::string text = edgeJson["labelpos"].get<std::string>();
                    if (auto pos = labelPosFromString(text)) {
                        edge.labelpos = *pos;
                    } else {
                        LOG_WARN("Unknown labelpos '{}', keeping {}", text, toString(edge.labelpos));
                    }
                }
                if (edgeJson.contains("points")) {
                    for (const auto& p : edgeJson["points"]) {
                        edge.points.push_back({p.at("x").get<double>(), p.at("y").get<double>()});
                    }
                }
                edge.x = getOptional<double>(edgeJson, "x");
                edge.y = getOptional<double>(edgeJson, "y");
                graph.setEdge(edgeJson.at("v").get<std::string>(), edgeJson.at("w").get<std::string>(),
                              std::move(edge), getOptional<std::string>(edgeJson, "name"));
            }
        }

        return graph;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse graph: {}", e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid graph structure: {}", e.what());
        return std::nullopt;
    }
}

bool LayoutSerializer::saveToFile(const LayoutGraph& graph, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open {} for writing", path);
        return false;
    }
    file << toJson(graph);
    return true;
}

std::optional<LayoutGraph> LayoutSerializer::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open {}", path);
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return graphFromJson(buffer.str());
}

}  // namespace strata
