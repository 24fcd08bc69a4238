#include "depmap/dependency_graph.hpp"

#include <boost/graph/graphviz.hpp>

namespace depmap {
    module_category categorize(std::size_t in_degree)
    {
        if (in_degree > 5) {
            return module_category::critical;
        }
        if (in_degree > 2) {
            return module_category::important;
        }
        if (in_degree > 0) {
            return module_category::standard;
        }
        return module_category::entry_point;
    }

    const char* category_name(module_category category)
    {
        switch (category) {
        case module_category::critical:
            return "critical";
        case module_category::important:
            return "important";
        case module_category::standard:
            return "standard";
        case module_category::entry_point:
            break;
        }
        return "entry-point";
    }

    // Warmer colours for modules more of the project depends on.
    const char* category_color(module_category category)
    {
        switch (category) {
        case module_category::critical:
            return "orangered";
        case module_category::important:
            return "gold";
        case module_category::standard:
            return "lightskyblue";
        case module_category::entry_point:
            break;
        }
        return "palegreen";
    }

    std::string dot_escape(const std::string& text)
    {
        std::string escaped;
        for (char c : text) {
            if (c == '"' || c == '\\') {
                escaped += '\\';
            }
            escaped += c;
        }
        return escaped;
    }

    std::string node_label(const std::string& identifier)
    {
        std::string label;
        for (char c : identifier) {
            if (c == '.' || c == '_') {
                label += "\\n";
            } else {
                label += dot_escape(std::string(1, c));
            }
        }
        return label;
    }

    std::map<std::string, std::size_t> count_incoming(const import_map& imports)
    {
        std::map<std::string, std::size_t> incoming;
        for (const auto& entry : imports) {
            incoming[entry.first] = 0;
        }
        for (const auto& entry : imports) {
            for (const auto& imported : entry.second) {
                auto it = incoming.find(imported);
                if (it != incoming.end()) {
                    ++it->second;
                }
            }
        }
        return incoming;
    }

    dependency_graph build_dependency_graph(const import_map& imports)
    {
        dependency_graph graph;
        std::map<std::string, dependency_vertex> known_nodes;

        const auto incoming = count_incoming(imports);
        for (const auto& entry : incoming) {
            dependency_vertex v = boost::add_vertex(graph);
            graph[v].name = entry.first;
            graph[v].label = node_label(entry.first);
            graph[v].in_degree = entry.second;
            graph[v].category = categorize(entry.second);
            known_nodes[entry.first] = v;
        }

        for (const auto& entry : imports) {
            dependency_vertex source = known_nodes.at(entry.first);
            for (const auto& imported : entry.second) {
                auto target = known_nodes.find(imported);
                if (target == known_nodes.end()) {
                    continue; // Not part of the project
                }
                boost::add_edge(source, target->second, graph);
            }
        }
        return graph;
    }

    std::optional<dependency_vertex> find_module(const dependency_graph& graph,
                                                 const std::string& name)
    {
        auto vertices = boost::vertices(graph);
        for (auto it = vertices.first; it != vertices.second; ++it) {
            if (graph[*it].name == name) {
                return *it;
            }
        }
        return std::nullopt;
    }

    void write_dependency_dot(const dependency_graph& graph, std::ostream& out,
                              const std::string& title)
    {
        static const char* legend
            = "Colour legend (how many modules import a module):\\n"
              "Green: 0 (entry point)     "
              "Blue: 1-2 (standard)     "
              "Yellow: 3-5 (important)     "
              "Red: >5 (critical)";

        // Vertices are written by index; a module named "graph" or "node"
        // would otherwise be read as a DOT keyword.
        boost::write_graphviz(
            out, graph,
            [&](std::ostream& os, const dependency_vertex& v) {
                os << "[label=\"" << graph[v].label << "\", fillcolor=\""
                   << category_color(graph[v].category) << "\"]";
            },
            boost::default_writer(),
            [&](std::ostream& os) {
                os << "graph [rankdir=\"LR\", splines=\"ortho\", "
                      "nodesep=\"0.8\", fontsize=\"12\", label=\""
                   << dot_escape(title) << "\\n\\n" << legend << "\"];\n";
                os << "node [shape=\"box\", style=\"rounded,filled\"];\n";
                os << "edge [color=\"gray40\"];\n";
            });
    }
}
