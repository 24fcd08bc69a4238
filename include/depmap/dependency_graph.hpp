#ifndef DEPMAP_DEPENDENCY_GRAPH_HPP
#define DEPMAP_DEPENDENCY_GRAPH_HPP

#include <boost/graph/adjacency_list.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <string>

namespace depmap {
    // How widely a module is imported, from least to most.
    enum class module_category {
        entry_point, // imported by nobody
        standard,    // 1-2
        important,   // 3-5
        critical     // more than 5
    };

    struct module_node {
        std::string name;
        std::string label;
        std::size_t in_degree = 0;
        module_category category = module_category::entry_point;
    };

    // setS out-edges: an import is either present or not, no multiplicity.
    using dependency_graph = boost::adjacency_list<boost::setS, boost::vecS,
                                                   boost::directedS, module_node>;
    using dependency_vertex
        = boost::graph_traits<dependency_graph>::vertex_descriptor;

    // Module identifier -> identifiers of the project modules it imports.
    using import_map = std::map<std::string, std::set<std::string>>;

    module_category categorize(std::size_t in_degree);
    const char* category_name(module_category category);
    const char* category_color(module_category category);

    /// Backslash-escapes '"' and '\\' for use inside a quoted DOT string.
    std::string dot_escape(const std::string& text);

    /// Breaks an identifier on '.' and '_' so long names stay readable inside
    /// a node ("core.portfolio_manager" -> "core\nportfolio\nmanager", with
    /// a DOT line break escape).
    std::string node_label(const std::string& identifier);

    /// Number of distinct modules importing each key of imports. Targets
    /// that are not keys are ignored.
    std::map<std::string, std::size_t> count_incoming(const import_map& imports);

    /// One vertex per key of imports, in identifier order, and one edge per
    /// (module, import) pair whose target is also a key.
    dependency_graph build_dependency_graph(const import_map& imports);

    std::optional<dependency_vertex> find_module(const dependency_graph& graph,
                                                 const std::string& name);

    /// Writes the graph in Graphviz DOT. Vertices are identified by index and
    /// named only through their labels. The graph label is title followed by
    /// the colour legend.
    void write_dependency_dot(const dependency_graph& graph, std::ostream& out,
                              const std::string& title = "Project Dependency Map");
}

#endif
