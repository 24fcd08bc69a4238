#ifndef DEPMAP_DEPENDENCY_MAPPER_HPP
#define DEPMAP_DEPENDENCY_MAPPER_HPP

#include "depmap/dependency_graph.hpp"
#include "depmap/graph_renderer.hpp"
#include "depmap/module_scanner.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace depmap {
    struct analysis_options {
        // Modules left out of the graph entirely. The companion mapper
        // script must not show up as a node of its own map.
        std::set<std::string> ignored_modules = {"dependency_mapper"};
    };

    struct mapper_options {
        std::filesystem::path root = ".";
        scan_options scan;
        analysis_options analysis;
        render_options render;
    };

    struct mapper_result {
        module_map modules;
        import_map imports;
        // Module identifier -> parse error, for files contributing no edges.
        std::map<std::string, std::string> failures;
        dependency_graph graph;
        // Empty when there was nothing to render.
        std::optional<render_status> render;
    };

    /// Parses every module of the map except the ignored ones and returns
    /// its project-local imports.
    import_map analyze_imports(const module_map& modules,
                               const analysis_options& options,
                               std::map<std::string, std::string>& failures);

    /// Scan, parse, build and render in one batch, printing progress to
    /// std::cout. Throws std::filesystem::filesystem_error if the project
    /// cannot be scanned and std::runtime_error if rendering fails.
    mapper_result generate_dependency_map(const mapper_options& options,
                                          layout_engine& engine);
}

#endif
