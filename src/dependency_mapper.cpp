#include "depmap/dependency_mapper.hpp"
#include "depmap/import_extractor.hpp"

#include <iostream>

namespace depmap {
    import_map analyze_imports(const module_map& modules,
                               const analysis_options& options,
                               std::map<std::string, std::string>& failures)
    {
        std::set<std::string> known_modules;
        for (const auto& entry : modules) {
            known_modules.insert(entry.first);
        }

        import_map imports;
        for (const auto& entry : modules) {
            if (options.ignored_modules.count(entry.first)) {
                continue;
            }
            import_scan scan = extract_local_imports(entry.second, known_modules);
            if (!scan.ok) {
                // An unparsable module is neither source nor target of an edge.
                failures[entry.first] = scan.error;
                continue;
            }
            imports[entry.first] = std::move(scan.imports);
        }
        return imports;
    }

    mapper_result generate_dependency_map(const mapper_options& options,
                                          layout_engine& engine)
    {
        mapper_result result;

        std::cout << "Scanning project modules..." << std::endl;
        result.modules = scan_project_modules(options.root, options.scan);
        if (result.modules.empty()) {
            std::cout << "No Python (" << options.scan.extension
                      << ") files found in the directory." << std::endl;
            return result;
        }
        std::cout << "Found " << result.modules.size()
                  << " modules in the project." << std::endl;

        std::cout << "Analyzing dependencies..." << std::endl;
        result.imports
            = analyze_imports(result.modules, options.analysis, result.failures);
        if (!result.failures.empty()) {
            std::cout << result.failures.size()
                      << " file(s) could not be analyzed and were left out."
                      << std::endl;
        }

        std::cout << "Counting incoming dependencies for colouring..."
                  << std::endl;
        result.graph = build_dependency_graph(result.imports);

        std::cout << "Generating the diagram..." << std::endl;
        result.render
            = render_dependency_map(result.graph, options.render, engine).status;
        return result;
    }
}
