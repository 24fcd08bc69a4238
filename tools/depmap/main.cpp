#include "depmap/python_ast.hpp"
#include "depmap/dependency_mapper.hpp"
#include "depmap/inventory.hpp"

#include <stdio.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

void print_usage(const char* program)
{
    printf("Usage: %s [options] [project_directory]\n"
           "  -o, --output <name>   output base name (default project_dependency_map)\n"
           "  -f, --format <fmt>    image format produced by dot (default png)\n"
           "  -x, --exclude <dir>   also skip directories with this name\n"
           "      --keep-source     keep the .dot file after rendering\n"
           "      --no-view         do not open the rendered image\n"
           "      --inventory       list classes and functions per file instead\n"
           "  -h, --help            show this help\n",
           program);
}

int run_inventory(const depmap::mapper_options& options,
                  const std::set<std::string>& extra_excludes)
{
    depmap::scan_options scan = depmap::inventory_scan_options();
    scan.excluded_dirs = extra_excludes;
    auto inventory = depmap::collect_inventory(options.root, scan);

    fs::path report_path = fs::canonical(options.root) / "inventory_report.txt";
    std::ofstream report(report_path);
    if (!report) {
        std::cerr << "Error: Unable to create " << report_path.string() << "\n";
        return 1;
    }
    depmap::print_inventory(inventory, report);
    report.close();

    depmap::print_inventory(inventory, std::cout);
    std::cout << "\nInventory saved to: " << report_path.string() << std::endl;
    return 0;
}

int main(int argc, char* argv[])
{
    depmap::mapper_options options;
    // Without an argument the tool maps the directory it lives in.
    std::error_code ec;
    fs::path executable = fs::read_symlink("/proc/self/exe", ec);
    options.root = ec ? fs::absolute(argv[0]).parent_path()
                      : executable.parent_path();
    bool inventory_mode = false;
    bool root_given = false;
    std::set<std::string> extra_excludes;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool takes_value = arg == "-o" || arg == "--output" || arg == "-f"
                           || arg == "--format" || arg == "-x"
                           || arg == "--exclude";
        if (takes_value && i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value.\n";
            print_usage(argv[0]);
            return 1;
        }

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-o" || arg == "--output") {
            options.render.output_base = argv[++i];
        } else if (arg == "-f" || arg == "--format") {
            options.render.format = argv[++i];
        } else if (arg == "-x" || arg == "--exclude") {
            extra_excludes.insert(argv[i + 1]);
            options.scan.excluded_dirs.insert(argv[++i]);
        } else if (arg == "--keep-source") {
            options.render.keep_source = true;
        } else if (arg == "--no-view") {
            options.render.view = false;
        } else if (arg == "--inventory") {
            inventory_mode = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else if (root_given) {
            std::cerr << "Error: Only one project directory can be given.\n";
            print_usage(argv[0]);
            return 1;
        } else {
            options.root = arg;
            root_given = true;
        }
    }

    depmap::python_interpreter interpreter;

    try {
        if (inventory_mode) {
            return run_inventory(options, extra_excludes);
        }

        depmap::graphviz_engine engine;
        depmap::generate_dependency_map(options, engine);
    }
    catch (const fs::filesystem_error& e) {
        std::cerr << "Error: Unable to scan " << options.root.string() << ": "
                  << e.what() << std::endl;
        return 1;
    }
    catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
