#ifndef DEPMAP_INVENTORY_HPP
#define DEPMAP_INVENTORY_HPP

#include "depmap/module_scanner.hpp"

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace depmap {
    struct inventory_entry {
        std::filesystem::path file;
        std::vector<std::string> classes;
        // Top-level functions and methods alike.
        std::vector<std::string> functions;
    };

    /// Scan options for the inventory: every directory is walked, only backup
    /// files are dropped.
    scan_options inventory_scan_options();

    /// Lists the classes and functions defined in each accepted source file
    /// under root. Unparsable files are reported on std::cerr and skipped.
    /// Throws std::runtime_error if the ast module itself cannot be loaded.
    std::vector<inventory_entry> collect_inventory(const std::filesystem::path& root,
                                                   const scan_options& options
                                                   = inventory_scan_options());

    void print_inventory(const std::vector<inventory_entry>& inventory,
                         std::ostream& out);
}

#endif
