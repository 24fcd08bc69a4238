#ifndef DEPMAP_MODULE_SCANNER_HPP
#define DEPMAP_MODULE_SCANNER_HPP

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace depmap {
    struct scan_options {
        // Directory names (exact, case-sensitive) whose whole subtree is
        // ignored.
        std::set<std::string> excluded_dirs = {"src", "venv", ".git",
                                               "__pycache__"};
        // Files whose name contains this, ignoring case, are skipped.
        std::string backup_marker = "backup";
        std::string extension = ".py";
    };

    struct source_file {
        std::filesystem::path relative;
        std::filesystem::path absolute;
    };

    // Module identifier -> file. Ordered so that every run iterates the
    // modules the same way.
    using module_map = std::map<std::string, std::filesystem::path>;

    /// Lists every accepted source file under root, sorted by relative path.
    /// Throws std::filesystem::filesystem_error if root or any directory
    /// below it cannot be read.
    std::vector<source_file> list_source_files(const std::filesystem::path& root,
                                               const scan_options& options);

    /// "pkg/sub/mod.py" -> "pkg.sub.mod"
    std::string module_identifier(const std::filesystem::path& relative);

    /// Maps every accepted source file under root to its module identifier.
    /// When two files produce the same identifier the one that sorts last
    /// wins and a warning is printed.
    module_map scan_project_modules(const std::filesystem::path& root,
                                    const scan_options& options);

    bool is_backup_name(const std::string& file_name, const std::string& marker);
}

#endif
