#include "depmap/module_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace fs = std::filesystem;

namespace depmap {
    namespace {
        std::string to_lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            return s;
        }
    }

    bool is_backup_name(const std::string& file_name, const std::string& marker)
    {
        if (marker.empty()) {
            return false;
        }
        return to_lower(file_name).find(to_lower(marker)) != std::string::npos;
    }

    std::string module_identifier(const fs::path& relative)
    {
        fs::path stem_path = relative;
        stem_path.replace_extension();

        std::string identifier;
        for (const auto& part : stem_path) {
            if (!identifier.empty()) {
                identifier += '.';
            }
            identifier += part.string();
        }
        return identifier;
    }

    std::vector<source_file> list_source_files(const fs::path& root,
                                               const scan_options& options)
    {
        const fs::path root_path = fs::canonical(root);
        std::vector<source_file> files;

        // Default iteration throws on the first unreadable directory, which
        // aborts the whole scan.
        for (auto it = fs::recursive_directory_iterator(root_path);
             it != fs::recursive_directory_iterator(); ++it) {
            const fs::path& path = it->path();
            const std::string name = path.filename().string();

            if (it->is_directory()) {
                if (options.excluded_dirs.count(name)) {
                    std::cout << "  -> Excluded directory skipped: "
                              << path.lexically_relative(root_path).string()
                              << std::endl;
                    it.disable_recursion_pending();
                }
                continue;
            }

            if (!it->is_regular_file()
                || path.extension().string() != options.extension) {
                continue;
            }

            if (is_backup_name(name, options.backup_marker)) {
                std::cout << "  -> Backup file excluded: " << name << std::endl;
                continue;
            }

            files.push_back({path.lexically_relative(root_path), path});
        }

        std::sort(files.begin(), files.end(),
                  [](const source_file& a, const source_file& b) {
                      return a.relative.generic_string()
                             < b.relative.generic_string();
                  });
        return files;
    }

    module_map scan_project_modules(const fs::path& root,
                                    const scan_options& options)
    {
        module_map modules;
        for (const auto& file : list_source_files(root, options)) {
            std::string identifier = module_identifier(file.relative);
            auto found = modules.find(identifier);
            if (found != modules.end()) {
                std::cerr << "Warning: module " << identifier << " from "
                          << file.relative.string() << " replaces "
                          << found->second.string() << std::endl;
                found->second = file.absolute;
                continue;
            }
            modules.emplace(std::move(identifier), file.absolute);
        }
        return modules;
    }
}
