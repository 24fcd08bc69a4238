#ifndef DEPMAP_IMPORT_EXTRACTOR_HPP
#define DEPMAP_IMPORT_EXTRACTOR_HPP

#include <filesystem>
#include <set>
#include <string>

namespace depmap {
    struct import_scan {
        std::set<std::string> imports;
        bool ok = true;
        std::string error;
    };

    /// Returns the members of known_modules that the file imports, either as
    /// "import <name>" or as the module of "from <name> import ...". Matching
    /// is on the exact dotted string. A file that is missing, not UTF-8 or
    /// not valid Python yields ok == false and no imports; a warning is
    /// written to std::cerr.
    import_scan extract_local_imports(const std::filesystem::path& file,
                                      const std::set<std::string>& known_modules);
}

#endif
