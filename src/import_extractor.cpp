#include "depmap/python_ast.hpp"
#include "depmap/import_extractor.hpp"

#include <iostream>

namespace depmap {
    namespace {
        // Collects alias.name for every alias of an ast.Import node.
        void collect_import_names(PyObject* node,
                                  const std::set<std::string>& known_modules,
                                  std::set<std::string>& imports)
        {
            PyObject* names = PyObject_GetAttrString(node, "names");
            if (!names || !PyList_Check(names)) {
                Py_XDECREF(names);
                PyErr_Clear();
                return;
            }
            Py_ssize_t len = PyList_Size(names);
            for (Py_ssize_t i = 0; i < len; ++i) {
                PyObject* alias = PyList_GetItem(names, i); // borrowed reference
                std::string name;
                if (alias && get_string_attr(alias, "name", name)
                    && known_modules.count(name)) {
                    imports.insert(name);
                }
            }
            Py_DECREF(names);
        }
    }

    import_scan extract_local_imports(const std::filesystem::path& file,
                                      const std::set<std::string>& known_modules)
    {
        import_scan scan;

        parse_result parsed = parse_python_file(file);
        if (!parsed.tree) {
            scan.ok = false;
            scan.error = parsed.error;
            std::cerr << "Warning: Unable to analyze file " << file.string()
                      << ". Error: " << scan.error << std::endl;
            return scan;
        }

        PyObject* import_cls = load_ast_class("Import");
        PyObject* import_from_cls = load_ast_class("ImportFrom");
        if (!import_cls || !import_from_cls) {
            Py_XDECREF(import_cls);
            Py_XDECREF(import_from_cls);
            Py_DECREF(parsed.tree);
            scan.ok = false;
            scan.error = fetch_python_error();
            std::cerr << "Warning: ast module unavailable while analyzing "
                      << file.string() << ": " << scan.error << std::endl;
            return scan;
        }

        std::string walk_error;
        bool walked = walk_ast(parsed.tree, [&](PyObject* node) {
            int is_import = PyObject_IsInstance(node, import_cls);
            int is_import_from = is_import == 1
                ? 0 : PyObject_IsInstance(node, import_from_cls);
            if (is_import < 0 || is_import_from < 0) {
                PyErr_Clear();
                return;
            }

            if (is_import) {
                collect_import_names(node, known_modules, scan.imports);
            } else if (is_import_from) {
                // "from . import x" has module None and is skipped; the
                // relative level of "from .x import y" is not considered.
                std::string module;
                if (get_string_attr(node, "module", module)
                    && known_modules.count(module)) {
                    scan.imports.insert(module);
                }
            }
        }, walk_error);

        Py_DECREF(import_cls);
        Py_DECREF(import_from_cls);
        Py_DECREF(parsed.tree);

        if (!walked) {
            scan.ok = false;
            scan.error = walk_error;
            scan.imports.clear();
            std::cerr << "Warning: Unable to analyze file " << file.string()
                      << ". Error: " << scan.error << std::endl;
        }
        return scan;
    }
}
