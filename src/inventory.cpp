#include "depmap/python_ast.hpp"
#include "depmap/inventory.hpp"

#include <iostream>
#include <stdexcept>

namespace depmap {
    scan_options inventory_scan_options()
    {
        scan_options options;
        options.excluded_dirs.clear();
        return options;
    }

    std::vector<inventory_entry> collect_inventory(const std::filesystem::path& root,
                                                   const scan_options& options)
    {
        std::vector<inventory_entry> inventory;
        const auto files = list_source_files(root, options);

        PyObject* class_def_cls = load_ast_class("ClassDef");
        PyObject* function_def_cls = load_ast_class("FunctionDef");
        if (!class_def_cls || !function_def_cls) {
            Py_XDECREF(class_def_cls);
            Py_XDECREF(function_def_cls);
            throw std::runtime_error("Python ast module unavailable: "
                                     + fetch_python_error());
        }

        for (const auto& file : files) {
            parse_result parsed = parse_python_file(file.absolute);
            if (!parsed.tree) {
                std::cerr << "Warning: Error parsing "
                          << file.relative.filename().string() << ": "
                          << parsed.error << std::endl;
                continue;
            }

            inventory_entry entry;
            entry.file = file.absolute;

            std::string error;
            bool walked = walk_ast(parsed.tree, [&](PyObject* node) {
                std::string name;
                if (PyObject_IsInstance(node, class_def_cls) == 1) {
                    if (get_string_attr(node, "name", name)) {
                        entry.classes.push_back(name);
                    }
                } else if (PyObject_IsInstance(node, function_def_cls) == 1) {
                    if (get_string_attr(node, "name", name)) {
                        entry.functions.push_back(name);
                    }
                }
                if (PyErr_Occurred()) {
                    PyErr_Clear();
                }
            }, error);
            Py_DECREF(parsed.tree);

            if (!walked) {
                std::cerr << "Warning: Error parsing "
                          << file.relative.filename().string() << ": " << error
                          << std::endl;
                continue;
            }
            inventory.push_back(std::move(entry));
        }

        Py_DECREF(class_def_cls);
        Py_DECREF(function_def_cls);
        return inventory;
    }

    void print_inventory(const std::vector<inventory_entry>& inventory,
                         std::ostream& out)
    {
        for (const auto& entry : inventory) {
            out << "\nFile: " << entry.file.filename().string() << " ("
                << entry.file.parent_path().string() << ")\n";
            if (!entry.classes.empty()) {
                out << "  Classes:\n";
                for (const auto& name : entry.classes) {
                    out << "    - " << name << "\n";
                }
            }
            if (!entry.functions.empty()) {
                out << "  Functions/Methods:\n";
                for (const auto& name : entry.functions) {
                    out << "    - " << name << "\n";
                }
            }
        }
    }
}
