#ifndef DEPMAP_PYTHON_AST_HPP
#define DEPMAP_PYTHON_AST_HPP

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <filesystem>
#include <functional>
#include <string>

namespace depmap {
    // Starts the embedded interpreter if nobody did it yet and finalizes it
    // again on destruction when this guard was the one that started it.
    class python_interpreter {
    public:
        python_interpreter();
        ~python_interpreter();

        python_interpreter(const python_interpreter&) = delete;
        python_interpreter& operator=(const python_interpreter&) = delete;

    private:
        bool owns_ = false;
    };

    struct parse_result {
        // New reference to the ast.Module, nullptr when parsing failed.
        PyObject* tree = nullptr;
        std::string error;
    };

    /// Reads the file as UTF-8 and runs ast.parse on it. The source is never
    /// compiled to bytecode nor executed. The caller owns result.tree.
    parse_result parse_python_file(const std::filesystem::path& file);

    /// Calls visit() for every node yielded by ast.walk(tree). The node is a
    /// borrowed reference valid for the duration of the call. Returns false
    /// (and fills error) if the walk itself failed.
    bool walk_ast(PyObject* tree, const std::function<void(PyObject*)>& visit,
                  std::string& error);

    /// Looks up ast.<name> (e.g. "Import"). Returns a new reference or nullptr.
    PyObject* load_ast_class(const char* name);

    /// Reads attribute attr_name of obj as a UTF-8 string. Returns false if
    /// the attribute is missing or None.
    bool get_string_attr(PyObject* obj, const char* attr_name, std::string& out);

    /// Formats and clears the pending Python exception, e.g.
    /// "SyntaxError: invalid syntax (broken.py, line 3)".
    std::string fetch_python_error();
}

#endif
