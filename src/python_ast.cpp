#include "depmap/python_ast.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace depmap {
    python_interpreter::python_interpreter()
    {
        if (!Py_IsInitialized()) {
            Py_Initialize();
            owns_ = true;
        }
    }

    python_interpreter::~python_interpreter()
    {
        if (owns_ && Py_IsInitialized()) {
            Py_Finalize();
        }
    }

    std::string fetch_python_error()
    {
        PyObject* type = nullptr;
        PyObject* value = nullptr;
        PyObject* traceback = nullptr;
        PyErr_Fetch(&type, &value, &traceback);
        if (!type) {
            return "unknown Python error";
        }
        PyErr_NormalizeException(&type, &value, &traceback);

        std::string message;
        PyObject* type_name = PyObject_GetAttrString(type, "__name__");
        if (type_name && PyUnicode_Check(type_name)) {
            message = PyUnicode_AsUTF8(type_name);
        }
        Py_XDECREF(type_name);

        if (value) {
            PyObject* text = PyObject_Str(value);
            if (text && PyUnicode_Check(text)) {
                const char* utf8 = PyUnicode_AsUTF8(text);
                if (utf8 && *utf8) {
                    message += message.empty() ? "" : ": ";
                    message += utf8;
                }
            }
            Py_XDECREF(text);
        }

        Py_XDECREF(type);
        Py_XDECREF(value);
        Py_XDECREF(traceback);
        // Formatting itself may have raised; never leave an error pending.
        PyErr_Clear();
        return message.empty() ? "unknown Python error" : message;
    }

    PyObject* load_ast_class(const char* name)
    {
        PyObject* ast_module = PyImport_ImportModule("ast");
        if (!ast_module) {
            return nullptr;
        }
        PyObject* cls = PyObject_GetAttrString(ast_module, name);
        Py_DECREF(ast_module);
        return cls;
    }

    bool get_string_attr(PyObject* obj, const char* attr_name, std::string& out)
    {
        PyObject* attr = PyObject_GetAttrString(obj, attr_name);
        if (!attr) {
            PyErr_Clear();
            return false;
        }
        bool found = false;
        if (PyUnicode_Check(attr)) {
            const char* utf8 = PyUnicode_AsUTF8(attr);
            if (utf8) {
                out = utf8;
                found = true;
            } else {
                PyErr_Clear();
            }
        }
        Py_DECREF(attr);
        return found;
    }

    parse_result parse_python_file(const std::filesystem::path& file)
    {
        parse_result result;

        std::error_code ec;
        if (!std::filesystem::is_regular_file(file, ec)) {
            result.error = "FileNotFoundError: no such file: " + file.string();
            return result;
        }
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            result.error = "OSError: unable to open " + file.string();
            return result;
        }
        std::string bytes((std::istreambuf_iterator<char>(in)),
                          std::istreambuf_iterator<char>());

        PyObject* source = PyUnicode_DecodeUTF8(
            bytes.data(), static_cast<Py_ssize_t>(bytes.size()), "strict");
        if (!source) {
            result.error = fetch_python_error();
            return result;
        }

        PyObject* filename = PyUnicode_DecodeFSDefault(file.c_str());
        if (!filename) {
            Py_DECREF(source);
            result.error = fetch_python_error();
            return result;
        }

        PyObject* ast_module = PyImport_ImportModule("ast");
        if (!ast_module) {
            Py_DECREF(filename);
            Py_DECREF(source);
            result.error = fetch_python_error();
            return result;
        }

        PyObject* parse_func = PyObject_GetAttrString(ast_module, "parse");
        Py_DECREF(ast_module);
        if (!parse_func || !PyCallable_Check(parse_func)) {
            Py_XDECREF(parse_func);
            Py_DECREF(filename);
            Py_DECREF(source);
            result.error = PyErr_Occurred() ? fetch_python_error()
                                            : "ast.parse is not callable";
            return result;
        }

        result.tree = PyObject_CallFunctionObjArgs(parse_func, source, filename,
                                                   nullptr);
        Py_DECREF(parse_func);
        Py_DECREF(filename);
        Py_DECREF(source);

        if (!result.tree) {
            result.error = fetch_python_error();
        }
        return result;
    }

    bool walk_ast(PyObject* tree, const std::function<void(PyObject*)>& visit,
                  std::string& error)
    {
        PyObject* ast_module = PyImport_ImportModule("ast");
        if (!ast_module) {
            error = fetch_python_error();
            return false;
        }

        PyObject* walker = PyObject_CallMethod(ast_module, "walk", "O", tree);
        Py_DECREF(ast_module);
        if (!walker) {
            error = fetch_python_error();
            return false;
        }

        PyObject* iterator = PyObject_GetIter(walker);
        Py_DECREF(walker);
        if (!iterator) {
            error = fetch_python_error();
            return false;
        }

        PyObject* node;
        while ((node = PyIter_Next(iterator))) {
            visit(node);
            Py_DECREF(node);
        }
        Py_DECREF(iterator);

        if (PyErr_Occurred()) { // Raised during iteration
            error = fetch_python_error();
            return false;
        }
        return true;
    }
}
