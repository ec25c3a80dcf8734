#include "python/module.hpp"

#include <format>

namespace python {

std::string take_error() {
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    if (!type) return "unknown Python error";
    PyErr_NormalizeException(&type, &value, &traceback);

    auto type_ref = Object::steal(type);
    auto value_ref = Object::steal(value);
    auto tb_ref = Object::steal(traceback);

    std::string name = PyType_Check(type) ? reinterpret_cast<PyTypeObject*>(type)->tp_name
                                          : "Exception";

    std::string message;
    if (value) {
        auto str = Object::steal(PyObject_Str(value));
        const char* utf8 = str ? PyUnicode_AsUTF8(str.get()) : nullptr;
        if (utf8) {
            message = utf8;
        } else {
            PyErr_Clear();
        }
    }

    if (message.empty()) return name;
    return std::format("{}: {}", name, message);
}

std::expected<Object, std::string> load_module(const Context& /*ctx*/, std::string_view source,
                                               const char* filename, const char* name) {
    std::string text(source);
    auto code = Object::steal(Py_CompileString(text.c_str(), filename, Py_file_input));
    if (!code) return std::unexpected(take_error());

    auto module = Object::steal(PyModule_New(name));
    if (!module) return std::unexpected(take_error());

    PyObject* globals = PyModule_GetDict(module.get()); // borrowed
    auto file = Object::steal(PyUnicode_FromString(filename));
    if (!file ||
        PyDict_SetItemString(globals, "__builtins__", PyEval_GetBuiltins()) < 0 ||
        PyDict_SetItemString(globals, "__file__", file.get()) < 0) {
        return std::unexpected(take_error());
    }

    auto result = Object::steal(PyEval_EvalCode(code.get(), globals, globals));
    if (!result) return std::unexpected(take_error());

    return module;
}

std::expected<Object, std::string> get_attr(const Context& /*ctx*/, const Object& obj,
                                            const char* name) {
    auto attr = Object::steal(PyObject_GetAttrString(obj.get(), name));
    if (!attr) return std::unexpected(take_error());
    return attr;
}

std::expected<Object, std::string> call(const Context& /*ctx*/, const Object& callable,
                                        const Object& args) {
    auto result = Object::steal(PyObject_CallObject(callable.get(), args.get()));
    if (!result) return std::unexpected(take_error());
    return result;
}

} // namespace python
