#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <utility>

namespace python {

// Owning reference to a Python object. Construction, copy and destruction
// touch the reference count, so they must happen while a python::Context is
// held.
class Object {
public:
    Object() = default;

    // Takes over a new reference (the result of most C API calls).
    static Object steal(PyObject* p) { return Object(p); }
    // Adds a reference to a borrowed pointer.
    static Object borrow(PyObject* p) {
        Py_XINCREF(p);
        return Object(p);
    }

    Object(const Object& other) : ptr_(other.ptr_) { Py_XINCREF(ptr_); }
    Object(Object&& other) noexcept : ptr_(std::exchange(other.ptr_, nullptr)) {}

    Object& operator=(Object other) noexcept {
        std::swap(ptr_, other.ptr_);
        return *this;
    }

    ~Object() { Py_XDECREF(ptr_); }

    void reset() { Py_CLEAR(ptr_); }

    PyObject* get() const { return ptr_; }
    explicit operator bool() const { return ptr_ != nullptr; }

private:
    explicit Object(PyObject* p) : ptr_(p) {}

    PyObject* ptr_ = nullptr;
};

} // namespace python
