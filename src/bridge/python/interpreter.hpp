#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <mutex>

namespace python {

// The process-wide embedded interpreter. Initialized on first use and kept
// alive until process exit; model handles held by WhisperModel depend on it.
class Interpreter {
public:
    static Interpreter& instance();

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

private:
    friend class Context;

    Interpreter();

    // Held for the whole of a Context, including stretches where Python code
    // has released the GIL, so two foreign calls never overlap.
    std::mutex mutex_;
};

// Scoped execution context: exclusive access to the interpreter for the
// lifetime of the object. Blocks until any other holder in the process has
// released it. Safe to take from a thread that already holds the GIL. Not
// reentrant; do not nest two Contexts on one thread.
class Context {
public:
    Context();
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

private:
    std::unique_lock<std::mutex> lock_;
    PyGILState_STATE gil_;
};

} // namespace python
