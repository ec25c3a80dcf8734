#include "python/interpreter.hpp"

namespace python {

Interpreter& Interpreter::instance() {
    // Leaked on purpose: WhisperModel destructors that run after static
    // destruction still lock mutex_, so it must outlive every static.
    static Interpreter* interp = new Interpreter();
    return *interp;
}

Interpreter::Interpreter() {
    if (Py_IsInitialized()) return; // the host embedded Python itself

    Py_InitializeEx(0);
    // Drop the GIL taken by initialization; every Context reacquires it.
    PyEval_SaveThread();
}

// The GIL is taken first. A thread that already holds it (a host that
// embedded Python itself) would otherwise wait on mutex_ while the mutex
// holder waits on the GIL. If mutex_ is busy, the GIL is dropped while
// blocking so the current holder can finish.
Context::Context()
    : lock_(Interpreter::instance().mutex_, std::defer_lock) {
    gil_ = PyGILState_Ensure();
    if (!lock_.try_lock()) {
        PyThreadState* state = PyEval_SaveThread();
        lock_.lock();
        PyEval_RestoreThread(state);
    }
}

Context::~Context() {
    PyGILState_Release(gil_);
}

} // namespace python
