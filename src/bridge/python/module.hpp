#pragma once

#include "python/interpreter.hpp"
#include "python/object.hpp"

#include <expected>
#include <string>
#include <string_view>

// Thin helpers over the CPython API. Each takes the active Context as proof
// that the caller holds the interpreter; failures come back as the rendered
// Python exception.
namespace python {

// Renders and clears the pending exception as "TypeName: message".
std::string take_error();

// Executes source into a new module object that is not registered in
// sys.modules, so two loads never share globals.
std::expected<Object, std::string> load_module(const Context& ctx, std::string_view source,
                                               const char* filename, const char* name);

std::expected<Object, std::string> get_attr(const Context& ctx, const Object& obj,
                                            const char* name);

// Calls callable(*args); args must be a tuple.
std::expected<Object, std::string> call(const Context& ctx, const Object& callable,
                                        const Object& args);

} // namespace python
