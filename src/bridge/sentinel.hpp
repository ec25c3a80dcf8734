#pragma once

#include <format>
#include <optional>
#include <string>
#include <string_view>

// The Python side cannot receive a native None for optional arguments; an
// absent value travels as the literal string "None".
//
// A present value whose text is itself "None" (e.g. a prompt of "None") is
// indistinguishable from an absent one on the Python side.
namespace sentinel {

inline constexpr std::string_view kNone = "None";

template <typename T>
std::string encode(const std::optional<T>& value) {
    if (!value) return std::string(kNone);
    return std::format("{}", *value);
}

} // namespace sentinel
