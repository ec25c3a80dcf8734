#pragma once

#include <expected>
#include <string>
#include <string_view>

// Python source defining the new_model() and transcribe_audio() entry points.
namespace script {

// The whisper.py script compiled into the binary.
std::string_view embedded();

// Reads an alternative script implementing the same entry points.
std::expected<std::string, std::string> read_file(const std::string& path);

} // namespace script
