#include "script/script_source.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace script {

std::expected<std::string, std::string> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("could not open " + path + ": " + std::strerror(errno));
    }

    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        return std::unexpected("failed reading " + path);
    }

    auto source = ss.str();
    if (source.empty()) {
        return std::unexpected(path + " is empty");
    }
    return source;
}

} // namespace script
