#include "internal.h"

#include <string>
#include <system_error>

namespace txcopy {
namespace paths {

std::string dir_form(const std::string& path) {
    std::string out = path;
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    if (out.empty() || out.back() != '/') out += '/';
    return out;
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

std::string absolute(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) {
        throw IoError("cannot resolve path: " + path + ": " + ec.message());
    }
    std::string out = abs.lexically_normal().string();
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

std::string basename(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto pos = p.rfind('/');
    if (pos == std::string::npos) return p;
    if (p.size() == 1) return p; // "/"
    return p.substr(pos + 1);
}

} // namespace paths
} // namespace txcopy
