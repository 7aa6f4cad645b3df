#include "utils/PathUtils.h"
#include <system_error>

namespace fs = std::filesystem;

namespace PathUtils {

std::string toForwardSlashes(const std::string& path) {
    std::string out = path;
    for (auto& c : out) {
        if (c == '\\') c = '/';
    }
    return out;
}

std::string collapseSeparators(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    size_t i = 0;
    if (path.compare(0, 2, "//") == 0 && (path.size() == 2 || path[2] != '/')) {
        out = "//";
        i = 2;
    }
    for (; i < path.size(); ++i) {
        if (path[i] == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(path[i]);
    }
    return out;
}

std::string stripTildePrefix(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        return path.substr(1);
    }
    return path;
}

std::string replaceAll(const std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) return text;
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;
    while (true) {
        size_t hit = text.find(from, pos);
        if (hit == std::string::npos) break;
        out.append(text, pos, hit - pos);
        out += to;
        pos = hit + from.size();
    }
    out.append(text, pos, std::string::npos);
    return out;
}

std::string normalize(const fs::path& path) {
    fs::path stripped = fs::u8path(stripTildePrefix(path.u8string()));
    fs::path absolute = stripped;
    std::error_code ec;
    if (!stripped.empty() && !stripped.is_absolute()) {
        absolute = fs::absolute(stripped, ec);
        if (ec) absolute = stripped;
    }
    absolute = absolute.lexically_normal();

    std::string text = toForwardSlashes(absolute.u8string());
    text = collapseSeparators(text);
    // lexically_normal keeps a trailing separator for "dir/"
    if (text.size() > 1 && text.back() == '/' && !(text.size() == 3 && text[1] == ':')) {
        text.pop_back();
    }
    return text;
}

std::string fileName(const std::string& normalizedPath) {
    std::string p = normalizedPath;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    size_t slash = p.find_last_of('/');
    if (slash == std::string::npos) return p;
    return p.substr(slash + 1);
}

std::string parentPath(const std::string& normalizedPath) {
    std::string p = normalizedPath;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    size_t slash = p.find_last_of('/');
    if (slash == std::string::npos) return "";
    if (slash == 0) return "/";
    return p.substr(0, slash);
}

fs::path fromUtf8(const std::string& path) {
    return fs::u8path(path);
}

}
