#include "tools/ToolParams.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>

namespace {
    const nlohmann::json* lookup(const nlohmann::json& params, const std::string& key) {
        if (!params.is_object()) return nullptr;
        auto it = params.find(key);
        if (it == params.end() || it->is_null()) return nullptr;
        return &*it;
    }

    std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool parseInt(const std::string& text, int& out) {
        std::string t = trim(text);
        if (t.empty()) return false;
        errno = 0;
        char* end = nullptr;
        long long v = std::strtoll(t.c_str(), &end, 10);
        if (errno == ERANGE || end == t.c_str() || *end != '\0') return false;
        if (v < INT_MIN || v > INT_MAX) return false;
        out = static_cast<int>(v);
        return true;
    }
}

namespace ToolParams {

std::optional<std::string> getString(const nlohmann::json& params, const std::string& key) {
    const nlohmann::json* value = lookup(params, key);
    if (!value) return std::nullopt;

    std::string text = value->is_string() ? value->get<std::string>() : value->dump();
    if (trim(text).empty()) return std::nullopt;
    return text;
}

int getInt(const nlohmann::json& params, const std::string& key, int defaultValue) {
    const nlohmann::json* value = lookup(params, key);
    if (!value) return defaultValue;

    int result = defaultValue;
    if (value->is_number_integer()) {
        if (parseInt(value->dump(), result)) return result;
        return defaultValue;
    }
    if (value->is_number_float()) {
        // 10.0 reads as 10; 2.5 does not
        double d = value->get<double>();
        if (std::isfinite(d) && d == std::floor(d) && d >= INT_MIN && d <= INT_MAX) {
            return static_cast<int>(d);
        }
        return defaultValue;
    }
    if (value->is_string() && parseInt(value->get<std::string>(), result)) {
        return result;
    }
    return defaultValue;
}

bool getBool(const nlohmann::json& params, const std::string& key, bool defaultValue) {
    const nlohmann::json* value = lookup(params, key);
    if (!value) return defaultValue;

    if (value->is_boolean()) return value->get<bool>();
    if (value->is_string()) {
        std::string text = toLower(trim(value->get<std::string>()));
        if (text == "true") return true;
        if (text == "false") return false;
    }
    return defaultValue;
}

}
