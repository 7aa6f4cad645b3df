#pragma once
#include <string>
#include <filesystem>

namespace PathUtils {

    /**
     * @brief Canonical textual form of an on-disk path
     *
     * Makes the path absolute, strips a single leading "~" artifact,
     * converts backslashes to forward slashes and collapses repeated
     * separators. A leading "//" (UNC share) is kept.
     */
    std::string normalize(const std::filesystem::path& path);

    // Backslashes to forward slashes, nothing else
    std::string toForwardSlashes(const std::string& path);

    // Collapses runs of '/' into one, keeping a leading "//"
    std::string collapseSeparators(const std::string& path);

    // Removes one leading '~' if present
    std::string stripTildePrefix(const std::string& path);

    // Non-overlapping replace of every occurrence, left to right
    std::string replaceAll(const std::string& text, const std::string& from, const std::string& to);

    // Last path component of a normalized path ("a/b/" -> "b")
    std::string fileName(const std::string& normalizedPath);

    // Parent of a normalized path, without trailing slash
    std::string parentPath(const std::string& normalizedPath);

    std::filesystem::path fromUtf8(const std::string& path);
}
