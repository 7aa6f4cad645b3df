#include "install/AssetIndex.h"
#include "utils/PathUtils.h"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

FileSystemAssetIndex::FileSystemAssetIndex(fs::path projectRoot)
    : projectRoot(std::move(projectRoot)) {}

std::vector<std::string> FileSystemAssetIndex::findAssets(const std::string& stem) const {
    std::vector<std::string> results;
    fs::path assetsDir = projectRoot / "Assets";
    std::error_code ec;
    if (stem.empty() || !fs::is_directory(assetsDir, ec)) return results;

    fs::recursive_directory_iterator it(assetsDir, fs::directory_options::skip_permission_denied, ec);
    fs::recursive_directory_iterator end;
    while (!ec && it != end) {
        const fs::path& p = it->path();
        const std::string name = p.filename().u8string();

        std::error_code statEc;
        if (it->is_directory(statEc)) {
            if ((!name.empty() && name[0] == '.') || name == "node_modules") {
                it.disable_recursion_pending();
            }
        } else if (p.stem().u8string() == stem) {
            fs::path rel = p.lexically_relative(projectRoot);
            results.push_back(PathUtils::toForwardSlashes(rel.u8string()));
        }
        it.increment(ec);
    }

    std::sort(results.begin(), results.end());
    return results;
}
