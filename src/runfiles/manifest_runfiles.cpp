#include "runfiles/runfiles.hpp"
#include "runfiles/manifest.hpp"
#include "runfiles/path_utils.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace runfiles {

namespace {

std::optional<std::string> read_file(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) return std::nullopt;
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) return std::nullopt;
    return ss.str();
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Result<std::unique_ptr<ManifestRunfiles>> ManifestRunfiles::load(const std::string& manifest_path) {
    using LoadResult = Result<std::unique_ptr<ManifestRunfiles>>;

    auto content = read_file(manifest_path);
    if (!content) {
        return LoadResult::err(Error(ErrorCode::MANIFEST_UNREADABLE,
                                     "cannot read runfiles manifest: " + manifest_path));
    }

    auto parsed = parse_runfiles_manifest(*content, manifest_path);
    if (!parsed.ok) {
        return LoadResult::err(Error(ErrorCode::MANIFEST_MALFORMED, parsed.error));
    }

    spdlog::debug("runfiles: loaded {} entries from {} ({} overridden)",
                  parsed.entries.size(), manifest_path, parsed.duplicates);

    return LoadResult::ok(std::unique_ptr<ManifestRunfiles>(
        new ManifestRunfiles(manifest_path, std::move(parsed.entries))));
}

std::optional<std::string> ManifestRunfiles::rlocation_unchecked(const std::string& path) const {
    auto exact = entries_.find(path);
    if (exact != entries_.end()) {
        if (exact->second.empty()) return std::nullopt;
        return exact->second;
    }

    // Only a directory may be listed for runfiles beneath it: try the
    // enclosing prefixes, longest first.
    auto prefix_end = path.rfind('/');
    while (prefix_end != std::string::npos && prefix_end > 0) {
        auto dir = entries_.find(path.substr(0, prefix_end));
        if (dir != entries_.end()) {
            if (dir->second.empty()) return std::nullopt;
            return join_path(dir->second, path.substr(prefix_end + 1));
        }
        prefix_end = path.rfind('/', prefix_end - 1);
    }

    return std::nullopt;
}

EnvMap ManifestRunfiles::env_vars() const {
    EnvMap env{
        {ENV_MANIFEST_ONLY, "1"},
        {ENV_MANIFEST_FILE, manifest_path_},
    };
    if (auto dir = runfiles_dir_for_manifest(manifest_path_)) {
        env[ENV_RUNFILES_DIR] = *dir;
    }
    return env;
}

std::optional<std::string> runfiles_dir_for_manifest(const std::string& manifest_path) {
    static const std::string kDirManifest = "/MANIFEST";
    static const std::string kDirManifestWin = "\\MANIFEST";
    static const std::string kSiblingManifest = ".runfiles_manifest";

    if (ends_with(manifest_path, kDirManifest) || ends_with(manifest_path, kDirManifestWin)) {
        auto dir = manifest_path.substr(0, manifest_path.size() - kDirManifest.size());
        if (dir.empty()) return std::nullopt;
        return dir;
    }
    if (ends_with(manifest_path, kSiblingManifest)) {
        return manifest_path.substr(0, manifest_path.size() - kSiblingManifest.size()) + ".runfiles";
    }
    return std::nullopt;
}

} // namespace runfiles
