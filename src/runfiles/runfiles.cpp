#include "runfiles/runfiles.hpp"
#include "runfiles/path_utils.hpp"

#include <spdlog/spdlog.h>

namespace runfiles {

namespace {

using CreateResult = Result<std::unique_ptr<Runfiles>>;

bool is_manifest_only(const EnvMap& env) {
    auto it = env.find(ENV_MANIFEST_ONLY);
    return it != env.end() && it->second == "1";
}

} // namespace

CreateResult Runfiles::create() {
    return create(get_all_env());
}

CreateResult Runfiles::create(const EnvMap& env) {
    if (is_manifest_only(env)) {
        // Manifest-only platforms: load RUNFILES_MANIFEST_FILE eagerly
        auto manifest_path = lookup_nonempty(env, ENV_MANIFEST_FILE);
        if (!manifest_path) {
            return CreateResult::err(Error(
                ErrorCode::CONFIG_MISSING,
                "cannot load runfiles manifest: $RUNFILES_MANIFEST_ONLY is 1 but "
                "$RUNFILES_MANIFEST_FILE is empty or undefined"));
        }

        spdlog::debug("runfiles: manifest mode, RUNFILES_MANIFEST_FILE={}", *manifest_path);
        auto loaded = ManifestRunfiles::load(*manifest_path);
        if (loaded.isErr()) {
            return CreateResult::err(loaded.error().withContext("$RUNFILES_MANIFEST_FILE"));
        }
        return CreateResult::ok(std::move(loaded.value()));
    }

    const char* source = ENV_RUNFILES_DIR;
    auto dir = lookup_nonempty(env, ENV_RUNFILES_DIR);
    if (!dir) {
        source = ENV_TEST_SRCDIR;
        dir = lookup_nonempty(env, ENV_TEST_SRCDIR);
    }
    if (!dir) {
        return CreateResult::err(Error(
            ErrorCode::CONFIG_MISSING,
            "cannot find runfiles: $RUNFILES_DIR and $TEST_SRCDIR are both unset or empty"));
    }

    spdlog::debug("runfiles: directory mode, {}={}", source, *dir);
    return CreateResult::ok(std::make_unique<DirectoryRunfiles>(std::move(*dir)));
}

Result<std::optional<std::string>> Runfiles::rlocation(const std::string& path) const {
    using LookupResult = Result<std::optional<std::string>>;

    switch (validate_logical_path(path)) {
        case PathError::None:
            break;
        case PathError::Empty:
            return LookupResult::err(Error(ErrorCode::INVALID_ARGUMENT, "path is empty"));
        case PathError::ContainsUplevel:
            return LookupResult::err(Error(ErrorCode::INVALID_ARGUMENT,
                                           "path contains uplevel references: \"" + path + "\""));
        case PathError::AbsoluteNotAllowed:
            return LookupResult::err(Error(ErrorCode::INVALID_ARGUMENT,
                                           "path is absolute: \"" + path + "\""));
    }

    return LookupResult::ok(rlocation_unchecked(path));
}

} // namespace runfiles
