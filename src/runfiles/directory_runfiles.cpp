#include "runfiles/runfiles.hpp"
#include "runfiles/path_utils.hpp"

namespace runfiles {

std::optional<std::string> DirectoryRunfiles::rlocation_unchecked(const std::string& path) const {
    return join_path(directory_, path);
}

EnvMap DirectoryRunfiles::env_vars() const {
    return EnvMap{{ENV_RUNFILES_DIR, directory_}};
}

} // namespace runfiles
