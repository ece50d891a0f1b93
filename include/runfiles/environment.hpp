#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace runfiles {

// Snapshot of process environment variables, name -> value.
using EnvMap = std::unordered_map<std::string, std::string>;

// Variables read by the strategy selector and written by Runfiles::env_vars().
inline constexpr const char* ENV_MANIFEST_ONLY = "RUNFILES_MANIFEST_ONLY";
inline constexpr const char* ENV_MANIFEST_FILE = "RUNFILES_MANIFEST_FILE";
inline constexpr const char* ENV_RUNFILES_DIR = "RUNFILES_DIR";
inline constexpr const char* ENV_TEST_SRCDIR = "TEST_SRCDIR";

// Get all environment variables of the live process as a map
EnvMap get_all_env();

// Value of `name` in `env`, or nullopt when the variable is absent or empty.
std::optional<std::string> lookup_nonempty(const EnvMap& env, const std::string& name);

} // namespace runfiles
