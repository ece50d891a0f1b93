#include "runfiles/environment.hpp"

#include <optional>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif
#endif

namespace runfiles {

EnvMap get_all_env() {
    EnvMap env;

#ifdef _WIN32
    char* environ_block = GetEnvironmentStrings();
    if (environ_block) {
        const char* p = environ_block;
        while (*p) {
            std::string entry(p);
            // Skip the hidden per-drive "=C:=C:\..." entries
            auto eq = entry.find('=');
            if (eq != std::string::npos && eq > 0) {
                env[entry.substr(0, eq)] = entry.substr(eq + 1);
            }
            p += entry.size() + 1;
        }
        FreeEnvironmentStrings(environ_block);
    }
#else
    for (char** ep = environ; *ep; ++ep) {
        std::string entry(*ep);
        auto eq = entry.find('=');
        if (eq != std::string::npos) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
#endif

    return env;
}

std::optional<std::string> lookup_nonempty(const EnvMap& env, const std::string& name) {
    auto it = env.find(name);
    if (it == env.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace runfiles
