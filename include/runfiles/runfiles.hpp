#pragma once

/**
 * @file runfiles.hpp
 * @brief Runtime location of runfiles (data dependencies staged next to a binary)
 *
 * This is the primary header for using the library. It provides:
 * - Runfiles: the lookup interface and the strategy selector (create)
 * - ManifestRunfiles: lookups through a runfiles manifest file
 * - DirectoryRunfiles: lookups under a runfiles root directory
 *
 * @example
 * ```cpp
 * #include <runfiles/runfiles.hpp>
 *
 * auto created = runfiles::Runfiles::create();
 * if (created.isErr()) {
 *     // created.error().message() names the missing variable
 * }
 * auto path = created.value()->rlocation("my_workspace/data/config.json");
 * if (path.isOk() && path.value()) {
 *     // *path.value() is the on-disk location; it may still not exist
 * }
 * ```
 */

#include "runfiles/environment.hpp"
#include "runfiles/manifest.hpp"
#include "runfiles/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace runfiles {

enum class Mode {
    Manifest,
    Directory,
};

inline const char* mode_to_string(Mode m) {
    switch (m) {
        case Mode::Manifest: return "manifest";
        case Mode::Directory: return "directory";
        default: return "unknown";
    }
}

// ============================================================================
// Runfiles Interface
// ============================================================================

/**
 * @brief Resolves logical runfiles paths to on-disk paths
 *
 * Instances are immutable once created. rlocation() is const and may be
 * called concurrently from any number of threads.
 */
class Runfiles {
public:
    virtual ~Runfiles() = default;

    Runfiles(const Runfiles&) = delete;
    Runfiles& operator=(const Runfiles&) = delete;

    /**
     * @brief Create a Runfiles instance from the live process environment
     *
     * Captures the environment once and forwards it to create(const EnvMap&).
     */
    static Result<std::unique_ptr<Runfiles>> create();

    /**
     * @brief Create a Runfiles instance from an environment snapshot
     *
     * - RUNFILES_MANIFEST_ONLY=1: manifest-based, reading RUNFILES_MANIFEST_FILE
     * - otherwise: directory-based, under RUNFILES_DIR or else TEST_SRCDIR
     *
     * The manifest-based implementation reads the whole manifest eagerly.
     *
     * @return CONFIG_MISSING if the selected mode lacks its variable,
     *         MANIFEST_UNREADABLE / MANIFEST_MALFORMED if the manifest fails to load
     */
    static Result<std::unique_ptr<Runfiles>> create(const EnvMap& env);

    /**
     * @brief Runtime path of a runfile
     * @param path runfiles-root-relative path, e.g. "my_workspace/data/file.txt"
     * @return INVALID_ARGUMENT if path is empty, contains "..", or is absolute.
     *         Otherwise the physical path, or nullopt if the runfile is
     *         definitely unknown. A returned path is not checked for existence.
     */
    Result<std::optional<std::string>> rlocation(const std::string& path) const;

    virtual Mode mode() const = 0;

    /// Environment variables that let a child process find the same runfiles
    virtual EnvMap env_vars() const = 0;

protected:
    Runfiles() = default;

    // `path` has already passed validate_logical_path()
    virtual std::optional<std::string> rlocation_unchecked(const std::string& path) const = 0;
};

// ============================================================================
// Manifest-based Runfiles
// ============================================================================

/**
 * @brief Lookups through an in-memory copy of a runfiles manifest
 *
 * Lookup order:
 * 1. exact entry (an empty value means the runfile is unknown)
 * 2. longest listed directory prefix, with the rest of the path appended
 * 3. unknown
 */
class ManifestRunfiles final : public Runfiles {
public:
    /**
     * @brief Read and parse a manifest file
     * @param manifest_path path of the manifest on disk
     * @return MANIFEST_UNREADABLE or MANIFEST_MALFORMED on failure
     */
    static Result<std::unique_ptr<ManifestRunfiles>> load(const std::string& manifest_path);

    const std::string& manifest_path() const { return manifest_path_; }
    size_t size() const { return entries_.size(); }

    Mode mode() const override { return Mode::Manifest; }
    EnvMap env_vars() const override;

private:
    ManifestRunfiles(std::string manifest_path, ManifestTable entries)
        : manifest_path_(std::move(manifest_path)), entries_(std::move(entries)) {}

    std::optional<std::string> rlocation_unchecked(const std::string& path) const override;

    std::string manifest_path_;
    ManifestTable entries_;
};

// Runfiles directory that accompanies a manifest path, when its name follows
// the "<dir>/MANIFEST" or "<name>.runfiles_manifest" convention.
std::optional<std::string> runfiles_dir_for_manifest(const std::string& manifest_path);

// ============================================================================
// Directory-based Runfiles
// ============================================================================

// Lookups by concatenation under a runfiles root. Never reports unknown.
class DirectoryRunfiles final : public Runfiles {
public:
    explicit DirectoryRunfiles(std::string directory) : directory_(std::move(directory)) {}

    const std::string& directory() const { return directory_; }

    Mode mode() const override { return Mode::Directory; }
    EnvMap env_vars() const override;

private:
    std::optional<std::string> rlocation_unchecked(const std::string& path) const override;

    std::string directory_;
};

} // namespace runfiles
