#pragma once

#include <crabby/digest.hpp>
#include <crabby/log.hpp>
#include <crabby/result.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace crabby {

enum class LinkMode {
    Hardlink,   // hard-link files out of the cache, copy when that fails
    Copy,
};

const char* link_mode_name(LinkMode mode);

// Layered configuration: defaults < global < project < environment.
// Every key is optional so that a layer only overrides what it sets; the
// accessors below fold in the built-in defaults.
struct Config {
    std::optional<std::string> registry;
    std::optional<std::string> cache_dir;
    std::optional<log::Level> log_level;

    // [fetch]
    std::optional<int> fetch_jobs;
    std::optional<int> fetch_retries;
    std::optional<int> retry_delay_ms;
    std::optional<int> retry_max_delay_ms;
    std::optional<int> fetch_timeout_seconds;

    // [install]
    std::optional<LinkMode> link_mode;
    std::optional<bool> ignore_scripts;
    std::optional<bool> include_dev;
    std::optional<int> script_timeout_seconds;

    // [integrity]
    std::optional<HashAlgorithm> integrity_algorithm;

    static Result<Config> load(const std::filesystem::path& path);
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& origin = "<string>");

    // Values set in other replace ours
    void merge(const Config& other);

    // CRABBY_REGISTRY, CRABBY_CACHE_DIR, CRABBY_JOBS, CRABBY_LOG
    static Result<Config> from_env();

    // global file (if present) -> project crabby.toml (if present) -> env
    static Result<Config> effective(const std::filesystem::path& project_dir);

    std::string registry_url() const;
    std::filesystem::path cache_root() const;
    int jobs() const;
    int retries() const;
    int retry_delay() const;
    int retry_max_delay() const;
    int timeout_seconds() const;
    LinkMode links() const;
    bool scripts_ignored() const;
    bool dev_included() const;
    int script_timeout() const;
    HashAlgorithm algorithm() const;
};

inline constexpr const char* kDefaultRegistry = "https://registry.npmjs.org";
inline constexpr const char* kProjectConfigName = "crabby.toml";

// ~/.crabby/config.toml, empty when no home directory is known
std::string global_config_path();

// $XDG_CACHE_HOME/crabby, ~/.cache/crabby, or %LOCALAPPDATA%\crabby\cache
std::filesystem::path default_cache_dir();

} // namespace crabby
