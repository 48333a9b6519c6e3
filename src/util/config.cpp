#include <crabby/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace crabby {

const char* link_mode_name(LinkMode mode) {
    switch (mode) {
        case LinkMode::Hardlink: return "hardlink";
        case LinkMode::Copy:     return "copy";
    }
    return "unknown";
}

static CrabbyError config_error(const std::string& origin, const std::string& msg,
                                const std::string& hint = "") {
    return CrabbyError{CrabbyError::Config, msg, hint, origin, 0};
}

static Status read_positive(const toml::table& tbl, const char* key,
                            const std::string& section, const std::string& origin,
                            std::optional<int>& out) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto v = node.value<int64_t>();
    if (!v || *v < 1 || *v > 1000000) {
        return config_error(origin,
            "'" + section + "." + key + "' must be a positive integer");
    }
    out = static_cast<int>(*v);
    return ok_status();
}

static Status read_bool(const toml::table& tbl, const char* key,
                        const std::string& section, const std::string& origin,
                        std::optional<bool>& out) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto v = node.value<bool>();
    if (!v) {
        return config_error(origin, "'" + section + "." + key + "' must be a boolean");
    }
    out = *v;
    return ok_status();
}

static void warn_unknown(const toml::table& tbl, std::initializer_list<const char*> known,
                         const std::string& section, const std::string& origin) {
    for (const auto& [key, val] : tbl) {
        (void)val;
        bool found = false;
        for (const char* k : known) {
            if (key.str() == k) found = true;
        }
        if (!found) {
            log::warn("%s: unknown config key '%s%s'", origin.c_str(),
                      section.empty() ? "" : (section + ".").c_str(),
                      std::string(key.str()).c_str());
        }
    }
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        return CrabbyError{CrabbyError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", origin, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;
    warn_unknown(doc, {"registry", "cache-dir", "log-level", "fetch", "install", "integrity"},
                 "", origin);

    if (auto v = doc["registry"].value<std::string>()) {
        if (v->empty()) return config_error(origin, "'registry' must not be empty");
        cfg.registry = *v;
    }
    if (auto v = doc["cache-dir"].value<std::string>()) {
        cfg.cache_dir = *v;
    }
    if (auto v = doc["log-level"].value<std::string>()) {
        auto lvl = log::parse_level(*v);
        if (!lvl) {
            return config_error(origin, "unknown log level '" + *v + "'",
                                "expected one of trace, debug, info, warn, error");
        }
        cfg.log_level = *lvl;
    }

    if (auto fetch = doc["fetch"].as_table()) {
        warn_unknown(*fetch, {"jobs", "retries", "retry-delay-ms", "retry-max-delay-ms",
                              "timeout-seconds"}, "fetch", origin);
        CRABBY_TRY(read_positive(*fetch, "jobs", "fetch", origin, cfg.fetch_jobs));
        CRABBY_TRY(read_positive(*fetch, "retries", "fetch", origin, cfg.fetch_retries));
        CRABBY_TRY(read_positive(*fetch, "retry-delay-ms", "fetch", origin, cfg.retry_delay_ms));
        CRABBY_TRY(read_positive(*fetch, "retry-max-delay-ms", "fetch", origin,
                                 cfg.retry_max_delay_ms));
        CRABBY_TRY(read_positive(*fetch, "timeout-seconds", "fetch", origin,
                                 cfg.fetch_timeout_seconds));
    }

    if (auto install = doc["install"].as_table()) {
        warn_unknown(*install, {"link-mode", "ignore-scripts", "include-dev",
                                "script-timeout-seconds"}, "install", origin);
        if (auto mode = (*install)["link-mode"].value<std::string>()) {
            if (*mode == "hardlink") {
                cfg.link_mode = LinkMode::Hardlink;
            } else if (*mode == "copy") {
                cfg.link_mode = LinkMode::Copy;
            } else {
                return config_error(origin, "unknown link-mode '" + *mode + "'",
                                    "expected 'hardlink' or 'copy'");
            }
        }
        CRABBY_TRY(read_bool(*install, "ignore-scripts", "install", origin, cfg.ignore_scripts));
        CRABBY_TRY(read_bool(*install, "include-dev", "install", origin, cfg.include_dev));
        CRABBY_TRY(read_positive(*install, "script-timeout-seconds", "install", origin,
                                 cfg.script_timeout_seconds));
    }

    if (auto integrity = doc["integrity"].as_table()) {
        if (auto alg = (*integrity)["algorithm"].value<std::string>()) {
            auto parsed = parse_algorithm(*alg);
            if (!parsed) {
                return config_error(origin, "unsupported integrity algorithm '" + *alg + "'",
                                    "expected sha512, sha256 or sha1");
            }
            cfg.integrity_algorithm = *parsed;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return CrabbyError{CrabbyError::IO, "cannot open config file: " + path.string()};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path.string());
}

void Config::merge(const Config& other) {
    auto take = [](auto& mine, const auto& theirs) {
        if (theirs.has_value()) mine = theirs;
    };
    take(registry, other.registry);
    take(cache_dir, other.cache_dir);
    take(log_level, other.log_level);
    take(fetch_jobs, other.fetch_jobs);
    take(fetch_retries, other.fetch_retries);
    take(retry_delay_ms, other.retry_delay_ms);
    take(retry_max_delay_ms, other.retry_max_delay_ms);
    take(fetch_timeout_seconds, other.fetch_timeout_seconds);
    take(link_mode, other.link_mode);
    take(ignore_scripts, other.ignore_scripts);
    take(include_dev, other.include_dev);
    take(script_timeout_seconds, other.script_timeout_seconds);
    take(integrity_algorithm, other.integrity_algorithm);
}

Result<Config> Config::from_env() {
    Config cfg;
    if (const char* v = std::getenv("CRABBY_REGISTRY"); v && *v) {
        cfg.registry = v;
    }
    if (const char* v = std::getenv("CRABBY_CACHE_DIR"); v && *v) {
        cfg.cache_dir = v;
    }
    if (const char* v = std::getenv("CRABBY_JOBS"); v && *v) {
        char* end = nullptr;
        long n = std::strtol(v, &end, 10);
        if (*end != '\0' || n < 1 || n > 1024) {
            return config_error("CRABBY_JOBS", "CRABBY_JOBS must be a positive integer");
        }
        cfg.fetch_jobs = static_cast<int>(n);
    }
    if (const char* v = std::getenv("CRABBY_LOG"); v && *v) {
        auto lvl = log::parse_level(v);
        if (!lvl) {
            return config_error("CRABBY_LOG", std::string("unknown log level '") + v + "'");
        }
        cfg.log_level = *lvl;
    }
    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::effective(const fs::path& project_dir) {
    Config result;
    std::error_code ec;

    auto global = global_config_path();
    if (!global.empty() && fs::exists(global, ec)) {
        auto g = Config::load(global);
        if (g.is_err()) return std::move(g).error();
        result.merge(g.value());
    }

    auto local = project_dir / kProjectConfigName;
    if (fs::exists(local, ec)) {
        auto l = Config::load(local);
        if (l.is_err()) return std::move(l).error();
        result.merge(l.value());
    }

    auto env = Config::from_env();
    if (env.is_err()) return std::move(env).error();
    result.merge(env.value());

    return Result<Config>::ok(std::move(result));
}

std::string Config::registry_url() const {
    std::string url = registry.value_or(kDefaultRegistry);
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

fs::path Config::cache_root() const {
    if (cache_dir) return fs::path(*cache_dir);
    return default_cache_dir();
}

int Config::jobs() const { return fetch_jobs.value_or(16); }
int Config::retries() const { return fetch_retries.value_or(3); }
int Config::retry_delay() const { return retry_delay_ms.value_or(200); }
int Config::retry_max_delay() const { return retry_max_delay_ms.value_or(2000); }
int Config::timeout_seconds() const { return fetch_timeout_seconds.value_or(60); }
LinkMode Config::links() const { return link_mode.value_or(LinkMode::Hardlink); }
bool Config::scripts_ignored() const { return ignore_scripts.value_or(false); }
bool Config::dev_included() const { return include_dev.value_or(true); }
int Config::script_timeout() const { return script_timeout_seconds.value_or(600); }
HashAlgorithm Config::algorithm() const {
    return integrity_algorithm.value_or(HashAlgorithm::Sha512);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.crabby/config.toml";
}

fs::path default_cache_dir() {
#ifdef _WIN32
    if (const char* local = std::getenv("LOCALAPPDATA")) {
        return fs::path(local) / "crabby" / "cache";
    }
#endif
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "crabby";
    }
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return fs::temp_directory_path() / "crabby-cache";
    return fs::path(home) / ".cache" / "crabby";
}

} // namespace crabby
