#include <crabby/manifest.hpp>
#include <crabby/digest.hpp>
#include <crabby/fsutil.hpp>
#include <crabby/log.hpp>
#include <crabby/name.hpp>

#include <algorithm>
#include <cctype>
#include <set>

namespace fs = std::filesystem;
using ojson = nlohmann::ordered_json;

namespace crabby {

const char* range_kind_name(RangeKind kind) {
    switch (kind) {
        case RangeKind::Semver:    return "semver";
        case RangeKind::Tag:       return "tag";
        case RangeKind::Workspace: return "workspace";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// DependencySpec
// ---------------------------------------------------------------------------

static constexpr const char* kWorkspacePrefix = "workspace:";

static bool looks_like_tag(const std::string& s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '.' || c == '_';
    });
}

static bool is_unsupported_specifier(const std::string& s) {
    static const char* prefixes[] = {
        "file:", "link:", "git:", "git+", "http:", "https:", "npm:",
        "github:", "./", "../", "/", "~/",
    };
    for (const char* p : prefixes) {
        if (s.rfind(p, 0) == 0) return true;
    }
    // "user/repo" GitHub shorthand
    return s.find('/') != std::string::npos;
}

Result<DependencySpec> DependencySpec::make(const std::string& name,
                                            const std::string& range,
                                            bool is_dev,
                                            const std::string& requested_by) {
    auto pkg = PkgName::parse(name);
    if (pkg.is_err()) return std::move(pkg).error();

    DependencySpec spec;
    spec.name = name;
    spec.range = range;
    spec.is_dev = is_dev;
    spec.requested_by = requested_by;

    std::string r = range;
    while (!r.empty() && std::isspace(static_cast<unsigned char>(r.back()))) r.pop_back();
    while (!r.empty() && std::isspace(static_cast<unsigned char>(r.front()))) r.erase(0, 1);

    if (r.rfind(kWorkspacePrefix, 0) == 0) {
        spec.kind = RangeKind::Workspace;
        std::string inner = r.substr(std::char_traits<char>::length(kWorkspacePrefix));
        if (inner.empty() || inner == "*" || inner == "^" || inner == "~") {
            spec.req = VersionReq::any();
        } else {
            auto req = VersionReq::parse(inner);
            if (req.is_err()) {
                return CrabbyError{CrabbyError::InvalidArg,
                    "invalid workspace range '" + range + "' for " + name};
            }
            spec.req = std::move(req).value();
        }
        return Result<DependencySpec>::ok(std::move(spec));
    }

    if (is_unsupported_specifier(r)) {
        return CrabbyError{CrabbyError::InvalidArg,
            "unsupported dependency specifier '" + range + "' for " + name,
            "only semver ranges, dist-tags and workspace: are supported"};
    }

    auto req = VersionReq::parse(r);
    if (req.is_ok()) {
        spec.kind = RangeKind::Semver;
        spec.req = std::move(req).value();
        return Result<DependencySpec>::ok(std::move(spec));
    }

    if (looks_like_tag(r)) {
        spec.kind = RangeKind::Tag;
        spec.range = r;
        spec.req = VersionReq::any();
        return Result<DependencySpec>::ok(std::move(spec));
    }

    return CrabbyError{CrabbyError::InvalidArg,
        "invalid version range '" + range + "' for " + name,
        req.error().message};
}

bool DependencySpec::satisfied_by(const Version& v) const {
    switch (kind) {
        case RangeKind::Semver:    return req.matches(v);
        case RangeKind::Tag:       return true;
        case RangeKind::Workspace: return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Parsing helpers
// ---------------------------------------------------------------------------

static CrabbyError malformed(const std::string& origin, const std::string& msg,
                             const std::string& hint = "") {
    return CrabbyError{CrabbyError::MalformedManifest, msg, hint, origin, 0};
}

static std::string strip_bom(const std::string& text) {
    if (text.size() >= 3 &&
        static_cast<unsigned char>(text[0]) == 0xEF &&
        static_cast<unsigned char>(text[1]) == 0xBB &&
        static_cast<unsigned char>(text[2]) == 0xBF) {
        return text.substr(3);
    }
    return text;
}

template<typename Json>
static std::vector<BinEntry> parse_bin(const Json& doc, const std::string& pkg_name,
                                       const std::string& origin) {
    std::vector<BinEntry> out;
    auto it = doc.find("bin");
    if (it == doc.end()) return out;

    auto accept = [&](const std::string& name, const std::string& path) {
        if (name.empty() || name.find('/') != std::string::npos ||
            name.find('\\') != std::string::npos || name == "." || name == "..") {
            log::warn("%s: ignoring bin entry with unsafe name '%s'",
                      origin.c_str(), name.c_str());
            return;
        }
        out.push_back(BinEntry{name, path});
    };

    if (it->is_string()) {
        // A lone string is named after the package, without its scope
        std::string bare = pkg_name;
        size_t slash = bare.find('/');
        if (slash != std::string::npos) bare = bare.substr(slash + 1);
        accept(bare, it->template get<std::string>());
    } else if (it->is_object()) {
        for (auto& [key, val] : it->items()) {
            if (val.is_string()) {
                accept(key, val.template get<std::string>());
            }
        }
    }
    return out;
}

template<typename Json>
static std::vector<std::pair<std::string, std::string>> parse_scripts(
    const Json& doc, const std::string& origin) {
    std::vector<std::pair<std::string, std::string>> out;
    auto it = doc.find("scripts");
    if (it == doc.end() || !it->is_object()) return out;
    for (auto& [key, val] : it->items()) {
        if (!val.is_string()) {
            log::warn("%s: ignoring non-string script '%s'", origin.c_str(), key.c_str());
            continue;
        }
        out.emplace_back(key, val.template get<std::string>());
    }
    return out;
}

static Result<std::vector<DependencySpec>> parse_dependency_section(
    const ojson& doc, const char* key, bool is_dev, const std::string& origin) {
    std::vector<DependencySpec> out;
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return Result<std::vector<DependencySpec>>::ok(std::move(out));
    }
    if (!it->is_object()) {
        return malformed(origin, std::string("'") + key + "' must be an object");
    }
    for (auto& [name, val] : it->items()) {
        if (!val.is_string()) {
            return malformed(origin,
                std::string("range for '") + name + "' in " + key + " must be a string");
        }
        auto spec = DependencySpec::make(name, val.get<std::string>(), is_dev);
        if (spec.is_err()) {
            return malformed(origin, spec.error().message, spec.error().hint);
        }
        out.push_back(std::move(spec).value());
    }
    return Result<std::vector<DependencySpec>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// Manifest::parse
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::parse(const std::string& input, const std::string& origin) {
    std::string text = strip_bom(input);

    // One key set per open object; a repeated key is a duplicate in that object
    std::vector<std::set<std::string>> open_objects;
    std::vector<std::string> duplicates;
    ojson::parser_callback_t track = [&](int, ojson::parse_event_t event, ojson& parsed) {
        switch (event) {
        case ojson::parse_event_t::object_start:
            open_objects.emplace_back();
            break;
        case ojson::parse_event_t::object_end:
            if (!open_objects.empty()) open_objects.pop_back();
            break;
        case ojson::parse_event_t::key:
            if (!open_objects.empty() &&
                !open_objects.back().insert(parsed.get<std::string>()).second) {
                duplicates.push_back(parsed.get<std::string>());
            }
            break;
        default:
            break;
        }
        return true;
    };

    Manifest m;
    m.origin = origin;
    try {
        m.document = ojson::parse(text, track);
    } catch (const nlohmann::json::exception& e) {
        return malformed(origin, std::string("invalid JSON: ") + e.what());
    }

    for (auto& key : duplicates) {
        log::warn("%s: duplicate key '%s', the last occurrence wins",
                  origin.c_str(), key.c_str());
    }

    const auto& doc = m.document;
    if (!doc.is_object()) {
        return malformed(origin, "package.json must contain a JSON object");
    }

    auto name = doc.find("name");
    if (name == doc.end() || !name->is_string() || name->get<std::string>().empty()) {
        return malformed(origin, "missing required field 'name'");
    }
    m.name = name->get<std::string>();
    auto pkg = PkgName::parse(m.name);
    if (pkg.is_err()) {
        return malformed(origin, pkg.error().message, pkg.error().hint);
    }

    auto version = doc.find("version");
    if (version != doc.end()) {
        if (!version->is_string()) {
            return malformed(origin, "'version' must be a string");
        }
        m.version = version->get<std::string>();
    }

    auto deps = parse_dependency_section(doc, "dependencies", false, origin);
    if (deps.is_err()) return std::move(deps).error();
    m.dependencies = std::move(deps).value();

    auto dev = parse_dependency_section(doc, "devDependencies", true, origin);
    if (dev.is_err()) return std::move(dev).error();
    for (auto& spec : dev.value()) {
        if (m.find_dependency(spec.name)) {
            log::warn("%s: '%s' is listed in both dependencies and devDependencies; "
                      "using the dependencies entry", origin.c_str(), spec.name.c_str());
            continue;
        }
        m.dev_dependencies.push_back(std::move(spec));
    }

    m.scripts = parse_scripts(doc, origin);
    m.bin = parse_bin(doc, m.name, origin);

    auto ws = doc.find("workspaces");
    if (ws != doc.end()) {
        const ojson* patterns = &*ws;
        if (ws->is_object()) {
            auto pkgs = ws->find("packages");
            patterns = pkgs != ws->end() ? &*pkgs : nullptr;
        }
        if (!patterns || !patterns->is_array()) {
            return malformed(origin, "'workspaces' must be an array of glob patterns",
                             "or an object with a 'packages' array");
        }
        for (auto& p : *patterns) {
            if (!p.is_string()) {
                return malformed(origin, "workspace patterns must be strings");
            }
            m.workspaces.push_back(p.get<std::string>());
        }
    }

    return Result<Manifest>::ok(std::move(m));
}

Result<Manifest> Manifest::load(const fs::path& path) {
    auto text = fsutil::read_file(path);
    if (text.is_err()) return std::move(text).error();
    return Manifest::parse(text.value(), path.string());
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

static void sync_section(ojson& doc, const char* key, const std::vector<DependencySpec>& specs) {
    if (specs.empty() && !doc.contains(key)) return;
    ojson section = ojson::object();
    for (auto& spec : specs) {
        section[spec.name] = spec.range;
    }
    doc[key] = std::move(section);
}

std::string Manifest::serialize() const {
    ojson doc = document.is_object() ? document : ojson::object();
    if (!doc.contains("name")) doc["name"] = name;
    sync_section(doc, "dependencies", dependencies);
    sync_section(doc, "devDependencies", dev_dependencies);
    return doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

Status Manifest::save(const fs::path& path) const {
    return fsutil::write_file_atomic(path, serialize());
}

Status Manifest::add_dependency(const std::string& dep_name, const std::string& range,
                                bool dev) {
    auto spec = DependencySpec::make(dep_name, range, dev);
    if (spec.is_err()) return std::move(spec).error();

    auto& target = dev ? dev_dependencies : dependencies;
    auto& other = dev ? dependencies : dev_dependencies;

    other.erase(std::remove_if(other.begin(), other.end(),
        [&](const DependencySpec& s) { return s.name == dep_name; }), other.end());

    for (auto& s : target) {
        if (s.name == dep_name) {
            s = std::move(spec).value();
            return ok_status();
        }
    }
    target.push_back(std::move(spec).value());
    return ok_status();
}

bool Manifest::remove_dependency(const std::string& dep_name) {
    bool removed = false;
    for (auto* list : {&dependencies, &dev_dependencies}) {
        auto it = std::remove_if(list->begin(), list->end(),
            [&](const DependencySpec& s) { return s.name == dep_name; });
        if (it != list->end()) removed = true;
        list->erase(it, list->end());
    }
    return removed;
}

const DependencySpec* Manifest::find_dependency(const std::string& dep_name) const {
    for (auto* list : {&dependencies, &dev_dependencies}) {
        for (auto& s : *list) {
            if (s.name == dep_name) return &s;
        }
    }
    return nullptr;
}

std::vector<DependencySpec> Manifest::specs(bool include_dev) const {
    std::vector<DependencySpec> out = dependencies;
    if (include_dev) {
        out.insert(out.end(), dev_dependencies.begin(), dev_dependencies.end());
    }
    return out;
}

std::optional<std::string> Manifest::script(const std::string& event) const {
    for (auto& [key, cmd] : scripts) {
        if (key == event) return cmd;
    }
    return std::nullopt;
}

Result<std::string> Manifest::dependency_hash() const {
    auto canonical = [](const std::vector<DependencySpec>& specs) {
        std::vector<std::string> lines;
        for (auto& s : specs) lines.push_back(s.name + "@" + s.range);
        std::sort(lines.begin(), lines.end());
        std::string out;
        for (auto& l : lines) out += l + "\n";
        return out;
    };

    std::string text = "[dependencies]\n" + canonical(dependencies) +
                       "[devDependencies]\n" + canonical(dev_dependencies) +
                       "[workspaces]\n";
    auto patterns = workspaces;
    std::sort(patterns.begin(), patterns.end());
    for (auto& p : patterns) text += p + "\n";

    return sha256_hex(text);
}

// ---------------------------------------------------------------------------
// PackageMeta
// ---------------------------------------------------------------------------

Result<PackageMeta> PackageMeta::load(const fs::path& package_dir) {
    auto path = package_dir / kManifestName;
    auto text = fsutil::read_file(path);
    if (text.is_err()) return std::move(text).error();

    auto doc = nlohmann::json::parse(strip_bom(text.value()), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return malformed(path.string(), "invalid package.json");
    }

    PackageMeta meta;
    if (auto it = doc.find("name"); it != doc.end() && it->is_string()) {
        meta.name = it->get<std::string>();
    }
    if (auto it = doc.find("version"); it != doc.end() && it->is_string()) {
        meta.version = it->get<std::string>();
    }
    meta.bin = parse_bin(doc, meta.name, path.string());
    meta.scripts = parse_scripts(doc, path.string());
    return Result<PackageMeta>::ok(std::move(meta));
}

std::optional<std::string> PackageMeta::script(const std::string& event) const {
    for (auto& [key, cmd] : scripts) {
        if (key == event) return cmd;
    }
    return std::nullopt;
}

} // namespace crabby
