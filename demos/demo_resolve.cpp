// demo_resolve.cpp
//
// Resolves a project against a registry mirrored on disk and prints the
// placed dependency tree. With --install it also fetches, links and runs
// lifecycle scripts, then writes crabby.lock.
//
//     ./demo_resolve <project-dir> <registry-dir>
//     ./demo_resolve <project-dir> <registry-dir> --install
//
// The registry dir holds one packument per package (<name>.json, scoped
// names as @scope%2fname.json) plus the tarballs they point at.

#include <crabby/config.hpp>
#include <crabby/log.hpp>
#include <crabby/project.hpp>
#include <crabby/registry.hpp>
#include <crabby/resolver.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace crabby;

namespace {

struct Args {
    fs::path project_dir;
    fs::path registry_dir;
    bool install = false;
};

Result<Args> parse_args(int argc, char** argv) {
    Args args;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--install") {
            args.install = true;
        } else if (!a.empty() && a[0] == '-') {
            return CrabbyError{CrabbyError::InvalidArg, "unknown option " + a,
                               "usage: demo_resolve <project-dir> <registry-dir> [--install]"};
        } else {
            positional.push_back(a);
        }
    }
    if (positional.size() != 2) {
        return CrabbyError{CrabbyError::InvalidArg, "expected a project and a registry directory",
                           "usage: demo_resolve <project-dir> <registry-dir> [--install]"};
    }
    args.project_dir = positional[0];
    args.registry_dir = positional[1];
    return Result<Args>::ok(std::move(args));
}

int run(const Args& args) {
    auto project = Project::discover(args.project_dir);
    if (project.is_err()) {
        std::cerr << project.error().format() << "\n";
        return 1;
    }
    auto& proj = project.value();

    auto config = Config::effective(proj.root_dir);
    if (config.is_err()) {
        std::cerr << config.error().format() << "\n";
        return 1;
    }
    if (config.value().log_level) log::set_level(*config.value().log_level);

    DirectoryRegistry registry(args.registry_dir);

    if (!args.install) {
        auto ws = proj.workspace();
        if (ws.is_err()) {
            std::cerr << ws.error().format() << "\n";
            return 1;
        }
        ResolveOptions options;
        options.include_dev = config.value().dev_included();
        options.integrity_algorithm = config.value().algorithm();

        Resolver resolver(registry, &ws.value());
        auto resolved = resolver.resolve(proj.manifest, proj.lockfile, options);
        if (resolved.is_err()) {
            std::cerr << resolved.error().format() << "\n";
            return 1;
        }
        std::cout << resolved.value().graph.tree_display();
        std::cout << resolved.value().lockfile.packages.size() << " packages, "
                  << resolved.value().registry_queries << " registry queries"
                  << (resolved.value().lockfile_used ? " (lockfile up to date)" : "") << "\n";
        return 0;
    }

    auto outcome = proj.install(registry, config.value());
    if (outcome.is_err()) {
        std::cerr << outcome.error().format() << "\n";
        return 1;
    }
    const auto& report = outcome.value().report;
    std::cout << outcome.value().resolution.graph.tree_display();
    std::cout << report.summary() << "\n";
    for (const auto& failure : report.failed_scripts) {
        std::cerr << failure.package << " " << failure.event << " exited with "
                  << failure.exit_code << "\n" << failure.output;
    }
    if (report.fatal) std::cerr << report.fatal->format() << "\n";
    return report.exit_code();
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 1;
    }
    return run(args.value());
}
