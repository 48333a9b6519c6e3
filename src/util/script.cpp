#include <crabby/script.hpp>
#include <crabby/log.hpp>
#include <crabby/process.hpp>

#include <cstdlib>

namespace crabby {

Result<ScriptOutcome> ShellScriptRunner::run(const std::string& event,
                                             const std::string& command,
                                             const ScriptContext& context) {
    std::string path;
    for (const auto& dir : context.bin_dirs) {
        if (!path.empty()) path += ':';
        path += dir.string();
    }
    const char* inherited = std::getenv("PATH");
    if (inherited && *inherited) {
        if (!path.empty()) path += ':';
        path += inherited;
    }

    CommandOptions options;
    options.working_dir = context.package_dir.string();
    options.timeout_seconds = context.timeout_seconds;
    options.cancel = context.cancel;
    options.env = {
        {"PATH", path},
        {"npm_lifecycle_event", event},
        {"npm_lifecycle_script", command},
        {"npm_package_name", context.package_name},
        {"npm_package_version", context.package_version},
    };

    log::info("%s@%s: running %s script", context.package_name.c_str(),
              context.package_version.c_str(), event.c_str());
    log::debug("  $ %s", command.c_str());

    auto result = run_command({"/bin/sh", "-c", command}, options);
    if (result.is_err()) {
        return std::move(result).context(context.package_name + " " + event).error();
    }

    ScriptOutcome outcome;
    outcome.exit_code = result.value().exit_code;
    outcome.output = result.value().stdout_str + result.value().stderr_str;
    return Result<ScriptOutcome>::ok(std::move(outcome));
}

} // namespace crabby
