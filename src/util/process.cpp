#include <crabby/process.hpp>
#include <crabby/log.hpp>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace crabby {

namespace {

void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

} // namespace

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const CommandOptions& options) {
    if (args.empty()) {
        return CrabbyError{CrabbyError::InvalidArg, "run_command: empty args"};
    }

    // Build argv for execvp
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return CrabbyError{CrabbyError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return CrabbyError{CrabbyError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return CrabbyError{CrabbyError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        // Scripts must not read from the installer's terminal
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        if (!options.working_dir.empty()) {
            if (chdir(options.working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        for (const auto& [key, value] : options.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    auto abandon = [&](CrabbyError err) -> Result<CommandResult> {
        kill(pid, SIGKILL);
        waitpid(pid, nullptr, 0);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
        return err;
    };

    while (true) {
        if (options.cancel && options.cancel->load()) {
            return abandon(CrabbyError{CrabbyError::Cancelled,
                "command cancelled: " + args[0]});
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                >= options.timeout_seconds) {
            return abandon(CrabbyError{CrabbyError::Script,
                "command timed out after " + std::to_string(options.timeout_seconds) + "s"});
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            int exit_code = -1;
            if (WIFEXITED(status)) {
                exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                exit_code = 128 + WTERMSIG(status);
            }
            log::trace("%s exited with %d", args[0].c_str(), exit_code);
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return CrabbyError{CrabbyError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);
    }
}

} // namespace crabby
