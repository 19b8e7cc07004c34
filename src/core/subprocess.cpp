#include "core/subprocess.hpp"
#include "core/utils.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace querydesk::utils {

namespace {

struct FdCloser {
    int fd = -1;
    ~FdCloser() { if (fd >= 0) ::close(fd); }
};

} // namespace

Result<ProcessOutput> run_process(const std::vector<std::string>& argv,
                                  const std::vector<std::string>& extra_env,
                                  std::chrono::milliseconds timeout) {
    using R = Result<ProcessOutput>;
    if (argv.empty()) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "run_process: empty argv");
    }

    int fds[2];
    if (::pipe(fds) != 0) {
        return R::error(ErrorCategory::INTERNAL_ERROR,
            std::format("pipe failed: {}", std::strerror(errno)));
    }
    FdCloser read_end{fds[0]};
    FdCloser write_end{fds[1]};

    std::vector<char*> args;
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    std::vector<char*> env;
    for (char** e = environ; e && *e; ++e) env.push_back(*e);
    for (const auto& e : extra_env) env.push_back(const_cast<char*>(e.c_str()));
    env.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, fds[0]);
    posix_spawn_file_actions_addclose(&actions, fds[1]);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    pid_t pid = -1;
    const int rc = ::posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), env.data());
    posix_spawn_file_actions_destroy(&actions);
    if (rc != 0) {
        return R::error(ErrorCategory::NOT_FOUND,
            std::format("cannot run '{}': {}", argv[0], std::strerror(rc)));
    }
    ::close(write_end.fd);
    write_end.fd = -1;

    ProcessOutput out;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buffer;
    bool timed_out = false;

    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }
        pollfd pfd{read_end.fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;
        const ssize_t n = ::read(read_end.fd, buffer.data(), buffer.size());
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        out.stdout_text.append(buffer.data(), static_cast<size_t>(n));
    }

    if (timed_out) {
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return R::error(ErrorCategory::INTERNAL_ERROR,
                std::format("waitpid failed: {}", std::strerror(errno)));
        }
    }

    if (timed_out) {
        return R::error(ErrorCategory::TIMEOUT,
            std::format("'{}' timed out after {} ms", argv[0], timeout.count()));
    }

    out.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return R::ok(std::move(out));
}

} // namespace querydesk::utils
