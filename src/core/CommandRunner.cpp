#include "CommandRunner.hpp"
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcpline {

namespace {

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void kill_and_reap(pid_t pid) {
    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}

int exit_status_of(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

CommandRunner::CommandRunner(std::chrono::milliseconds timeout)
    : timeout_(timeout) {
    if (timeout_.count() <= 0) {
        throw std::invalid_argument("Command timeout must be positive");
    }
}

CommandResult CommandRunner::run(const std::vector<std::string>& argv) const {
    if (argv.empty() || argv[0].empty()) {
        throw std::invalid_argument("Command cannot be empty");
    }

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) == -1) {
        throw std::runtime_error(errno_message("pipe"));
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) == -1) {
        const std::string message = errno_message("pipe");
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        throw std::runtime_error(message);
    }

    // Built before fork so the child does not allocate
    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    spdlog::debug("Executing {} with {} arguments", argv[0], argv.size() - 1);

    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    pid_t pid = fork();
    if (pid == -1) {
        const std::string message = errno_message("fork");
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        throw std::runtime_error(message);
    }

    if (pid == 0) {
        // Child: original pipe ends are O_CLOEXEC, the dup2 copies are not
        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        execvp(args[0], args.data());

        const char message[] = "exec failed\n";
        ssize_t ignored = write(STDERR_FILENO, message, sizeof(message) - 1);
        (void)ignored;
        _exit(127);
    }

    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);

    CommandResult result;
    struct pollfd fds[2] = {
        {stdout_pipe[0], POLLIN, 0},
        {stderr_pipe[0], POLLIN, 0}
    };
    std::string* sinks[2] = {&result.standard_output, &result.standard_error};
    int open_count = 2;
    bool timed_out = false;
    char buffer[4096];

    while (open_count > 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }

        int ready = poll(fds, 2, static_cast<int>(remaining));
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            const std::string message = errno_message("poll");
            close_fd(fds[0].fd);
            close_fd(fds[1].fd);
            kill_and_reap(pid);
            throw std::runtime_error(message);
        }
        if (ready == 0) {
            timed_out = true;
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close_fd(fds[i].fd);
                --open_count;
            }
        }
    }

    close_fd(fds[0].fd);
    close_fd(fds[1].fd);

    int status = 0;
    while (!timed_out) {
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited == -1 && errno != EINTR) {
            const std::string message = errno_message("waitpid");
            kill_and_reap(pid);
            throw std::runtime_error(message);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }
        // Output is closed but the child has not exited yet
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (timed_out) {
        kill_and_reap(pid);
        spdlog::warn("Command {} killed after {} ms", argv[0], timeout_.count());
        throw CommandTimeout("Command timed out after " + std::to_string(timeout_.count()) + " ms: " + argv[0]);
    }

    result.exit_status = exit_status_of(status);
    spdlog::debug("Command {} exited with status {}", argv[0], result.exit_status);
    return result;
}

} // namespace mcpline
