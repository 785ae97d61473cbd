#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpline {

/**
 * @brief Captured outcome of a finished child process
 */
struct CommandResult {
    std::string standard_output;
    std::string standard_error;
    int exit_status = 0;  // 128 + signal number when killed by a signal
};

/**
 * @brief Raised when a command exceeds its time budget
 */
class CommandTimeout : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Runs external programs without a shell
 *
 * The child gets /dev/null as stdin; stdout and stderr are captured
 * through pipes. A command running longer than the timeout is killed.
 */
class CommandRunner {
public:
    /**
     * @brief Construct runner with a per-command timeout
     * @param timeout Maximum wall time for a single command
     * @throws std::invalid_argument if timeout is not positive
     */
    explicit CommandRunner(std::chrono::milliseconds timeout);

    /**
     * @brief Execute argv[0] with the remaining arguments (PATH lookup)
     * @param argv Program and arguments
     * @return Captured output and exit status; exit status 127 when the program cannot be executed
     * @throws std::invalid_argument on empty argv
     * @throws std::runtime_error if pipes or the child cannot be created
     * @throws CommandTimeout if the command does not finish in time
     */
    CommandResult run(const std::vector<std::string>& argv) const;

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

} // namespace mcpline
