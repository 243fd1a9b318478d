#ifndef COMMAND_HPP
#define COMMAND_HPP

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace Lempctl {

/**
 * @brief Outcome class of an external invocation.
 *
 * NotFound means the executable could not be started at all, Failed means
 * it ran and exited non-zero (or was killed), TimedOut means it was killed
 * after exceeding its deadline. UnexpectedOutput is never produced by a
 * runner; callers downgrade a Succeeded result to it via requireOutput().
 */
enum class CommandStatus
{
    Succeeded,
    NotFound,
    Failed,
    TimedOut,
    UnexpectedOutput
};

/**
 * @brief A single external invocation: argv, optional stdin, deadline and
 *        extra environment for the child.
 */
struct Command
{
    std::vector<std::string> argv;
    std::string input;
    std::chrono::seconds timeout{120};
    std::vector<std::pair<std::string, std::string>> env;
};

struct CommandResult
{
    CommandStatus status = CommandStatus::Failed;
    int exitCode = -1;
    std::string output;

    bool succeeded() const { return status == CommandStatus::Succeeded; }

    /**
     * @brief Short human-readable description, e.g. "exited with code 1".
     */
    std::string describe() const;
};

/**
 * @class CommandRunner
 * @brief Runs external programs synchronously.
 *
 * The pipeline talks to apt, systemctl, mariadb, nginx, ss and ufw only
 * through this interface.
 */
class CommandRunner
{
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Runs the command to completion (or until its timeout).
     *
     * @param command The command to execute. argv[0] is looked up in PATH.
     * @return The typed result; stdout is captured in CommandResult::output.
     */
    virtual CommandResult run(const Command& command) = 0;
};

/**
 * @class SystemCommandRunner
 * @brief CommandRunner backed by fork/execvp.
 *
 * Stdout is captured, stderr is discarded, and the child is killed with
 * SIGKILL once the command's timeout elapses.
 */
class SystemCommandRunner : public CommandRunner
{
public:
    CommandResult run(const Command& command) override;
};

/**
 * @brief Downgrades a successful result whose output does not contain
 *        `needle` to CommandStatus::UnexpectedOutput.
 */
CommandResult requireOutput(CommandResult result, const std::string& needle);

/**
 * @brief Joins argv into a single line for log messages.
 */
std::string commandLine(const std::vector<std::string>& argv);

} // namespace Lempctl

#endif // COMMAND_HPP
