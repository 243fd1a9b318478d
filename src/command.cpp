#include "command.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <system_error>

// Required Linux/Unix Headers
#include <fcntl.h>     // O_CLOEXEC, open
#include <poll.h>      // poll
#include <signal.h>    // kill, SIGKILL
#include <sys/types.h> // pid_t
#include <sys/wait.h>  // waitpid
#include <unistd.h>    // fork, execvp, pipe2, _exit

namespace Lempctl {

std::string CommandResult::describe() const
{
    switch (status) {
        case CommandStatus::Succeeded:
            return "succeeded";
        case CommandStatus::NotFound:
            return "command not found";
        case CommandStatus::Failed:
            if (exitCode >= 0) {
                return "exited with code " + std::to_string(exitCode);
            }
            return "terminated abnormally";
        case CommandStatus::TimedOut:
            return "timed out";
        case CommandStatus::UnexpectedOutput:
            return "succeeded with unexpected output";
    }
    return "unknown status";
}

CommandResult requireOutput(CommandResult result, const std::string& needle)
{
    if (result.succeeded() && result.output.find(needle) == std::string::npos) {
        result.status = CommandStatus::UnexpectedOutput;
    }
    return result;
}

std::string commandLine(const std::vector<std::string>& argv)
{
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        line += arg;
    }
    return line;
}

namespace {

    // Closes a descriptor if it is still open and marks it as closed.
    void closeFd(int& fd)
    {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }

    /**
     * Child side of run(): wires up the pipes and replaces the process image.
     * On exec failure errno is sent back through errPipe and the child exits.
     */
    [[noreturn]] void execChild(const Command& command, int stdinRead, int stdoutWrite, int errWrite)
    {
        if (dup2(stdinRead, STDIN_FILENO) < 0 || dup2(stdoutWrite, STDOUT_FILENO) < 0) {
            int err = errno;
            (void)!write(errWrite, &err, sizeof(err));
            _exit(127);
        }

        int devNull = open("/dev/null", O_WRONLY);
        if (devNull >= 0) {
            dup2(devNull, STDERR_FILENO);
            close(devNull);
        }

        for (const auto& [key, value] : command.env) {
            setenv(key.c_str(), value.c_str(), 1);
        }

        std::vector<char*> argv;
        for (const auto& arg : command.argv) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execvp(argv[0], argv.data());

        // If execvp returns, an error occurred
        int err = errno;
        (void)!write(errWrite, &err, sizeof(err));
        _exit(127);
    }

} // namespace

CommandResult SystemCommandRunner::run(const Command& command)
{
    CommandResult result;

    if (command.argv.empty() || command.argv[0].empty()) {
        throw std::invalid_argument("Empty command passed to SystemCommandRunner");
    }

    int stdinPipe[2];
    int stdoutPipe[2];
    int errPipe[2];

    if (pipe2(stdinPipe, O_CLOEXEC) != 0) {
        throw std::system_error(errno, std::system_category(), "pipe failed");
    }
    if (pipe2(stdoutPipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(stdinPipe[0]);
        close(stdinPipe[1]);
        throw std::system_error(err, std::system_category(), "pipe failed");
    }
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        int err = errno;
        close(stdinPipe[0]);
        close(stdinPipe[1]);
        close(stdoutPipe[0]);
        close(stdoutPipe[1]);
        throw std::system_error(err, std::system_category(), "pipe failed");
    }

    // --- Fork Process ---
    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        for (int fd : {stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1], errPipe[0], errPipe[1]}) {
            close(fd);
        }
        throw std::system_error(err, std::system_category(), "Fork failed");
    }

    // --- Child Process ---
    if (pid == 0) {
        execChild(command, stdinPipe[0], stdoutPipe[1], errPipe[1]);
    }

    // --- Parent Process ---
    close(stdinPipe[0]);
    close(stdoutPipe[1]);
    close(errPipe[1]);

    int stdinFd  = stdinPipe[1];
    int stdoutFd = stdoutPipe[0];
    int errFd    = errPipe[0];

    // Feed stdin up front; the inputs used here are small SQL batches.
    size_t written = 0;
    while (written < command.input.size()) {
        ssize_t n = write(stdinFd, command.input.data() + written, command.input.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break; // child closed its stdin; its exit status tells the rest
        }
        written += static_cast<size_t>(n);
    }
    closeFd(stdinFd);

    auto deadline = std::chrono::steady_clock::now() + command.timeout;
    bool timedOut = false;
    char buffer[4096];

    while (stdoutFd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timedOut = true;
            break;
        }

        struct pollfd pfd{stdoutFd, POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (ready == 0) {
            continue; // deadline re-checked at top of loop
        }

        ssize_t n = read(stdoutFd, buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            closeFd(stdoutFd);
        }
    }
    closeFd(stdoutFd);

    int status = 0;
    pid_t waited = 0;

    // Stdout may close before the child exits; keep honoring the deadline.
    while (!timedOut) {
        waited = waitpid(pid, &status, WNOHANG);
        if (waited != 0 && !(waited < 0 && errno == EINTR)) {
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timedOut = true;
            break;
        }
        usleep(10000);
    }

    if (timedOut) {
        kill(pid, SIGKILL);
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);
    }

    int execErrno = 0;
    ssize_t errBytes = read(errFd, &execErrno, sizeof(execErrno));
    closeFd(errFd);

    if (errBytes == static_cast<ssize_t>(sizeof(execErrno))) {
        result.status = (execErrno == ENOENT || execErrno == EACCES)
                            ? CommandStatus::NotFound
                            : CommandStatus::Failed;
        return result;
    }

    if (timedOut) {
        result.status = CommandStatus::TimedOut;
        return result;
    }

    if (waited < 0) {
        result.status = CommandStatus::Failed;
        return result;
    }

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        result.status = (result.exitCode == 0) ? CommandStatus::Succeeded : CommandStatus::Failed;
    } else {
        // Terminated by signal or unknown status
        result.status = CommandStatus::Failed;
    }
    return result;
}

} // namespace Lempctl
