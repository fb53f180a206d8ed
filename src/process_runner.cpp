#include "core/process_runner.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace
{
    constexpr int kReapPollMillis = 20;

    void closeFd(int &fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    bool makePipe(int fds[2])
    {
        if (::pipe(fds) != 0)
            return false;
        ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        return true;
    }

    int remainingMillis(std::chrono::steady_clock::time_point deadline)
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? static_cast<int>(left.count()) : 0;
    }
}

ProcessRunner::ProcessRunner(size_t max_output_bytes, std::chrono::seconds timeout)
    : max_output_bytes_(max_output_bytes == 0 ? 1 : max_output_bytes), timeout_(timeout)
{
}

ProcessResult ProcessRunner::run(const std::vector<std::string> &argv) const
{
    ProcessResult result;
    if (argv.empty())
    {
        result.error_message = "empty command line";
        return result;
    }

    int output_pipe[2] = {-1, -1};
    int exec_error_pipe[2] = {-1, -1};
    if (!makePipe(output_pipe))
    {
        result.error_message = "failed to create output pipe: " + std::string(std::strerror(errno));
        return result;
    }
    if (!makePipe(exec_error_pipe))
    {
        result.error_message = "failed to create status pipe: " + std::string(std::strerror(errno));
        closeFd(output_pipe[0]);
        closeFd(output_pipe[1]);
        return result;
    }

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &arg : argv)
        args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
    {
        result.error_message = "fork failed: " + std::string(std::strerror(errno));
        closeFd(output_pipe[0]);
        closeFd(output_pipe[1]);
        closeFd(exec_error_pipe[0]);
        closeFd(exec_error_pipe[1]);
        return result;
    }

    if (pid == 0)
    {
        // Child: only async-signal-safe calls from here on
        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0)
        {
            ::dup2(null_fd, STDIN_FILENO);
            ::close(null_fd);
        }
        ::dup2(output_pipe[1], STDOUT_FILENO);
        ::dup2(output_pipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());
        int exec_errno = errno;
        ssize_t ignored = ::write(exec_error_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    closeFd(output_pipe[1]);
    closeFd(exec_error_pipe[1]);

    // The status pipe closes on a successful exec, or carries errno on failure
    int exec_errno = 0;
    ssize_t status_read;
    do
    {
        status_read = ::read(exec_error_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (status_read < 0 && errno == EINTR);
    closeFd(exec_error_pipe[0]);

    if (status_read == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        result.error_message = "failed to launch " + argv[0] + ": " + std::strerror(exec_errno);
        closeFd(output_pipe[0]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        return result;
    }
    result.launched = true;

    const bool bounded = timeout_.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    char buffer[4096];
    while (true)
    {
        struct pollfd pfd;
        pfd.fd = output_pipe[0];
        pfd.events = POLLIN;
        pfd.revents = 0;

        int wait_ms = bounded ? remainingMillis(deadline) : -1;
        int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            result.error_message = "poll failed: " + std::string(std::strerror(errno));
            break;
        }
        if (ready == 0)
        {
            result.timed_out = true;
            ::kill(pid, SIGKILL);
            break;
        }

        ssize_t count = ::read(output_pipe[0], buffer, sizeof(buffer));
        if (count < 0)
        {
            if (errno == EINTR)
                continue;
            result.error_message = "failed to read process output: " + std::string(std::strerror(errno));
            break;
        }
        if (count == 0)
            break;

        result.output.append(buffer, static_cast<size_t>(count));
        if (result.output.size() > max_output_bytes_)
        {
            size_t excess = result.output.size() - max_output_bytes_;
            result.output.erase(0, excess);
            result.truncated_bytes += excess;
        }
    }
    closeFd(output_pipe[0]);

    // The child may outlive its output stream, so the deadline still applies
    int status = 0;
    pid_t waited = 0;
    if (bounded && !result.timed_out)
    {
        while (true)
        {
            waited = ::waitpid(pid, &status, WNOHANG);
            if (waited < 0 && errno == EINTR)
                continue;
            if (waited != 0)
                break;
            if (remainingMillis(deadline) == 0)
            {
                result.timed_out = true;
                ::kill(pid, SIGKILL);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(std::min(kReapPollMillis, remainingMillis(deadline))));
        }
    }
    if (waited == 0)
    {
        do
        {
            waited = ::waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);
    }

    if (waited < 0)
    {
        result.error_message = "waitpid failed: " + std::string(std::strerror(errno));
        return result;
    }
    if (WIFEXITED(status))
    {
        result.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        result.term_signal = WTERMSIG(status);
    }
    return result;
}

std::string ProcessRunner::describeOutput(const ProcessResult &result)
{
    if (result.truncated_bytes == 0)
        return result.output;
    return "[truncated " + std::to_string(result.truncated_bytes) + " bytes]" + result.output;
}
