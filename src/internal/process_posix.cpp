// POSIX implementation of blocking subprocess execution

#ifndef _WIN32

#include "process.hpp"

#include <cstdlib>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcpcommons::process
{

namespace
{

std::string get_errno_message(int err = errno)
{
    return std::strerror(err);
}

/// Owns one pipe (read end fds[0], write end fds[1])
struct Pipe
{
    int fds[2] = {-1, -1};

    Pipe() = default;
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    ~Pipe()
    {
        close_read();
        close_write();
    }

    void open(const char* what)
    {
        if (::pipe(fds) != 0)
            throw ProcessError(std::string("Failed to create ") + what +
                               " pipe: " + get_errno_message());
        fcntl(fds[0], F_SETFD, FD_CLOEXEC);
        fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    }

    void close_read()
    {
        if (fds[0] >= 0)
        {
            ::close(fds[0]);
            fds[0] = -1;
        }
    }

    void close_write()
    {
        if (fds[1] >= 0)
        {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }
};

[[noreturn]] void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

int wait_for(pid_t pid)
{
    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
            throw ProcessError("waitpid failed: " + get_errno_message());
    }
    return decode_status(status);
}

// Reads stdout and stderr together until both reach EOF.
void drain(Pipe& out, Pipe& err, ProcessResult& result)
{
    char buffer[4096];
    while (out.fds[0] >= 0 || err.fds[0] >= 0)
    {
        pollfd fds[2];
        nfds_t count = 0;
        if (out.fds[0] >= 0)
            fds[count++] = pollfd{out.fds[0], POLLIN, 0};
        if (err.fds[0] >= 0)
            fds[count++] = pollfd{err.fds[0], POLLIN, 0};

        if (::poll(fds, count, -1) < 0)
        {
            if (errno == EINTR)
                continue;
            throw ProcessError("poll failed: " + get_errno_message());
        }

        for (nfds_t i = 0; i < count; ++i)
        {
            if (fds[i].revents == 0)
                continue;
            Pipe& pipe = fds[i].fd == out.fds[0] ? out : err;
            std::string& sink = &pipe == &out ? result.output : result.error_output;

            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0)
                sink.append(buffer, static_cast<size_t>(n));
            else if (n == 0 || errno != EINTR)
                pipe.close_read();
        }
    }
}

} // namespace

ProcessResult run(const std::string& executable, const std::vector<std::string>& args)
{
    Pipe out;
    Pipe err;
    Pipe error_pipe; // reports exec failures from the child
    out.open("stdout");
    err.open("stderr");
    error_pipe.open("error");

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
        throw ProcessError("Failed to fork process: " + get_errno_message());

    if (pid == 0)
    {
        // Child process
        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) < 0)
            child_fail(error_pipe.fds[1]);
        if (dup2(out.fds[1], STDOUT_FILENO) < 0 || dup2(err.fds[1], STDERR_FILENO) < 0)
            child_fail(error_pipe.fds[1]);

        execvp(executable.c_str(), argv.data());
        child_fail(error_pipe.fds[1]);
    }

    // Parent process
    out.close_write();
    err.close_write();
    error_pipe.close_write();

    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(error_pipe.fds[0], &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);

    if (error_bytes > 0)
    {
        wait_for(pid);
        throw ProcessError("Failed to execute '" + executable +
                           "': " + get_errno_message(child_errno));
    }

    ProcessResult result;
    drain(out, err, result);
    result.exit_code = wait_for(pid);
    return result;
}

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto is_executable = [](const fs::path& candidate)
    {
        std::error_code ec;
        return fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0;
    };

    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string::npos)
    {
        if (is_executable(name))
            return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path test_path = fs::path(dir) / name;
            if (is_executable(test_path))
                return test_path.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace mcpcommons::process

#endif // !_WIN32
