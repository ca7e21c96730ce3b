#include "Process.hpp"
#include <array>
#include <cerrno>
#include <cstddef>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace wipecert::device::detail
{
namespace
{

constexpr int g_kExecFailed{ 127 };

[[noreturn]] void throwErrno(const char* what)
{
    throw std::system_error{ errno, std::generic_category(), what };
}

} // namespace

ProcessOutput runProcess(const std::vector<std::string>& args)
{
    if (args.empty())
    {
        throw std::invalid_argument("runProcess: empty argument list");
    }

    std::vector<char*> argv{};
    argv.reserve(args.size() + 1U);
    for (const auto& arg : args)
    {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::array<int, 2> fds{ -1, -1 };
    if (::pipe2(fds.data(), O_CLOEXEC) != 0)
    {
        throwErrno("runProcess: pipe2");
    }

    const pid_t pid{ ::fork() };
    if (pid < 0)
    {
        const int err{ errno };
        ::close(fds[0]);
        ::close(fds[1]);
        throw std::system_error{ err, std::generic_category(), "runProcess: fork" };
    }

    if (pid == 0)
    {
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());
        ::_exit(g_kExecFailed);
    }

    ::close(fds[1]);
    ProcessOutput out{};
    std::array<char, 4096> chunk{};
    for (;;)
    {
        const ssize_t n{ ::read(fds[0], chunk.data(), chunk.size()) };
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            break;
        }
        if (n == 0)
        {
            break;
        }
        out.output.append(chunk.data(), static_cast<std::size_t>(n));
    }
    ::close(fds[0]);

    int status{ 0 };
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            throwErrno("runProcess: waitpid");
        }
    }
    out.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return out;
}

} // namespace wipecert::device::detail
