#include "native.h"

#include <array>
#include <cerrno>
#include <clocale>
#include <cstdlib>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pst::native
{
    bool configureTerminal()
    {
        if(std::setlocale(LC_ALL, "") == nullptr)
        {
            return false;
        }

        const char* term = std::getenv("TERM");
        return term != nullptr && std::strcmp(term, "dumb") != 0;
    }

    std::pair<int, std::string> runProcess(const std::string & command, std::vector<std::string> args)
    {
        // close-on-exec so concurrently spawned children do not hold each other's pipe open
        int pipe_fds[2];
        if(::pipe2(pipe_fds, O_CLOEXEC) != 0)
        {
            return {-1, std::format("pipe2() failed: {}", std::strerror(errno))};
        }

        std::vector<char*> argv;
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char*>(command.c_str()));
        for(std::string & arg : args)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        const pid_t pid = ::fork();
        if(pid < 0)
        {
            ::close(pipe_fds[0]);
            ::close(pipe_fds[1]);
            return {-1, std::format("fork() failed: {}", std::strerror(errno))};
        }

        if(pid == 0)
        {
            ::dup2(pipe_fds[1], STDOUT_FILENO);
            ::dup2(pipe_fds[1], STDERR_FILENO);
            ::close(pipe_fds[0]);
            ::close(pipe_fds[1]);

            ::execvp(command.c_str(), argv.data());
            // exec only returns on failure
            ::_exit(127);
        }

        ::close(pipe_fds[1]);

        std::string output;
        std::array<char, 4096> buffer{};
        while(true)
        {
            const ssize_t n = ::read(pipe_fds[0], buffer.data(), buffer.size());
            if(n > 0)
            {
                output.append(buffer.data(), static_cast<std::size_t>(n));
                continue;
            }
            if(n < 0 && errno == EINTR)
            {
                continue;
            }
            break;
        }
        ::close(pipe_fds[0]);

        int status = 0;
        while(::waitpid(pid, &status, 0) < 0)
        {
            if(errno != EINTR)
            {
                return {-1, std::format("waitpid() failed: {}", std::strerror(errno))};
            }
        }

        if(WIFEXITED(status))
        {
            return {WEXITSTATUS(status), std::move(output)};
        }

        return {-1, std::move(output)};
    }

    bool syncPath(const std::filesystem::path & path)
    {
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if(fd < 0)
        {
            return false;
        }

        int res = 0;
        do
        {
            res = ::fsync(fd);
        }
        while(res != 0 && errno == EINTR);

        ::close(fd);
        return res == 0;
    }

    int processId()
    {
        return static_cast<int>(::getpid());
    }
}
