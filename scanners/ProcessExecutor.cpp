#include "ProcessExecutor.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace net_discovery::scanners
{
    namespace
    {
        constexpr int POLL_SLICE_MS = 100;

        struct Pipe
        {
            int fds[2] = {-1, -1};

            bool Open()
            {
                return pipe2(fds, O_CLOEXEC) == 0;
            }

            void CloseRead()
            {
                if (fds[0] >= 0)
                    close(fds[0]);
                fds[0] = -1;
            }

            void CloseWrite()
            {
                if (fds[1] >= 0)
                    close(fds[1]);
                fds[1] = -1;
            }

            ~Pipe()
            {
                CloseRead();
                CloseWrite();
            }
        };

        // Returns false once the descriptor reached EOF.
        bool Drain(int fd, std::string &out)
        {
            char buffer[4096];
            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0)
            {
                out.append(buffer, static_cast<std::size_t>(n));
                return true;
            }
            if (n < 0 && (errno == EINTR || errno == EAGAIN))
                return true;
            return false;
        }

        int DecodeStatus(int status)
        {
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            if (WIFSIGNALED(status))
                return 128 + WTERMSIG(status);
            return -1;
        }
    }

    bool IsRoot()
    {
        return geteuid() == 0;
    }

    bool SubprocessExecutor::IsAvailable(const std::string &executable) const
    {
        if (executable.empty())
            return false;
        if (executable.find('/') != std::string::npos)
            return access(executable.c_str(), X_OK) == 0;

        const char *path = std::getenv("PATH");
        if (!path)
            return false;

        std::stringstream ss(path);
        std::string dir;
        while (std::getline(ss, dir, ':'))
        {
            if (dir.empty())
                continue;
            std::string candidate = dir + "/" + executable;
            struct stat st{};
            if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0)
                return true;
        }
        return false;
    }

    ProcessResult SubprocessExecutor::Execute(const std::vector<std::string> &argv,
                                              std::chrono::milliseconds timeout,
                                              const std::atomic<bool> *cancel)
    {
        ProcessResult result;
        if (argv.empty())
        {
            result.launch_error = "empty command";
            return result;
        }

        Pipe out_pipe, err_pipe, exec_pipe;
        if (!out_pipe.Open() || !err_pipe.Open() || !exec_pipe.Open())
        {
            result.launch_error = std::string("pipe: ") + std::strerror(errno);
            return result;
        }

        std::vector<char *> args;
        args.reserve(argv.size() + 1);
        for (const auto &arg : argv)
            args.push_back(const_cast<char *>(arg.c_str()));
        args.push_back(nullptr);

        pid_t pid = fork();
        if (pid < 0)
        {
            result.launch_error = std::string("fork: ") + std::strerror(errno);
            return result;
        }

        if (pid == 0)
        {
            dup2(out_pipe.fds[1], STDOUT_FILENO);
            dup2(err_pipe.fds[1], STDERR_FILENO);
            execvp(args[0], args.data());

            int err = errno;
            ssize_t ignored = write(exec_pipe.fds[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        out_pipe.CloseWrite();
        err_pipe.CloseWrite();
        exec_pipe.CloseWrite();

        // exec_pipe is CLOEXEC: EOF without data means execvp succeeded.
        int exec_errno = 0;
        ssize_t n;
        do
        {
            n = read(exec_pipe.fds[0], &exec_errno, sizeof(exec_errno));
        } while (n < 0 && errno == EINTR);

        if (n == static_cast<ssize_t>(sizeof(exec_errno)))
        {
            int status = 0;
            waitpid(pid, &status, 0);
            result.launch_error = argv[0] + ": " + std::strerror(exec_errno);
            return result;
        }

        result.launched = true;

        auto deadline = std::chrono::steady_clock::now() + timeout;
        bool out_open = true;
        bool err_open = true;
        bool killed = false;

        while (out_open || err_open)
        {
            if (cancel && cancel->load())
            {
                result.cancelled = true;
                killed = true;
                kill(pid, SIGKILL);
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline)
            {
                result.timed_out = true;
                killed = true;
                kill(pid, SIGKILL);
                break;
            }

            pollfd fds[2];
            nfds_t count = 0;
            int out_index = -1, err_index = -1;
            if (out_open)
            {
                fds[count] = {out_pipe.fds[0], POLLIN, 0};
                out_index = static_cast<int>(count++);
            }
            if (err_open)
            {
                fds[count] = {err_pipe.fds[0], POLLIN, 0};
                err_index = static_cast<int>(count++);
            }

            int ready = poll(fds, count, POLL_SLICE_MS);
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                killed = true;
                kill(pid, SIGKILL);
                break;
            }
            if (ready == 0)
                continue;

            if (out_index >= 0 && (fds[out_index].revents & (POLLIN | POLLHUP | POLLERR)))
                out_open = Drain(out_pipe.fds[0], result.stdout_text);
            if (err_index >= 0 && (fds[err_index].revents & (POLLIN | POLLHUP | POLLERR)))
                err_open = Drain(err_pipe.fds[0], result.stderr_text);
        }

        if (killed)
        {
            // Pick up whatever the child flushed before it died.
            int flags = fcntl(out_pipe.fds[0], F_GETFL);
            fcntl(out_pipe.fds[0], F_SETFL, flags | O_NONBLOCK);
            char buffer[4096];
            ssize_t got;
            while ((got = read(out_pipe.fds[0], buffer, sizeof(buffer))) > 0)
                result.stdout_text.append(buffer, static_cast<std::size_t>(got));
        }

        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        result.exit_code = DecodeStatus(status);
        return result;
    }
}
