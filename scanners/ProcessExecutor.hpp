#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace net_discovery::scanners
{
    struct ProcessResult
    {
        bool launched = false;
        int exit_code = -1;
        bool timed_out = false;
        bool cancelled = false;
        std::string stdout_text;
        std::string stderr_text;
        std::string launch_error;

        bool Succeeded() const { return launched && !timed_out && !cancelled && exit_code == 0; }
    };

    class ProcessExecutor
    {
    public:
        virtual ~ProcessExecutor() = default;

        // argv[0] is looked up in PATH. Output captured before a timeout or
        // cancellation is still returned.
        virtual ProcessResult Execute(const std::vector<std::string> &argv,
                                      std::chrono::milliseconds timeout,
                                      const std::atomic<bool> *cancel) = 0;

        virtual bool IsAvailable(const std::string &executable) const = 0;
    };

    class SubprocessExecutor : public ProcessExecutor
    {
    public:
        ProcessResult Execute(const std::vector<std::string> &argv,
                              std::chrono::milliseconds timeout,
                              const std::atomic<bool> *cancel) override;

        bool IsAvailable(const std::string &executable) const override;
    };

    bool IsRoot();
}
