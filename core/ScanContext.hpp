#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "../common/Types.hpp"
#include "ErrorHandler.hpp"

namespace net_discovery::core
{
    using CancelFlag = std::shared_ptr<std::atomic<bool>>;

    // Tagged console log for one phase; lines are kept for PhaseResult::log.
    class ScanLog
    {
    public:
        explicit ScanLog(std::string tag, bool echo = true);

        void Info(const std::string &message);
        void Warn(const std::string &message);
        void Error(const std::string &message);

        std::vector<std::string> Lines() const;

    private:
        void Write(const char *level, const std::string &message, bool to_stderr);

        std::string m_tag;
        bool m_echo;
        mutable std::mutex m_mutex;
        std::vector<std::string> m_lines;
    };

    class ScanContext
    {
    public:
        ScanContext(common::PhaseId phase, CancelFlag cancel, ErrorHandler &errors,
                    std::chrono::milliseconds budget, bool echo = true);

        common::PhaseId Phase() const { return m_phase; }

        bool IsCancelled() const { return m_cancel && m_cancel->load(); }
        bool DeadlineExpired() const { return std::chrono::steady_clock::now() >= m_deadline; }
        bool ShouldStop() const { return IsCancelled() || DeadlineExpired(); }

        std::chrono::milliseconds Remaining() const;
        std::chrono::milliseconds Elapsed() const;

        // Caps a per-operation timeout by what is left of the phase budget.
        std::chrono::milliseconds Bounded(std::chrono::milliseconds timeout) const;

        const CancelFlag &Cancel() const { return m_cancel; }
        ErrorHandler &Errors() { return m_errors; }
        ScanLog &Log() { return m_log; }

    private:
        common::PhaseId m_phase;
        CancelFlag m_cancel;
        ErrorHandler &m_errors;
        std::chrono::steady_clock::time_point m_started;
        std::chrono::steady_clock::time_point m_deadline;
        ScanLog m_log;
    };

    std::string PhaseTag(common::PhaseId phase);
}
