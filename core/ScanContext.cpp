#include "ScanContext.hpp"
#include <algorithm>
#include <iostream>

namespace net_discovery::core
{
    ScanLog::ScanLog(std::string tag, bool echo) : m_tag(std::move(tag)), m_echo(echo) {}

    void ScanLog::Info(const std::string &message)
    {
        Write("INFO", message, false);
    }

    void ScanLog::Warn(const std::string &message)
    {
        Write("WARN", message, true);
    }

    void ScanLog::Error(const std::string &message)
    {
        Write("ERROR", message, true);
    }

    void ScanLog::Write(const char *level, const std::string &message, bool to_stderr)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_lines.push_back(std::string(level) + " " + message);

        if (!m_echo)
            return;
        if (to_stderr)
            std::cerr << "[" << m_tag << "] " << level << ": " << message << "\n";
        else
            std::cout << "[" << m_tag << "] " << message << "\n";
    }

    std::vector<std::string> ScanLog::Lines() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_lines;
    }

    ScanContext::ScanContext(common::PhaseId phase, CancelFlag cancel, ErrorHandler &errors,
                             std::chrono::milliseconds budget, bool echo)
        : m_phase(phase), m_cancel(std::move(cancel)), m_errors(errors),
          m_started(std::chrono::steady_clock::now()), m_deadline(m_started + budget),
          m_log(PhaseTag(phase), echo)
    {
    }

    std::chrono::milliseconds ScanContext::Remaining() const
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(m_deadline - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }

    std::chrono::milliseconds ScanContext::Elapsed() const
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - m_started);
    }

    std::chrono::milliseconds ScanContext::Bounded(std::chrono::milliseconds timeout) const
    {
        return std::min(timeout, Remaining());
    }

    std::string PhaseTag(common::PhaseId phase)
    {
        switch (phase)
        {
        case common::PhaseId::Arp:
            return "ARP";
        case common::PhaseId::PortScan:
            return "PortScan";
        case common::PhaseId::Snmp:
            return "SNMP";
        }
        return "Phase";
    }
}
