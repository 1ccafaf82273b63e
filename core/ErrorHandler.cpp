#include "ErrorHandler.hpp"
#include <iostream>

namespace net_discovery::core
{
    ErrorHandler::ErrorHandler(bool echo) : m_echo(echo) {}

    RecoveryAction ErrorHandler::Handle(const common::ScanError &error, const ErrorContext &context)
    {
        return Handle(error.Category(), error.what(), context);
    }

    RecoveryAction ErrorHandler::Handle(common::ErrorCategory category, const std::string &message,
                                        const ErrorContext &context)
    {
        RecoveryAction action = Decide(category, context);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_counts[category];
        }

        if (m_echo)
        {
            auto &out = (action == RecoveryAction::Retry) ? std::cout : std::cerr;
            out << "[ErrorHandler] " << common::ToString(context.phase) << " "
                << common::ToString(category);
            if (context.target)
                out << " " << *context.target;
            out << ": " << message << " -> " << ToString(action);
            if (action == RecoveryAction::Retry)
                out << " (" << context.attempt + 1 << "/" << context.max_retries << ")";
            out << "\n";
        }

        return action;
    }

    RecoveryAction ErrorHandler::Decide(common::ErrorCategory category, const ErrorContext &context)
    {
        switch (category)
        {
        case common::ErrorCategory::Network:
            return context.attempt < context.max_retries ? RecoveryAction::Retry : RecoveryAction::Skip;
        case common::ErrorCategory::Permission:
        case common::ErrorCategory::Tool:
            return context.fallback_available ? RecoveryAction::Fallback : RecoveryAction::Skip;
        case common::ErrorCategory::Configuration:
            return RecoveryAction::Abort;
        }
        return RecoveryAction::Abort;
    }

    std::size_t ErrorHandler::Count(common::ErrorCategory category) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_counts.find(category);
        return it == m_counts.end() ? 0 : it->second;
    }

    std::size_t ErrorHandler::TotalHandled() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::size_t total = 0;
        for (const auto &pair : m_counts)
            total += pair.second;
        return total;
    }

    std::string ToString(RecoveryAction action)
    {
        switch (action)
        {
        case RecoveryAction::Retry:
            return "RETRY";
        case RecoveryAction::Fallback:
            return "FALLBACK";
        case RecoveryAction::Skip:
            return "SKIP";
        case RecoveryAction::Abort:
            return "ABORT";
        }
        return "UNKNOWN";
    }
}
