#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "../common/ScanErrors.hpp"
#include "../common/Types.hpp"

namespace net_discovery::core
{
    enum class RecoveryAction
    {
        Retry,
        Fallback,
        Skip,
        Abort
    };

    struct ErrorContext
    {
        common::PhaseId phase = common::PhaseId::Arp;
        std::optional<std::string> target;
        int attempt = 0;      // retries already spent on this operation
        int max_retries = 0;
        bool fallback_available = false;
    };

    // NETWORK -> RETRY until max_retries, then SKIP the target.
    // PERMISSION -> FALLBACK when a less privileged variant exists, else SKIP.
    // CONFIGURATION -> ABORT.
    // TOOL -> FALLBACK when an alternate is configured, else SKIP (caller fails the phase).
    class ErrorHandler
    {
    public:
        explicit ErrorHandler(bool echo = true);

        RecoveryAction Handle(const common::ScanError &error, const ErrorContext &context);
        RecoveryAction Handle(common::ErrorCategory category, const std::string &message, const ErrorContext &context);

        std::size_t Count(common::ErrorCategory category) const;
        std::size_t TotalHandled() const;

    private:
        static RecoveryAction Decide(common::ErrorCategory category, const ErrorContext &context);

        bool m_echo;
        mutable std::mutex m_mutex;
        std::map<common::ErrorCategory, std::size_t> m_counts;
    };

    std::string ToString(RecoveryAction action);
}
