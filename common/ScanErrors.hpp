#pragma once

#include <stdexcept>
#include <string>
#include "Types.hpp"

namespace net_discovery::common
{
    class ScanError : public std::runtime_error
    {
    public:
        ScanError(ErrorCategory category, const std::string &message)
            : std::runtime_error(message), m_category(category) {}

        ErrorCategory Category() const { return m_category; }

    private:
        ErrorCategory m_category;
    };

    // Unreachable host, refused connection, socket failure.
    class NetworkError : public ScanError
    {
    public:
        explicit NetworkError(const std::string &message)
            : ScanError(ErrorCategory::Network, message) {}
    };

    // Raw sockets or privileged scan modes without root.
    class PermissionError : public ScanError
    {
    public:
        explicit PermissionError(const std::string &message)
            : ScanError(ErrorCategory::Permission, message) {}
    };

    class ConfigurationError : public ScanError
    {
    public:
        explicit ConfigurationError(const std::string &message)
            : ScanError(ErrorCategory::Configuration, message) {}
    };

    // Missing executable, or a non-zero exit that target-down does not explain.
    class ToolError : public ScanError
    {
    public:
        explicit ToolError(const std::string &message)
            : ScanError(ErrorCategory::Tool, message) {}
    };
}
