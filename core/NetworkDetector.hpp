#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "../common/ScanConfig.hpp"
#include "../common/Types.hpp"

namespace net_discovery::core
{
    struct InterfaceAddress
    {
        std::string name;
        std::string ip;
        std::string netmask;
        bool loopback = false;
    };

    class NetworkDetector
    {
    public:
        explicit NetworkDetector(common::NetworkConfig config);
        virtual ~NetworkDetector() = default;

        // Throws ConfigurationError when no usable interface or address exists.
        common::NetworkInfo Detect();

        // Console echo of the detected network and clamp warnings.
        void SetEcho(bool echo) { m_echo = echo; }

        static common::NetworkInfo BuildNetworkInfo(const std::string &host_ip,
                                                    const std::string &netmask,
                                                    const std::string &interface_name,
                                                    const std::vector<std::string> &exclusions,
                                                    std::size_t max_hosts,
                                                    bool echo = true);

    protected:
        // Reads the configured interface, or the default route interface when none is set.
        virtual InterfaceAddress ReadInterface();

        const common::NetworkConfig &Config() const { return m_config; }

    private:
        common::NetworkConfig m_config;
        bool m_echo = true;
    };
}
