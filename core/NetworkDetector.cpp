#include "NetworkDetector.hpp"
#include "../common/IpUtils.hpp"
#include "../common/ScanErrors.hpp"

#include <tins/tins.h>
#include <iostream>

namespace net_discovery::core
{
    namespace
    {
        constexpr int CLAMP_PREFIX = 24;

        bool IsLoopback(std::uint32_t address)
        {
            return (address >> 24) == 127;
        }
    }

    NetworkDetector::NetworkDetector(common::NetworkConfig config) : m_config(std::move(config)) {}

    common::NetworkInfo NetworkDetector::Detect()
    {
        InterfaceAddress iface = ReadInterface();

        if (iface.loopback)
            throw common::ConfigurationError("Interface " + iface.name + " is a loopback interface");

        common::NetworkInfo info = BuildNetworkInfo(iface.ip, iface.netmask, iface.name,
                                                    m_config.exclude, m_config.max_hosts, m_echo);

        if (m_echo)
            std::cout << "[NetworkDetector] " << info.interface_name << " " << info.host_ip << "/"
                      << info.prefix_length << ", " << info.scan_range.size() << " targets\n";
        return info;
    }

    InterfaceAddress NetworkDetector::ReadInterface()
    {
        try
        {
            Tins::NetworkInterface iface = m_config.interface_name.empty()
                                               ? Tins::NetworkInterface::default_interface()
                                               : Tins::NetworkInterface(m_config.interface_name);
            Tins::NetworkInterface::Info info = iface.info();

            InterfaceAddress out;
            out.name = iface.name();
            out.ip = info.ip_addr.to_string();
            out.netmask = info.netmask.to_string();
            out.loopback = iface.is_loopback();
            return out;
        }
        catch (const std::exception &e)
        {
            std::string which = m_config.interface_name.empty() ? "default interface" : m_config.interface_name;
            throw common::ConfigurationError("Cannot read " + which + ": " + e.what());
        }
    }

    common::NetworkInfo NetworkDetector::BuildNetworkInfo(const std::string &host_ip,
                                                          const std::string &netmask,
                                                          const std::string &interface_name,
                                                          const std::vector<std::string> &exclusions,
                                                          std::size_t max_hosts,
                                                          bool echo)
    {
        auto host = common::ParseIpv4(host_ip);
        if (!host)
            throw common::ConfigurationError("Invalid host address '" + host_ip + "'");
        if (*host == 0)
            throw common::ConfigurationError("Interface " + interface_name + " has no IPv4 address");
        if (IsLoopback(*host))
            throw common::ConfigurationError("Host address " + host_ip + " is a loopback address");

        auto mask = common::ParseIpv4(netmask);
        if (!mask)
            throw common::ConfigurationError("Invalid netmask '" + netmask + "'");
        auto prefix = common::NetmaskToPrefix(*mask);
        if (!prefix)
            throw common::ConfigurationError("Netmask " + netmask + " is not contiguous");
        if (*prefix >= 31)
            throw common::ConfigurationError("Network " + host_ip + "/" + std::to_string(*prefix) +
                                             " has no scannable hosts");

        std::vector<common::AddressRange> excluded_ranges;
        for (const auto &entry : exclusions)
        {
            auto range = common::ParseAddressRange(entry);
            if (!range)
                throw common::ConfigurationError("Invalid exclusion '" + entry + "'");
            excluded_ranges.push_back(*range);
        }

        int effective_prefix = *prefix;
        std::uint32_t effective_mask = *mask;
        std::uint32_t host_count = (~effective_mask) - 1;
        if (effective_prefix < CLAMP_PREFIX && host_count > max_hosts)
        {
            if (echo)
                std::cerr << "[NetworkDetector] WARN: /" << effective_prefix << " holds " << host_count
                          << " hosts (limit " << max_hosts << "), restricting scan to the host's /24\n";
            effective_prefix = CLAMP_PREFIX;
            effective_mask = common::PrefixToNetmask(CLAMP_PREFIX);
        }

        std::uint32_t network = *host & effective_mask;
        std::uint32_t broadcast = network | ~effective_mask;

        common::NetworkInfo info;
        info.host_ip = common::FormatIpv4(*host);
        info.netmask = common::FormatIpv4(effective_mask);
        info.network_address = common::FormatIpv4(network);
        info.broadcast_address = common::FormatIpv4(broadcast);
        info.interface_name = interface_name;
        info.prefix_length = effective_prefix;

        for (std::uint32_t address = network + 1; address < broadcast; ++address)
        {
            if (address == *host)
                continue;

            bool excluded = false;
            for (const auto &range : excluded_ranges)
            {
                if (range.Contains(address))
                {
                    excluded = true;
                    break;
                }
            }

            if (excluded)
                info.excluded_addresses.push_back(common::FormatIpv4(address));
            else
                info.scan_range.push_back(common::FormatIpv4(address));
        }

        return info;
    }
}
