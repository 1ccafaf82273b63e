#include "IpUtils.hpp"
#include "Types.hpp"

#include <arpa/inet.h>
#include <algorithm>
#include <cctype>

namespace net_discovery::common
{
    std::optional<std::uint32_t> ParseIpv4(std::string_view text)
    {
        if (text.empty() || text.size() > 15)
            return std::nullopt;

        std::string buf(text);
        in_addr addr{};
        if (inet_pton(AF_INET, buf.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string FormatIpv4(std::uint32_t address)
    {
        in_addr addr{};
        addr.s_addr = htonl(address);
        char out[INET_ADDRSTRLEN];
        if (!inet_ntop(AF_INET, &addr, out, sizeof(out)))
            return "";
        return out;
    }

    bool IsValidIpv4(std::string_view text)
    {
        return ParseIpv4(text).has_value();
    }

    std::uint32_t PrefixToNetmask(int prefix_length)
    {
        if (prefix_length <= 0)
            return 0;
        if (prefix_length >= 32)
            return 0xFFFFFFFFu;
        return 0xFFFFFFFFu << (32 - prefix_length);
    }

    std::optional<int> NetmaskToPrefix(std::uint32_t netmask)
    {
        int prefix = 0;
        std::uint32_t probe = 0x80000000u;
        while (probe && (netmask & probe))
        {
            ++prefix;
            probe >>= 1;
        }
        if (PrefixToNetmask(prefix) != netmask)
            return std::nullopt;
        return prefix;
    }

    std::optional<AddressRange> ParseAddressRange(std::string_view text)
    {
        auto slash = text.find('/');
        if (slash != std::string_view::npos)
        {
            auto base = ParseIpv4(text.substr(0, slash));
            std::string_view bits = text.substr(slash + 1);
            if (!base || bits.empty() || bits.size() > 2 ||
                !std::all_of(bits.begin(), bits.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); }))
                return std::nullopt;

            int prefix = std::stoi(std::string(bits));
            if (prefix > 32)
                return std::nullopt;

            std::uint32_t mask = PrefixToNetmask(prefix);
            std::uint32_t network = *base & mask;
            return AddressRange{network, network | ~mask};
        }

        auto dash = text.find('-');
        if (dash != std::string_view::npos)
        {
            auto first = ParseIpv4(text.substr(0, dash));
            auto last = ParseIpv4(text.substr(dash + 1));
            if (!first || !last || *first > *last)
                return std::nullopt;
            return AddressRange{*first, *last};
        }

        auto single = ParseIpv4(text);
        if (!single)
            return std::nullopt;
        return AddressRange{*single, *single};
    }

    bool IsValidOid(std::string_view oid)
    {
        if (oid.empty() || oid.front() == '.' || oid.back() == '.')
            return false;

        int arcs = 1;
        char prev = '\0';
        for (char c : oid)
        {
            if (c == '.')
            {
                if (prev == '.')
                    return false;
                ++arcs;
            }
            else if (!std::isdigit(static_cast<unsigned char>(c)))
            {
                return false;
            }
            prev = c;
        }
        return arcs >= 2;
    }

    bool IsValidMac(std::string_view mac)
    {
        if (mac.size() != 17)
            return false;
        for (std::size_t i = 0; i < mac.size(); ++i)
        {
            if (i % 3 == 2)
            {
                if (mac[i] != ':' && mac[i] != '-')
                    return false;
            }
            else if (!std::isxdigit(static_cast<unsigned char>(mac[i])))
            {
                return false;
            }
        }
        return true;
    }

    std::string NormalizeMac(std::string_view mac)
    {
        std::string out(mac);
        for (auto &c : out)
        {
            if (c == '-')
                c = ':';
            else
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }

    std::vector<std::string> SortByAddress(std::vector<std::string> addresses)
    {
        std::sort(addresses.begin(), addresses.end(), IpLess{});
        return addresses;
    }
}
