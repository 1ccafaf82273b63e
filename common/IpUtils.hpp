#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace net_discovery::common
{
    // Host byte order everywhere; inet_pton/ntop sit behind these helpers.
    std::optional<std::uint32_t> ParseIpv4(std::string_view text);
    std::string FormatIpv4(std::uint32_t address);
    bool IsValidIpv4(std::string_view text);

    std::uint32_t PrefixToNetmask(int prefix_length);
    std::optional<int> NetmaskToPrefix(std::uint32_t netmask);

    struct AddressRange
    {
        std::uint32_t first;
        std::uint32_t last;

        bool Contains(std::uint32_t address) const { return address >= first && address <= last; }
    };

    // Accepts "a.b.c.d", "a.b.c.d/nn" and "a.b.c.d-e.f.g.h".
    std::optional<AddressRange> ParseAddressRange(std::string_view text);

    bool IsValidOid(std::string_view oid);
    bool IsValidMac(std::string_view mac);
    std::string NormalizeMac(std::string_view mac);

    std::vector<std::string> SortByAddress(std::vector<std::string> addresses);
}
