#pragma once

#include <optional>
#include <string>
#include <vector>

namespace net_discovery::common
{
    struct VendorEntry
    {
        std::string name;
        int enterprise_number;
        std::vector<std::string> keywords; // matched at word starts in sysDescr
        std::vector<std::string> model_prefixes;
    };

    const std::vector<VendorEntry> &NetworkVendors();

    // "1.3.6.1.4.1.9.1.1208" -> 9
    std::optional<int> EnterpriseNumber(const std::string &sys_object_id);

    const VendorEntry *VendorByEnterprise(int enterprise_number);
    const VendorEntry *VendorByDescription(const std::string &sys_descr);

    // First model prefix of the vendor found in text, extended to the whole token, upper-cased.
    std::optional<std::string> FindModel(const VendorEntry &vendor, const std::string &text);
}
