#include "VendorCatalog.hpp"

#include <algorithm>
#include <cctype>

namespace net_discovery::common
{
    namespace
    {
        std::string Lower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        bool IsWordChar(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) != 0;
        }

        // Position of needle in haystack where it starts a word, or npos.
        std::size_t FindAtWordStart(const std::string &haystack, const std::string &needle)
        {
            std::size_t pos = haystack.find(needle);
            while (pos != std::string::npos)
            {
                if (pos == 0 || !IsWordChar(haystack[pos - 1]))
                    return pos;
                pos = haystack.find(needle, pos + 1);
            }
            return std::string::npos;
        }
    }

    const std::vector<VendorEntry> &NetworkVendors()
    {
        static const std::vector<VendorEntry> vendors = {
            {"Cisco", 9, {"cisco", "catalyst", "nexus"}, {"catalyst", "nexus", "asr", "isr", "c9300", "c9200", "c3850", "ws-c"}},
            {"Juniper", 2636, {"juniper", "junos"}, {"srx", "mx", "ex", "qfx", "acx", "ptx"}},
            {"HP", 11, {"hp", "hewlett", "procurve", "aruba"}, {"procurve", "aruba", "2530", "2540", "2930", "3810"}},
            {"Dell", 674, {"dell", "force10", "powerconnect"}, {"powerconnect", "force10", "n1500", "n2000", "n3000", "n4000"}},
            {"Netgear", 4526, {"netgear", "prosafe"}, {"prosafe", "gs", "fs", "xs"}},
            {"Ubiquiti", 41112, {"ubiquiti", "unifi", "edgemax", "edgeos", "airmax"}, {"unifi", "edgemax", "airmax", "dream", "cloudkey"}},
            {"MikroTik", 14988, {"mikrotik", "routeros", "routerboard"}, {"routerboard", "ccr", "crs", "hap", "hex"}},
            {"Fortinet", 12356, {"fortinet", "fortigate", "fortios"}, {"fortigate", "fortiswitch", "fortiap", "fortiwifi"}},
        };
        return vendors;
    }

    std::optional<int> EnterpriseNumber(const std::string &sys_object_id)
    {
        static const std::string prefix = "1.3.6.1.4.1.";

        std::string oid = sys_object_id;
        if (!oid.empty() && oid.front() == '.')
            oid.erase(0, 1);
        if (oid.compare(0, prefix.size(), prefix) != 0)
            return std::nullopt;

        std::size_t start = prefix.size();
        std::size_t end = oid.find('.', start);
        std::string arc = oid.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (arc.empty() || arc.size() > 9 ||
            !std::all_of(arc.begin(), arc.end(), [](char c)
                         { return std::isdigit(static_cast<unsigned char>(c)); }))
            return std::nullopt;
        return std::stoi(arc);
    }

    const VendorEntry *VendorByEnterprise(int enterprise_number)
    {
        for (const auto &vendor : NetworkVendors())
        {
            if (vendor.enterprise_number == enterprise_number)
                return &vendor;
        }
        return nullptr;
    }

    const VendorEntry *VendorByDescription(const std::string &sys_descr)
    {
        std::string text = Lower(sys_descr);
        for (const auto &vendor : NetworkVendors())
        {
            for (const auto &keyword : vendor.keywords)
            {
                if (FindAtWordStart(text, keyword) != std::string::npos)
                    return &vendor;
            }
        }
        return nullptr;
    }

    std::optional<std::string> FindModel(const VendorEntry &vendor, const std::string &text)
    {
        std::string lowered = Lower(text);
        for (const auto &prefix : vendor.model_prefixes)
        {
            std::size_t pos = FindAtWordStart(lowered, prefix);
            if (pos == std::string::npos)
                continue;

            std::size_t end = pos + prefix.size();
            while (end < lowered.size() && (IsWordChar(lowered[end]) || lowered[end] == '-'))
                ++end;

            std::string model = lowered.substr(pos, end - pos);
            std::transform(model.begin(), model.end(), model.begin(), [](unsigned char c)
                           { return static_cast<char>(std::toupper(c)); });
            return model;
        }
        return std::nullopt;
    }
}
