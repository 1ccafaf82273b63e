#include "Types.hpp"
#include "IpUtils.hpp"

#include <ctime>

namespace net_discovery::common
{
    bool operator==(const DeviceRecord &lhs, const DeviceRecord &rhs)
    {
        return lhs.ip_address == rhs.ip_address &&
               lhs.mac_address == rhs.mac_address &&
               lhs.hostname == rhs.hostname &&
               lhs.os_info == rhs.os_info &&
               lhs.device_type == rhs.device_type &&
               lhs.manufacturer == rhs.manufacturer &&
               lhs.model == rhs.model &&
               lhs.open_ports == rhs.open_ports &&
               lhs.services == rhs.services &&
               lhs.snmp_data == rhs.snmp_data;
    }

    bool PhaseResult::HasErrorCategory(ErrorCategory category) const
    {
        for (const auto &error : errors)
        {
            if (error.category == category)
                return true;
        }
        return false;
    }

    bool IpLess::operator()(const std::string &lhs, const std::string &rhs) const
    {
        auto l = ParseIpv4(lhs);
        auto r = ParseIpv4(rhs);
        if (l && r)
            return *l < *r;
        // Unparseable keys sort after every valid address.
        if (l != r)
            return l.has_value();
        return lhs < rhs;
    }

    std::string ToString(DeviceType type)
    {
        switch (type)
        {
        case DeviceType::IoT:
            return "IoT";
        case DeviceType::Windows:
            return "Windows";
        case DeviceType::Linux:
            return "Linux";
        case DeviceType::NetworkEquipment:
            return "NetworkEquipment";
        case DeviceType::Unknown:
            break;
        }
        return "Unknown";
    }

    std::string ToString(ScanStatus status)
    {
        switch (status)
        {
        case ScanStatus::NotStarted:
            return "not_started";
        case ScanStatus::InProgress:
            return "in_progress";
        case ScanStatus::Completed:
            return "completed";
        case ScanStatus::Failed:
            return "failed";
        case ScanStatus::Partial:
            return "partial";
        }
        return "unknown";
    }

    std::string ToString(PhaseId phase)
    {
        switch (phase)
        {
        case PhaseId::Arp:
            return "arp";
        case PhaseId::PortScan:
            return "portscan";
        case PhaseId::Snmp:
            return "snmp";
        }
        return "unknown";
    }

    std::string ToString(ErrorCategory category)
    {
        switch (category)
        {
        case ErrorCategory::Network:
            return "NETWORK";
        case ErrorCategory::Permission:
            return "PERMISSION";
        case ErrorCategory::Configuration:
            return "CONFIGURATION";
        case ErrorCategory::Tool:
            return "TOOL";
        }
        return "UNKNOWN";
    }

    std::string FormatPhaseError(const PhaseError &error)
    {
        std::string text = "[" + ToString(error.category) + "] ";
        if (error.target)
            text += *error.target + ": ";
        return text + error.message;
    }

    std::string FormatTimestamp(std::chrono::system_clock::time_point time)
    {
        std::time_t raw = std::chrono::system_clock::to_time_t(time);
        std::tm local{};
        localtime_r(&raw, &local);

        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);
        return buffer;
    }
}
