#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace net_discovery::common
{
    inline constexpr int SNMP_PORT = 161;

    inline constexpr const char *OID_SYS_DESCR = "1.3.6.1.2.1.1.1.0";
    inline constexpr const char *OID_SYS_OBJECT_ID = "1.3.6.1.2.1.1.2.0";
    inline constexpr const char *OID_SYS_NAME = "1.3.6.1.2.1.1.5.0";

    enum class DeviceType
    {
        IoT,
        Windows,
        Linux,
        NetworkEquipment,
        Unknown
    };

    enum class ScanStatus
    {
        NotStarted,
        InProgress,
        Completed,
        Failed,
        Partial
    };

    enum class PhaseId
    {
        Arp,
        PortScan,
        Snmp
    };

    enum class ErrorCategory
    {
        Network,
        Permission,
        Configuration,
        Tool
    };

    struct NetworkInfo
    {
        std::string host_ip;
        std::string netmask;
        std::string network_address;
        std::string broadcast_address;
        std::string interface_name;
        int prefix_length = 0;
        std::vector<std::string> scan_range;
        std::vector<std::string> excluded_addresses;
    };

    using SnmpData = std::map<std::string, std::string>;

    struct DeviceRecord
    {
        std::string ip_address;
        std::optional<std::string> mac_address;
        std::optional<std::string> hostname;
        std::optional<std::string> os_info;
        DeviceType device_type = DeviceType::Unknown;
        std::optional<std::string> manufacturer;
        std::optional<std::string> model;
        std::set<int> open_ports;
        std::map<int, std::string> services;
        std::optional<SnmpData> snmp_data;
    };

    bool operator==(const DeviceRecord &lhs, const DeviceRecord &rhs);
    inline bool operator!=(const DeviceRecord &lhs, const DeviceRecord &rhs) { return !(lhs == rhs); }

    struct PhaseError
    {
        ErrorCategory category;
        std::optional<std::string> target;
        std::string message;
    };

    struct PhaseResult
    {
        PhaseId phase = PhaseId::Arp;
        ScanStatus status = ScanStatus::NotStarted;
        std::vector<DeviceRecord> observations;
        std::vector<PhaseError> errors;
        std::vector<std::string> log;
        std::string strategy_used;
        std::size_t targets_given = 0;
        std::chrono::milliseconds elapsed{0};

        bool HasErrorCategory(ErrorCategory category) const;
    };

    struct ScanStatistics
    {
        std::size_t total_addresses_scanned = 0;
        std::map<std::string, std::size_t> devices_found;
        std::map<std::string, std::size_t> device_types;
        std::map<std::string, double> scan_times;
        std::vector<std::string> errors_encountered;
    };

    // Device map is keyed by IP, ordered numerically by IpLess.
    struct IpLess
    {
        bool operator()(const std::string &lhs, const std::string &rhs) const;
    };

    using DeviceMap = std::map<std::string, DeviceRecord, IpLess>;

    struct CompleteScanResult
    {
        NetworkInfo network_info;
        DeviceMap devices;
        ScanStatistics statistics;
        ScanStatus status = ScanStatus::NotStarted;
        PhaseResult arp;
        PhaseResult port_scan;
        PhaseResult snmp;
        std::chrono::system_clock::time_point started_at;
        std::chrono::milliseconds duration{0};
        std::optional<std::string> abort_reason;
        bool cancelled = false;
    };

    std::string ToString(DeviceType type);
    std::string ToString(ScanStatus status);
    std::string ToString(PhaseId phase);
    std::string ToString(ErrorCategory category);

    std::string FormatPhaseError(const PhaseError &error);

    // Local time, "YYYY-MM-DDTHH:MM:SS".
    std::string FormatTimestamp(std::chrono::system_clock::time_point time);
}
