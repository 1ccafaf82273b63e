#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace net_discovery::common
{
    enum class ArpMethod
    {
        Arping,
        Libtins,
        Ping
    };

    enum class SnmpVersion
    {
        V1,
        V2c
    };

    struct NetworkConfig
    {
        std::string interface_name;
        std::vector<std::string> exclude;
        std::size_t max_hosts = 1024;
    };

    struct ArpConfig
    {
        ArpMethod method = ArpMethod::Ping;
        int timeout_seconds = 2;
        int retries = 3;
        int workers = 10;
        int phase_timeout_seconds = 600;
    };

    struct PortScanConfig
    {
        std::string executable = "nmap";
        std::string fallback_executable;
        std::string scan_type = "-sS";
        std::string port_range = "-F";
        std::string timing = "-T4";
        bool os_detection = true;
        bool service_detection = true;
        std::vector<std::string> additional_flags;
        int timeout_seconds = 300;
        int workers = 50;
    };

    struct SnmpCredential
    {
        SnmpVersion version;
        std::string community;
    };

    struct SnmpOid
    {
        std::string oid;
        std::string name;
    };

    struct SnmpConfig
    {
        std::vector<SnmpCredential> credentials;
        int timeout_seconds = 5;
        int retries = 2;
        std::vector<SnmpOid> specific_oids;
        std::vector<std::string> walk_oids;
        std::size_t max_walk_oids = 100;
        int workers = 5;
        int phase_timeout_seconds = 600;
    };

    struct ClassifierConfig
    {
        std::vector<std::string> windows_signatures;
        std::vector<std::string> linux_signatures;
        std::set<int> iot_ports;
        std::set<int> network_ports;
    };

    struct OutputConfig
    {
        std::string report_dir = "results";
        std::string database_path;
    };

    struct DiscoveryConfig
    {
        NetworkConfig network;
        ArpConfig arp;
        PortScanConfig portscan;
        SnmpConfig snmp;
        ClassifierConfig classifier;
        OutputConfig output;
        bool skip_arp = false;

        // Throws ConfigurationError naming the first invalid setting.
        void Validate() const;
    };

    DiscoveryConfig DefaultConfig();

    DiscoveryConfig ParseConfigText(const std::string &text);
    DiscoveryConfig LoadConfigFile(const std::string &path);

    ArpMethod ParseArpMethod(const std::string &name);
    std::string ToString(ArpMethod method);

    SnmpVersion ParseSnmpVersion(const std::string &name);
    std::string ToString(SnmpVersion version);
}
