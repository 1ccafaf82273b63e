#include "ScanConfig.hpp"
#include "IpUtils.hpp"
#include "ScanErrors.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace net_discovery::common
{
    namespace
    {
        using json = nlohmann::json;

        template <typename T>
        void ReadIfPresent(const json &section, const char *key, T &out)
        {
            if (section.contains(key) && !section.at(key).is_null())
                out = section.at(key).get<T>();
        }

        void ParseNetwork(const json &j, NetworkConfig &cfg)
        {
            ReadIfPresent(j, "interface", cfg.interface_name);
            ReadIfPresent(j, "exclude", cfg.exclude);
            ReadIfPresent(j, "max_hosts", cfg.max_hosts);
        }

        void ParseArp(const json &j, ArpConfig &cfg)
        {
            if (j.contains("method"))
                cfg.method = ParseArpMethod(j.at("method").get<std::string>());
            ReadIfPresent(j, "timeout", cfg.timeout_seconds);
            ReadIfPresent(j, "retries", cfg.retries);
            ReadIfPresent(j, "workers", cfg.workers);
            ReadIfPresent(j, "parallel_threads", cfg.workers);
            ReadIfPresent(j, "phase_timeout", cfg.phase_timeout_seconds);
        }

        void ParsePortScan(const json &j, PortScanConfig &cfg)
        {
            ReadIfPresent(j, "executable", cfg.executable);
            ReadIfPresent(j, "fallback_executable", cfg.fallback_executable);
            ReadIfPresent(j, "scan_type", cfg.scan_type);
            ReadIfPresent(j, "port_range", cfg.port_range);
            ReadIfPresent(j, "timing", cfg.timing);
            ReadIfPresent(j, "os_detection", cfg.os_detection);
            ReadIfPresent(j, "service_detection", cfg.service_detection);
            ReadIfPresent(j, "additional_flags", cfg.additional_flags);
            ReadIfPresent(j, "timeout", cfg.timeout_seconds);
            ReadIfPresent(j, "workers", cfg.workers);
            ReadIfPresent(j, "max_parallel", cfg.workers);
        }

        SnmpVersion VersionFromJson(const json &value)
        {
            if (value.is_number_integer())
                return ParseSnmpVersion(std::to_string(value.get<int>()));
            return ParseSnmpVersion(value.get<std::string>());
        }

        void ParseSnmp(const json &j, SnmpConfig &cfg)
        {
            if (j.contains("credentials"))
            {
                cfg.credentials.clear();
                for (const auto &entry : j.at("credentials"))
                {
                    cfg.credentials.push_back({VersionFromJson(entry.at("version")),
                                               entry.at("community").get<std::string>()});
                }
            }
            else if (j.contains("versions") || j.contains("communities"))
            {
                std::vector<SnmpVersion> versions;
                if (j.contains("versions"))
                {
                    for (const auto &v : j.at("versions"))
                        versions.push_back(VersionFromJson(v));
                }
                else
                {
                    versions = {SnmpVersion::V1, SnmpVersion::V2c};
                }

                std::vector<std::string> communities = {"public", "private", "admin"};
                ReadIfPresent(j, "communities", communities);

                // Version-major order, as the credential pairs are tried.
                cfg.credentials.clear();
                for (auto version : versions)
                {
                    for (const auto &community : communities)
                        cfg.credentials.push_back({version, community});
                }
            }

            ReadIfPresent(j, "timeout", cfg.timeout_seconds);
            ReadIfPresent(j, "retries", cfg.retries);
            ReadIfPresent(j, "walk_oids", cfg.walk_oids);
            ReadIfPresent(j, "max_walk_oids", cfg.max_walk_oids);
            ReadIfPresent(j, "workers", cfg.workers);
            ReadIfPresent(j, "phase_timeout", cfg.phase_timeout_seconds);

            if (j.contains("specific_oids"))
            {
                cfg.specific_oids.clear();
                for (const auto &entry : j.at("specific_oids"))
                {
                    if (entry.is_string())
                    {
                        cfg.specific_oids.push_back({entry.get<std::string>(), ""});
                        continue;
                    }
                    SnmpOid oid{entry.at("oid").get<std::string>(), ""};
                    ReadIfPresent(entry, "name", oid.name);
                    cfg.specific_oids.push_back(oid);
                }
            }
        }

        void ParseClassifier(const json &j, ClassifierConfig &cfg)
        {
            ReadIfPresent(j, "windows_signatures", cfg.windows_signatures);
            ReadIfPresent(j, "linux_signatures", cfg.linux_signatures);
            ReadIfPresent(j, "iot_ports", cfg.iot_ports);
            ReadIfPresent(j, "network_ports", cfg.network_ports);
        }

        void ParseOutput(const json &j, OutputConfig &cfg)
        {
            ReadIfPresent(j, "report_dir", cfg.report_dir);
            ReadIfPresent(j, "database", cfg.database_path);
        }

        void RequirePositive(int value, const std::string &name)
        {
            if (value <= 0)
                throw ConfigurationError(name + " must be positive, got " + std::to_string(value));
        }

        bool IsPort(int port)
        {
            return port > 0 && port <= 65535;
        }
    }

    DiscoveryConfig DefaultConfig()
    {
        DiscoveryConfig cfg;

        for (auto version : {SnmpVersion::V1, SnmpVersion::V2c})
        {
            for (const char *community : {"public", "private", "admin"})
                cfg.snmp.credentials.push_back({version, community});
        }

        cfg.snmp.specific_oids = {
            {"1.3.6.1.2.1.1.1.0", "sysDescr"},
            {"1.3.6.1.2.1.1.2.0", "sysObjectID"},
            {"1.3.6.1.2.1.1.3.0", "sysUpTime"},
            {"1.3.6.1.2.1.1.4.0", "sysContact"},
            {"1.3.6.1.2.1.1.5.0", "sysName"},
            {"1.3.6.1.2.1.1.6.0", "sysLocation"},
        };
        cfg.snmp.walk_oids = {"1.3.6.1.2.1.1", "1.3.6.1.2.1.2", "1.3.6.1.2.1.4"};

        cfg.classifier.windows_signatures = {"windows", "microsoft"};
        cfg.classifier.linux_signatures = {"linux", "ubuntu", "debian", "centos", "red hat", "redhat", "fedora", "suse"};
        cfg.classifier.iot_ports = {1883, 8883, 5683, 502, 102};
        cfg.classifier.network_ports = {22, 23, 80, 161, 443, 8080, 8443, 9999};

        return cfg;
    }

    void DiscoveryConfig::Validate() const
    {
        if (network.max_hosts == 0)
            throw ConfigurationError("network.max_hosts must be positive");
        for (const auto &entry : network.exclude)
        {
            if (!ParseAddressRange(entry))
                throw ConfigurationError("network.exclude entry is not an address, CIDR block or range: " + entry);
        }

        RequirePositive(arp.timeout_seconds, "arp.timeout");
        RequirePositive(arp.retries, "arp.retries");
        RequirePositive(arp.workers, "arp.workers");
        RequirePositive(arp.phase_timeout_seconds, "arp.phase_timeout");

        if (portscan.executable.empty())
            throw ConfigurationError("portscan.executable must not be empty");
        RequirePositive(portscan.timeout_seconds, "portscan.timeout");
        RequirePositive(portscan.workers, "portscan.workers");

        if (snmp.credentials.empty())
            throw ConfigurationError("snmp.credentials must list at least one version/community pair");
        for (const auto &cred : snmp.credentials)
        {
            if (cred.community.empty())
                throw ConfigurationError("snmp community strings must not be empty");
        }
        RequirePositive(snmp.timeout_seconds, "snmp.timeout");
        if (snmp.retries < 0)
            throw ConfigurationError("snmp.retries must not be negative");
        RequirePositive(snmp.workers, "snmp.workers");
        RequirePositive(snmp.phase_timeout_seconds, "snmp.phase_timeout");
        if (snmp.max_walk_oids == 0)
            throw ConfigurationError("snmp.max_walk_oids must be positive");
        for (const auto &oid : snmp.specific_oids)
        {
            if (!IsValidOid(oid.oid))
                throw ConfigurationError("snmp.specific_oids has a malformed OID: " + oid.oid);
        }
        for (const auto &oid : snmp.walk_oids)
        {
            if (!IsValidOid(oid))
                throw ConfigurationError("snmp.walk_oids has a malformed OID: " + oid);
        }

        for (int port : classifier.iot_ports)
        {
            if (!IsPort(port))
                throw ConfigurationError("classifier.iot_ports has an invalid port: " + std::to_string(port));
        }
        for (int port : classifier.network_ports)
        {
            if (!IsPort(port))
                throw ConfigurationError("classifier.network_ports has an invalid port: " + std::to_string(port));
        }
    }

    DiscoveryConfig ParseConfigText(const std::string &text)
    {
        DiscoveryConfig cfg = DefaultConfig();

        try
        {
            json j = json::parse(text);
            if (!j.is_object())
                throw ConfigurationError("configuration root must be a JSON object");

            if (j.contains("network"))
                ParseNetwork(j.at("network"), cfg.network);
            if (j.contains("arp"))
                ParseArp(j.at("arp"), cfg.arp);
            if (j.contains("portscan"))
                ParsePortScan(j.at("portscan"), cfg.portscan);
            else if (j.contains("nmap"))
                ParsePortScan(j.at("nmap"), cfg.portscan);
            if (j.contains("snmp"))
                ParseSnmp(j.at("snmp"), cfg.snmp);
            if (j.contains("classifier"))
                ParseClassifier(j.at("classifier"), cfg.classifier);
            if (j.contains("output"))
                ParseOutput(j.at("output"), cfg.output);
            ReadIfPresent(j, "skip_arp", cfg.skip_arp);
        }
        catch (const json::exception &e)
        {
            throw ConfigurationError(std::string("invalid configuration: ") + e.what());
        }

        cfg.Validate();
        return cfg;
    }

    DiscoveryConfig LoadConfigFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
            throw ConfigurationError("cannot open configuration file " + path);

        std::stringstream ss;
        ss << file.rdbuf();
        return ParseConfigText(ss.str());
    }

    ArpMethod ParseArpMethod(const std::string &name)
    {
        if (name == "arping")
            return ArpMethod::Arping;
        if (name == "libtins" || name == "probe")
            return ArpMethod::Libtins;
        if (name == "ping" || name == "icmp")
            return ArpMethod::Ping;
        throw ConfigurationError("unknown arp.method '" + name + "' (expected arping, libtins or ping)");
    }

    std::string ToString(ArpMethod method)
    {
        switch (method)
        {
        case ArpMethod::Arping:
            return "arping";
        case ArpMethod::Libtins:
            return "libtins";
        case ArpMethod::Ping:
            return "ping";
        }
        return "unknown";
    }

    SnmpVersion ParseSnmpVersion(const std::string &name)
    {
        if (name == "1" || name == "v1")
            return SnmpVersion::V1;
        if (name == "2" || name == "2c" || name == "v2c")
            return SnmpVersion::V2c;
        throw ConfigurationError("unsupported SNMP version '" + name + "' (expected 1 or 2c)");
    }

    std::string ToString(SnmpVersion version)
    {
        return version == SnmpVersion::V1 ? "v1" : "v2c";
    }
}
