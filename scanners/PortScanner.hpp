#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "ProcessExecutor.hpp"
#include "ScanCapability.hpp"

namespace net_discovery::scanners
{
    // Runs nmap over the whole target batch and reads its grepable output.
    class PortScanner : public ScanCapability
    {
    public:
        explicit PortScanner(std::shared_ptr<ProcessExecutor> executor,
                             std::function<bool()> is_root = IsRoot);

        common::PhaseId Phase() const override { return common::PhaseId::PortScan; }

        common::PhaseResult Scan(const std::vector<std::string> &targets,
                                 const common::DiscoveryConfig &config,
                                 core::ScanContext &context) override;

        static std::vector<std::string> BuildCommand(const common::PortScanConfig &config,
                                                     const std::string &executable,
                                                     const std::vector<std::string> &targets);

        static bool NeedsPrivilege(const common::PortScanConfig &config);

        // -sS becomes -sT; -sU and -O are dropped.
        static common::PortScanConfig Unprivileged(const common::PortScanConfig &config);

        // Hosts reported down are left out; Up hosts without open ports are kept.
        static std::vector<common::DeviceRecord> ParseGrepableOutput(const std::string &text);

        // Sorted IPs whose open ports include the SNMP port.
        static std::vector<std::string> SnmpCandidates(const common::PhaseResult &result);

    private:
        std::shared_ptr<ProcessExecutor> m_executor;
        std::function<bool()> m_is_root;
    };
}
