#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ScanCapability.hpp"
#include "SnmpClient.hpp"

namespace net_discovery::scanners
{
    class SnmpScanner : public ScanCapability
    {
    public:
        explicit SnmpScanner(std::shared_ptr<SnmpTransport> transport);

        common::PhaseId Phase() const override { return common::PhaseId::Snmp; }

        common::PhaseResult Scan(const std::vector<std::string> &targets,
                                 const common::DiscoveryConfig &config,
                                 core::ScanContext &context) override;

        // Fills hostname, OS string and manufacturer from the system group.
        static void Enrich(common::DeviceRecord &record);

    private:
        std::shared_ptr<SnmpTransport> m_transport;
    };
}
