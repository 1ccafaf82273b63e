#pragma once

#include <string>
#include <vector>
#include "../common/ScanConfig.hpp"
#include "../common/Types.hpp"
#include "../core/ScanContext.hpp"

namespace net_discovery::scanners
{
    // One discovery technique run against a batch of targets.
    // Per-target failures stay inside; only the PhaseResult comes back.
    class ScanCapability
    {
    public:
        virtual ~ScanCapability() = default;

        virtual common::PhaseId Phase() const = 0;

        virtual common::PhaseResult Scan(const std::vector<std::string> &targets,
                                         const common::DiscoveryConfig &config,
                                         core::ScanContext &context) = 0;
    };
}
