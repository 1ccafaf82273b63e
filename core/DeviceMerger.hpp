#pragma once

#include "../common/Types.hpp"

namespace net_discovery::core
{
    // Scalars are set once (first writer wins); ports, services and SNMP
    // values are unioned. The result depends only on the set of observations.
    class DeviceMerger
    {
    public:
        static common::DeviceMap Merge(const common::PhaseResult &arp,
                                       const common::PhaseResult &port_scan,
                                       const common::PhaseResult &snmp);

        static void MergePhase(common::DeviceMap &devices, const common::PhaseResult &phase);
        static void MergeInto(common::DeviceMap &devices, const common::DeviceRecord &observation);
    };
}
