#include "DeviceMerger.hpp"
#include "../common/IpUtils.hpp"

#include <algorithm>
#include <tuple>

namespace net_discovery::core
{
    namespace
    {
        void FillOnce(std::optional<std::string> &field, const std::optional<std::string> &value)
        {
            if (!field && value && !value->empty())
                field = value;
        }

        // Total order: address, then every field. Duplicate IPs within a phase merge the same in any order.
        bool ObservationLess(const common::DeviceRecord *a, const common::DeviceRecord *b)
        {
            common::IpLess ip_less;
            if (ip_less(a->ip_address, b->ip_address))
                return true;
            if (ip_less(b->ip_address, a->ip_address))
                return false;
            return std::tie(a->mac_address, a->hostname, a->os_info, a->manufacturer, a->model,
                            a->device_type, a->open_ports, a->services, a->snmp_data) <
                   std::tie(b->mac_address, b->hostname, b->os_info, b->manufacturer, b->model,
                            b->device_type, b->open_ports, b->services, b->snmp_data);
        }
    }

    common::DeviceMap DeviceMerger::Merge(const common::PhaseResult &arp,
                                          const common::PhaseResult &port_scan,
                                          const common::PhaseResult &snmp)
    {
        common::DeviceMap devices;
        MergePhase(devices, arp);
        MergePhase(devices, port_scan);
        MergePhase(devices, snmp);
        return devices;
    }

    void DeviceMerger::MergePhase(common::DeviceMap &devices, const common::PhaseResult &phase)
    {
        std::vector<const common::DeviceRecord *> ordered;
        ordered.reserve(phase.observations.size());
        for (const auto &record : phase.observations)
            ordered.push_back(&record);

        std::sort(ordered.begin(), ordered.end(), ObservationLess);

        for (const auto *record : ordered)
            MergeInto(devices, *record);
    }

    void DeviceMerger::MergeInto(common::DeviceMap &devices, const common::DeviceRecord &observation)
    {
        if (!common::IsValidIpv4(observation.ip_address))
            return;

        auto inserted = devices.try_emplace(observation.ip_address);
        common::DeviceRecord &device = inserted.first->second;
        device.ip_address = observation.ip_address;

        FillOnce(device.mac_address, observation.mac_address);
        FillOnce(device.hostname, observation.hostname);
        FillOnce(device.os_info, observation.os_info);
        FillOnce(device.manufacturer, observation.manufacturer);
        FillOnce(device.model, observation.model);

        if (device.device_type == common::DeviceType::Unknown)
            device.device_type = observation.device_type;

        device.open_ports.insert(observation.open_ports.begin(), observation.open_ports.end());
        for (const auto &service : observation.services)
            device.services.emplace(service.first, service.second);

        if (observation.snmp_data)
        {
            if (!device.snmp_data)
                device.snmp_data.emplace();
            for (const auto &entry : *observation.snmp_data)
                device.snmp_data->emplace(entry.first, entry.second);
        }
    }
}
