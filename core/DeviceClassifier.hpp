#pragma once

#include <optional>
#include <string>
#include "../common/ScanConfig.hpp"
#include "../common/Types.hpp"

namespace net_discovery::core
{
    struct EquipmentIdentity
    {
        std::optional<std::string> manufacturer;
        std::optional<std::string> model;
    };

    class DeviceClassifier
    {
    public:
        explicit DeviceClassifier(common::ClassifierConfig config);

        // First matching rule wins: Windows OS, Linux OS, IoT port,
        // management port with SNMP system data, otherwise Unknown.
        common::DeviceType Classify(const common::DeviceRecord &record) const;

        // Classifies every device once and identifies vendor/model of network equipment.
        void ClassifyAll(common::DeviceMap &devices) const;

        static EquipmentIdentity IdentifyNetworkEquipment(const common::SnmpData &snmp_data);

    private:
        static bool ContainsAny(const std::string &text, const std::vector<std::string> &signatures);
        static bool HasSystemData(const common::DeviceRecord &record);

        common::ClassifierConfig m_config;
    };
}
