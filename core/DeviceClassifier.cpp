#include "DeviceClassifier.hpp"
#include "../common/VendorCatalog.hpp"

#include <algorithm>
#include <cctype>

namespace net_discovery::core
{
    namespace
    {
        const char *OID_ENT_PHYSICAL_MODEL = "1.3.6.1.2.1.47.1.1.1.1.13.1";

        std::string Lower(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        bool Intersects(const std::set<int> &ports, const std::set<int> &wanted)
        {
            for (int port : ports)
            {
                if (wanted.count(port))
                    return true;
            }
            return false;
        }

        std::string Lookup(const common::SnmpData &data, const std::string &oid)
        {
            auto it = data.find(oid);
            return it == data.end() ? std::string() : it->second;
        }
    }

    DeviceClassifier::DeviceClassifier(common::ClassifierConfig config) : m_config(std::move(config)) {}

    bool DeviceClassifier::ContainsAny(const std::string &text, const std::vector<std::string> &signatures)
    {
        std::string lowered = Lower(text);
        for (const auto &signature : signatures)
        {
            if (!signature.empty() && lowered.find(Lower(signature)) != std::string::npos)
                return true;
        }
        return false;
    }

    bool DeviceClassifier::HasSystemData(const common::DeviceRecord &record)
    {
        if (record.manufacturer)
            return true;
        if (!record.snmp_data)
            return false;
        return record.snmp_data->count(common::OID_SYS_DESCR) > 0 ||
               record.snmp_data->count(common::OID_SYS_OBJECT_ID) > 0;
    }

    common::DeviceType DeviceClassifier::Classify(const common::DeviceRecord &record) const
    {
        if (record.os_info)
        {
            if (ContainsAny(*record.os_info, m_config.windows_signatures))
                return common::DeviceType::Windows;
            if (ContainsAny(*record.os_info, m_config.linux_signatures))
                return common::DeviceType::Linux;
        }

        if (Intersects(record.open_ports, m_config.iot_ports))
            return common::DeviceType::IoT;

        if (Intersects(record.open_ports, m_config.network_ports) && HasSystemData(record))
            return common::DeviceType::NetworkEquipment;

        return common::DeviceType::Unknown;
    }

    void DeviceClassifier::ClassifyAll(common::DeviceMap &devices) const
    {
        for (auto &pair : devices)
        {
            common::DeviceRecord &device = pair.second;
            device.device_type = Classify(device);

            if (device.device_type != common::DeviceType::NetworkEquipment || !device.snmp_data)
                continue;

            EquipmentIdentity identity = IdentifyNetworkEquipment(*device.snmp_data);
            if (!device.manufacturer)
                device.manufacturer = identity.manufacturer;
            if (!device.model)
                device.model = identity.model;
        }
    }

    EquipmentIdentity DeviceClassifier::IdentifyNetworkEquipment(const common::SnmpData &snmp_data)
    {
        EquipmentIdentity identity;

        const std::string sys_descr = Lookup(snmp_data, common::OID_SYS_DESCR);
        const std::string sys_object_id = Lookup(snmp_data, common::OID_SYS_OBJECT_ID);

        const common::VendorEntry *vendor = nullptr;
        if (!sys_descr.empty())
            vendor = common::VendorByDescription(sys_descr);
        if (!vendor && !sys_object_id.empty())
        {
            if (auto enterprise = common::EnterpriseNumber(sys_object_id))
                vendor = common::VendorByEnterprise(*enterprise);
        }
        if (!vendor)
            return identity;

        identity.manufacturer = vendor->name;

        for (const std::string &oid : {std::string(common::OID_SYS_DESCR), std::string(OID_ENT_PHYSICAL_MODEL),
                                       std::string(common::OID_SYS_NAME)})
        {
            std::string text = Lookup(snmp_data, oid);
            if (text.empty())
                continue;
            if (auto model = common::FindModel(*vendor, text))
            {
                identity.model = model;
                break;
            }
        }

        if (!identity.model)
        {
            std::string physical = Lookup(snmp_data, OID_ENT_PHYSICAL_MODEL);
            if (!physical.empty())
                identity.model = physical;
        }
        return identity;
    }
}
