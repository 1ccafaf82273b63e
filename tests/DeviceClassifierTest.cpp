#include <gtest/gtest.h>
#include "../common/VendorCatalog.hpp"
#include "../core/DeviceClassifier.hpp"
#include "TestSupport.hpp"

using namespace net_discovery;
using common::DeviceType;
using core::DeviceClassifier;

namespace
{
    const std::string ENT_PHYSICAL_MODEL = "1.3.6.1.2.1.47.1.1.1.1.13.1";

    DeviceClassifier Classifier()
    {
        return DeviceClassifier(common::DefaultConfig().classifier);
    }

    common::DeviceRecord WithOs(const std::string &os)
    {
        auto record = test::Device("10.0.0.2");
        record.os_info = os;
        return record;
    }

    common::DeviceRecord WithPorts(std::set<int> ports)
    {
        auto record = test::Device("10.0.0.3");
        record.open_ports = std::move(ports);
        return record;
    }
}

TEST(DeviceClassifierTest, OperatingSystemSignatures)
{
    auto classifier = Classifier();
    EXPECT_EQ(classifier.Classify(WithOs("Microsoft Windows 10 1809 - 21H2")), DeviceType::Windows);
    EXPECT_EQ(classifier.Classify(WithOs("Linux 5.0 - 5.4")), DeviceType::Linux);
    EXPECT_EQ(classifier.Classify(WithOs("UBUNTU 22.04")), DeviceType::Linux);
}

TEST(DeviceClassifierTest, OsBeatsPorts)
{
    auto record = WithOs("Windows Server 2019");
    record.open_ports = {1883, 161};
    record.snmp_data = common::SnmpData{{common::OID_SYS_DESCR, "Hardware: x86"}};

    EXPECT_EQ(Classifier().Classify(record), DeviceType::Windows);
}

TEST(DeviceClassifierTest, IotPorts)
{
    EXPECT_EQ(Classifier().Classify(WithPorts({1883})), DeviceType::IoT);
    EXPECT_EQ(Classifier().Classify(WithPorts({22, 502})), DeviceType::IoT);
}

TEST(DeviceClassifierTest, NetworkEquipmentNeedsSystemData)
{
    auto classifier = Classifier();

    auto bare = WithPorts({22, 161});
    EXPECT_EQ(classifier.Classify(bare), DeviceType::Unknown);

    auto described = bare;
    described.snmp_data = common::SnmpData{{common::OID_SYS_DESCR, "ProCurve J9773A Switch 2530-24G-PoEP"}};
    EXPECT_EQ(classifier.Classify(described), DeviceType::NetworkEquipment);

    auto identified = WithPorts({443});
    identified.snmp_data = common::SnmpData{{common::OID_SYS_OBJECT_ID, "1.3.6.1.4.1.9.1.1208"}};
    EXPECT_EQ(classifier.Classify(identified), DeviceType::NetworkEquipment);

    auto vendor_only = WithPorts({80});
    vendor_only.manufacturer = "Ubiquiti";
    EXPECT_EQ(classifier.Classify(vendor_only), DeviceType::NetworkEquipment);

    auto snmp_but_no_port = test::Device("10.0.0.9");
    snmp_but_no_port.snmp_data = common::SnmpData{{common::OID_SYS_DESCR, "Cisco IOS"}};
    EXPECT_EQ(classifier.Classify(snmp_but_no_port), DeviceType::Unknown);
}

TEST(DeviceClassifierTest, UnmatchedOsFallsThroughToPorts)
{
    auto record = WithOs("Cisco IOS 15.2");
    record.open_ports = {23};
    record.manufacturer = "Cisco";

    EXPECT_EQ(Classifier().Classify(record), DeviceType::NetworkEquipment);
    EXPECT_EQ(Classifier().Classify(test::Device("10.0.0.4")), DeviceType::Unknown);
}

TEST(DeviceClassifierTest, ClassifyAllIdentifiesEquipment)
{
    auto sw = WithPorts({22, 161});
    sw.ip_address = "10.0.0.1";
    sw.snmp_data = common::SnmpData{
        {common::OID_SYS_DESCR, "Cisco IOS Software, C2960X Software (C2960X-UNIVERSALK9-M), Version 15.2(2)E7"},
        {ENT_PHYSICAL_MODEL, "WS-C2960X-48FPD-L"}};
    auto iot = WithPorts({1883});

    common::DeviceMap devices;
    devices[sw.ip_address] = sw;
    devices[iot.ip_address] = iot;

    Classifier().ClassifyAll(devices);

    const auto &classified = devices.at("10.0.0.1");
    EXPECT_EQ(classified.device_type, DeviceType::NetworkEquipment);
    EXPECT_EQ(classified.manufacturer, std::optional<std::string>("Cisco"));
    EXPECT_EQ(classified.model, std::optional<std::string>("WS-C2960X-48FPD-L"));

    EXPECT_EQ(devices.at("10.0.0.3").device_type, DeviceType::IoT);
    EXPECT_FALSE(devices.at("10.0.0.3").manufacturer.has_value());
}

TEST(EquipmentIdentityTest, VendorAndModelFromSysDescr)
{
    auto juniper = DeviceClassifier::IdentifyNetworkEquipment(
        {{common::OID_SYS_DESCR, "Juniper Networks, Inc. ex2300-c-12p Ethernet Switch, kernel JUNOS 18.2R3"}});
    EXPECT_EQ(juniper.manufacturer, std::optional<std::string>("Juniper"));
    EXPECT_EQ(juniper.model, std::optional<std::string>("EX2300-C-12P"));

    auto mikrotik = DeviceClassifier::IdentifyNetworkEquipment({{common::OID_SYS_DESCR, "RouterOS CCR1009-7G-1C-1S+"}});
    EXPECT_EQ(mikrotik.manufacturer, std::optional<std::string>("MikroTik"));
    EXPECT_EQ(mikrotik.model, std::optional<std::string>("CCR1009-7G-1C-1S"));
}

TEST(EquipmentIdentityTest, EnterpriseNumberWhenDescriptionIsSilent)
{
    auto fortinet = DeviceClassifier::IdentifyNetworkEquipment(
        {{common::OID_SYS_DESCR, "Firewall appliance"}, {common::OID_SYS_OBJECT_ID, "1.3.6.1.4.1.12356.101.1.1"}});
    EXPECT_EQ(fortinet.manufacturer, std::optional<std::string>("Fortinet"));
    EXPECT_FALSE(fortinet.model.has_value());

    auto hp = DeviceClassifier::IdentifyNetworkEquipment(
        {{common::OID_SYS_OBJECT_ID, "1.3.6.1.4.1.11.2.3.7.11.160"}, {ENT_PHYSICAL_MODEL, "J9773A"}});
    EXPECT_EQ(hp.manufacturer, std::optional<std::string>("HP"));
    EXPECT_EQ(hp.model, std::optional<std::string>("J9773A"));
}

TEST(EquipmentIdentityTest, UnknownVendor)
{
    auto identity = DeviceClassifier::IdentifyNetworkEquipment(
        {{common::OID_SYS_DESCR, "Linux nas 5.10.0"}, {common::OID_SYS_OBJECT_ID, "1.3.6.1.4.1.8072.3.2.10"}});
    EXPECT_FALSE(identity.manufacturer.has_value());
    EXPECT_FALSE(identity.model.has_value());
}

TEST(VendorCatalogTest, EnterpriseNumbers)
{
    EXPECT_EQ(common::EnterpriseNumber("1.3.6.1.4.1.9.1.1208"), 9);
    EXPECT_EQ(common::EnterpriseNumber(".1.3.6.1.4.1.41112.1.6"), 41112);
    EXPECT_FALSE(common::EnterpriseNumber("1.3.6.1.2.1.1").has_value());
    EXPECT_FALSE(common::EnterpriseNumber("1.3.6.1.4.1.").has_value());
}

TEST(VendorCatalogTest, KeywordsMatchAtWordStarts)
{
    ASSERT_NE(common::VendorByDescription("HP ProCurve Switch"), nullptr);
    EXPECT_EQ(common::VendorByDescription("HP ProCurve Switch")->name, "HP");
    // "php" must not read as HP.
    EXPECT_EQ(common::VendorByDescription("php-fpm host"), nullptr);
}
