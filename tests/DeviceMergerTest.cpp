#include <gtest/gtest.h>
#include "../core/DeviceMerger.hpp"
#include "TestSupport.hpp"

using namespace net_discovery;
using common::PhaseId;
using common::ScanStatus;
using core::DeviceMerger;

namespace
{
    common::PhaseResult ArpPhase()
    {
        auto router = test::Device("192.168.1.1");
        router.mac_address = "aa:bb:cc:dd:ee:01";
        auto printer = test::Device("192.168.1.30");
        printer.mac_address = "aa:bb:cc:dd:ee:30";
        auto quiet = test::Device("192.168.1.5");
        quiet.mac_address = "aa:bb:cc:dd:ee:05";
        return test::Phase(PhaseId::Arp, ScanStatus::Completed, {printer, router, quiet});
    }

    common::PhaseResult PortPhase()
    {
        auto router = test::Device("192.168.1.1");
        router.hostname = "router.lan";
        router.open_ports = {22, 161};
        router.services = {{22, "ssh"}, {161, "snmp"}};
        auto printer = test::Device("192.168.1.30");
        printer.open_ports = {9100};
        printer.services = {{9100, "jetdirect"}};
        return test::Phase(PhaseId::PortScan, ScanStatus::Completed, {router, printer});
    }

    common::PhaseResult SnmpPhase()
    {
        auto router = test::Device("192.168.1.1");
        router.os_info = "Cisco IOS Software";
        router.manufacturer = "Cisco";
        router.snmp_data = common::SnmpData{{common::OID_SYS_DESCR, "Cisco IOS Software"}};
        return test::Phase(PhaseId::Snmp, ScanStatus::Completed, {router});
    }
}

TEST(DeviceMergerTest, CombinesEveryPhase)
{
    auto devices = DeviceMerger::Merge(ArpPhase(), PortPhase(), SnmpPhase());

    ASSERT_EQ(devices.size(), 3u);
    const auto &router = devices.at("192.168.1.1");
    EXPECT_EQ(router.mac_address, std::optional<std::string>("aa:bb:cc:dd:ee:01"));
    EXPECT_EQ(router.hostname, std::optional<std::string>("router.lan"));
    EXPECT_EQ(router.open_ports, (std::set<int>{22, 161}));
    EXPECT_EQ(router.manufacturer, std::optional<std::string>("Cisco"));
    ASSERT_TRUE(router.snmp_data.has_value());
    EXPECT_EQ(router.snmp_data->size(), 1u);
}

TEST(DeviceMergerTest, ArpOnlyDeviceIsKept)
{
    auto devices = DeviceMerger::Merge(ArpPhase(), PortPhase(), SnmpPhase());

    const auto &quiet = devices.at("192.168.1.5");
    EXPECT_EQ(quiet.mac_address, std::optional<std::string>("aa:bb:cc:dd:ee:05"));
    EXPECT_TRUE(quiet.open_ports.empty());
    EXPECT_FALSE(quiet.snmp_data.has_value());
    EXPECT_EQ(quiet.device_type, common::DeviceType::Unknown);
}

TEST(DeviceMergerTest, IteratesInAddressOrder)
{
    auto devices = DeviceMerger::Merge(ArpPhase(), PortPhase(), SnmpPhase());

    std::vector<std::string> order;
    for (const auto &pair : devices)
        order.push_back(pair.first);
    std::vector<std::string> expected = {"192.168.1.1", "192.168.1.5", "192.168.1.30"};
    EXPECT_EQ(order, expected);
}

TEST(DeviceMergerTest, MergingTwiceChangesNothing)
{
    common::DeviceMap once = DeviceMerger::Merge(ArpPhase(), PortPhase(), SnmpPhase());

    common::DeviceMap twice = once;
    DeviceMerger::MergePhase(twice, ArpPhase());
    DeviceMerger::MergePhase(twice, PortPhase());
    DeviceMerger::MergePhase(twice, SnmpPhase());

    EXPECT_EQ(once, twice);
}

TEST(DeviceMergerTest, OrderDoesNotMatterWithoutConflicts)
{
    auto forward = DeviceMerger::Merge(ArpPhase(), PortPhase(), SnmpPhase());
    auto backward = DeviceMerger::Merge(SnmpPhase(), PortPhase(), ArpPhase());

    EXPECT_EQ(forward, backward);
}

TEST(DeviceMergerTest, FirstWriterWinsOnConflicts)
{
    auto first = test::Device("10.0.0.7");
    first.hostname = "nmap-name";
    first.services = {{80, "http"}};
    first.snmp_data = common::SnmpData{{"1.3.6.1.2.1.1.5.0", "one"}};

    auto second = test::Device("10.0.0.7");
    second.hostname = "snmp-name";
    second.services = {{80, "http (nginx 1.18)"}, {443, "https"}};
    second.snmp_data = common::SnmpData{{"1.3.6.1.2.1.1.5.0", "two"}, {"1.3.6.1.2.1.1.6.0", "lab"}};

    common::DeviceMap devices;
    DeviceMerger::MergeInto(devices, first);
    DeviceMerger::MergeInto(devices, second);

    const auto &device = devices.at("10.0.0.7");
    EXPECT_EQ(device.hostname, std::optional<std::string>("nmap-name"));
    EXPECT_EQ(device.services.at(80), "http");
    EXPECT_EQ(device.services.at(443), "https");
    EXPECT_EQ(device.snmp_data->at("1.3.6.1.2.1.1.5.0"), "one");
    EXPECT_EQ(device.snmp_data->at("1.3.6.1.2.1.1.6.0"), "lab");
}

TEST(DeviceMergerTest, EmptyValuesDoNotClaimAField)
{
    auto blank = test::Device("10.0.0.8");
    blank.hostname = "";
    auto named = test::Device("10.0.0.8");
    named.hostname = "nas";

    common::DeviceMap devices;
    DeviceMerger::MergeInto(devices, blank);
    DeviceMerger::MergeInto(devices, named);

    EXPECT_EQ(devices.at("10.0.0.8").hostname, std::optional<std::string>("nas"));
}

TEST(DeviceMergerTest, InvalidAddressesAreIgnored)
{
    common::DeviceMap devices;
    DeviceMerger::MergeInto(devices, test::Device("printer.lan"));
    DeviceMerger::MergeInto(devices, test::Device(""));

    EXPECT_TRUE(devices.empty());
}

TEST(DeviceMergerTest, DuplicateAddressWithinPhaseIgnoresArrivalOrder)
{
    auto first = test::Device("10.0.0.7");
    first.mac_address = "aa:aa:aa:aa:aa:aa";
    first.services = {{80, "http"}};
    auto second = test::Device("10.0.0.7");
    second.mac_address = "bb:bb:bb:bb:bb:bb";
    second.services = {{80, "http (nginx 1.18)"}};

    auto ab = DeviceMerger::Merge(test::Phase(PhaseId::Arp, ScanStatus::Completed, {first, second}),
                                  test::Phase(PhaseId::PortScan, ScanStatus::Completed),
                                  test::Phase(PhaseId::Snmp, ScanStatus::NotStarted));
    auto ba = DeviceMerger::Merge(test::Phase(PhaseId::Arp, ScanStatus::Completed, {second, first}),
                                  test::Phase(PhaseId::PortScan, ScanStatus::Completed),
                                  test::Phase(PhaseId::Snmp, ScanStatus::NotStarted));

    EXPECT_EQ(ab, ba);
    EXPECT_EQ(ab.at("10.0.0.7").mac_address, std::optional<std::string>("aa:aa:aa:aa:aa:aa"));
    EXPECT_EQ(ab.at("10.0.0.7").services.at(80), "http");
}
