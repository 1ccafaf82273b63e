#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include "../report/JsonReportWriter.hpp"
#include "TestSupport.hpp"

using namespace net_discovery;
using report::JsonReportWriter;

namespace fs = std::filesystem;

namespace
{
    common::CompleteScanResult SampleScan()
    {
        common::CompleteScanResult result;
        result.started_at = std::chrono::system_clock::now();
        result.duration = std::chrono::milliseconds(1500);
        result.status = common::ScanStatus::Partial;
        result.network_info.host_ip = "192.168.1.100";
        result.network_info.netmask = "255.255.255.0";
        result.network_info.network_address = "192.168.1.0";
        result.network_info.broadcast_address = "192.168.1.255";
        result.network_info.interface_name = "eth0";
        result.network_info.prefix_length = 24;
        result.network_info.scan_range = {"192.168.1.1", "192.168.1.10", "192.168.1.20"};

        auto sw = test::Device("192.168.1.10");
        sw.device_type = common::DeviceType::NetworkEquipment;
        sw.open_ports = {161, 22};
        sw.services = {{22, "ssh"}};
        sw.snmp_data = common::SnmpData{{common::OID_SYS_DESCR, "Cisco IOS Software"}};
        auto bare = test::Device("192.168.1.2");
        result.devices[sw.ip_address] = sw;
        result.devices[bare.ip_address] = bare;

        result.arp = test::Phase(common::PhaseId::Arp, common::ScanStatus::Completed, {bare, sw});
        result.arp.strategy_used = "arping";
        result.port_scan = test::Phase(common::PhaseId::PortScan, common::ScanStatus::Partial, {sw});
        result.port_scan.errors.push_back({common::ErrorCategory::Tool, std::nullopt, "timeout: nmap killed"});
        result.snmp = test::Phase(common::PhaseId::Snmp, common::ScanStatus::NotStarted);
        return result;
    }

    class ReportDirectory
    {
    public:
        ReportDirectory()
        {
            m_path = fs::temp_directory_path() / ("net_discovery_report_test_" + std::to_string(getpid()));
            fs::remove_all(m_path);
        }

        ~ReportDirectory()
        {
            std::error_code ec;
            fs::remove_all(m_path, ec);
        }

        std::string Path() const { return m_path.string(); }

    private:
        fs::path m_path;
    };
}

TEST(JsonReportWriterTest, TopLevelSections)
{
    auto json = JsonReportWriter(common::DefaultConfig()).ToJson(SampleScan());

    for (const char *key : {"scan_metadata", "network_info", "scan_statistics", "phases", "devices"})
        EXPECT_TRUE(json.contains(key)) << key;

    const auto &metadata = json["scan_metadata"];
    EXPECT_EQ(metadata["network_scanned"], "192.168.1.0/24");
    EXPECT_EQ(metadata["scan_status"], "partial");
    EXPECT_DOUBLE_EQ(metadata["scan_duration"].get<double>(), 1.5);
    EXPECT_TRUE(metadata["abort_reason"].is_null());
    EXPECT_EQ(json["network_info"]["scan_range_size"], 3);
}

TEST(JsonReportWriterTest, DevicesInAddressOrderWithNulls)
{
    auto json = JsonReportWriter(common::DefaultConfig()).ToJson(SampleScan());

    const auto &devices = json["devices"];
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0]["ip_address"], "192.168.1.2");
    EXPECT_TRUE(devices[0]["mac_address"].is_null());
    EXPECT_TRUE(devices[0]["snmp_data"].is_null());
    EXPECT_EQ(devices[0]["device_type"], "Unknown");
    EXPECT_TRUE(devices[0]["open_ports"].empty());

    EXPECT_EQ(devices[1]["device_type"], "NetworkEquipment");
    EXPECT_EQ(devices[1]["open_ports"], nlohmann::json({22, 161}));
    EXPECT_EQ(devices[1]["services"]["22"], "ssh");
    EXPECT_EQ(devices[1]["snmp_data"][common::OID_SYS_DESCR], "Cisco IOS Software");
}

TEST(JsonReportWriterTest, PhaseSections)
{
    auto json = JsonReportWriter(common::DefaultConfig()).ToJson(SampleScan());
    const auto &phases = json["phases"];

    EXPECT_EQ(phases["arp"]["status"], "completed");
    EXPECT_EQ(phases["arp"]["strategy"], "arping");
    EXPECT_EQ(phases["arp"]["devices_found"], 2);
    EXPECT_TRUE(phases["snmp"]["strategy"].is_null());
    EXPECT_EQ(phases["snmp"]["status"], "not_started");

    const auto &errors = phases["portscan"]["errors"];
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["category"], "TOOL");
    EXPECT_TRUE(errors[0]["target"].is_null());
}

TEST(JsonReportWriterTest, CommunityStringsStayOutOfTheReport)
{
    auto config = common::DefaultConfig();
    config.snmp.credentials = {{common::SnmpVersion::V2c, "s3cr3t-ro"}, {common::SnmpVersion::V1, "s3cr3t-old"}};

    auto json = JsonReportWriter(config).ToJson(SampleScan());

    const auto &snmp = json["scan_metadata"]["configurations_used"]["snmp"];
    EXPECT_EQ(snmp["credential_count"], 2);
    EXPECT_EQ(snmp["versions"], nlohmann::json({"v2c", "v1"}));
    EXPECT_EQ(json.dump().find("s3cr3t"), std::string::npos);
}

TEST(JsonReportWriterTest, BaseFilenameFormat)
{
    std::string name = JsonReportWriter::BaseFilename(std::chrono::system_clock::now());
    ASSERT_EQ(name.size(), std::string("network_discovery_YYYYMMDD_HHMMSS").size());
    EXPECT_EQ(name.rfind("network_discovery_", 0), 0u);
    EXPECT_EQ(name[26], '_');
}

TEST(JsonReportWriterTest, WriteAddsSuffixOnCollision)
{
    ReportDirectory dir;
    JsonReportWriter writer(common::DefaultConfig());
    auto scan = SampleScan();
    std::string base = JsonReportWriter::BaseFilename(scan.started_at);

    auto first = writer.Write(scan, dir.Path());
    auto second = writer.Write(scan, dir.Path());

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(fs::path(*first).filename().string(), base + ".json");
    EXPECT_EQ(fs::path(*second).filename().string(), base + "_001.json");

    std::ifstream in(*first);
    auto parsed = nlohmann::json::parse(in);
    EXPECT_EQ(parsed["devices"].size(), 2u);
}

TEST(JsonReportWriterTest, UnwritableDirectoryFails)
{
    ReportDirectory dir;
    fs::create_directories(dir.Path());
    std::string blocker = dir.Path() + "/not_a_dir";
    std::ofstream(blocker) << "x";

    JsonReportWriter writer(common::DefaultConfig());
    EXPECT_FALSE(writer.Write(SampleScan(), blocker).has_value());
}

TEST(JsonReportWriterTest, NonUtf8ToolOutputIsReplaced)
{
    ReportDirectory dir;
    JsonReportWriter writer(common::DefaultConfig());
    auto scan = SampleScan();
    scan.devices.at("192.168.1.10").services[80] = "http (Caf\xe9 WebServer 1.0)";
    scan.devices.at("192.168.1.10").os_info = std::string("Linux \xff\xfe");

    auto path = writer.Write(scan, dir.Path());

    ASSERT_TRUE(path.has_value());
    ASSERT_GT(fs::file_size(*path), 0u);
    std::ifstream in(*path);
    auto parsed = nlohmann::json::parse(in);
    EXPECT_EQ(parsed["devices"][1]["services"]["80"], "http (Caf\xEF\xBF\xBD WebServer 1.0)");
}
