#include <gtest/gtest.h>
#include <map>
#include <mutex>
#include "../common/ScanErrors.hpp"
#include "../scanners/SnmpScanner.hpp"
#include "TestSupport.hpp"

using namespace net_discovery;
using common::snmp::ValueType;
using common::snmp::VarBind;
using scanners::SnmpReply;
using scanners::SnmpScanner;

namespace
{
    const std::string SYS_UPTIME = "1.3.6.1.2.1.1.3.0";

    struct OidLess
    {
        bool operator()(const std::string &lhs, const std::string &rhs) const
        {
            return common::snmp::CompareOids(lhs, rhs) < 0;
        }
    };

    struct Agent
    {
        std::set<std::string> communities;
        std::map<std::string, VarBind, OidLess> values;

        void Set(const std::string &oid, ValueType type, const std::string &value)
        {
            values[oid] = VarBind{oid, type, value};
        }
    };

    struct Request
    {
        std::string ip;
        std::string community;
        std::string oid;
        bool next;
    };

    // In-memory agents keyed by IP, answering like v1/v2c agents do.
    class FakeTransport : public scanners::SnmpTransport
    {
    public:
        void AddAgent(const std::string &ip, Agent agent) { m_agents[ip] = std::move(agent); }
        void Break(const std::string &ip) { m_broken.insert(ip); }

        std::optional<SnmpReply> Get(const std::string &ip, const common::SnmpCredential &credential,
                                     const std::string &oid, std::chrono::milliseconds) override
        {
            const Agent *agent = Accepting(ip, credential, oid, false);
            if (!agent)
                return std::nullopt;

            SnmpReply reply;
            auto it = agent->values.find(oid);
            if (it != agent->values.end())
                reply.varbind = it->second;
            else if (credential.version == common::SnmpVersion::V1)
                reply.error_status = common::snmp::ERROR_NO_SUCH_NAME;
            else
                reply.varbind = VarBind{oid, ValueType::NoSuchObject, ""};
            return reply;
        }

        std::optional<SnmpReply> GetNext(const std::string &ip, const common::SnmpCredential &credential,
                                         const std::string &oid, std::chrono::milliseconds) override
        {
            const Agent *agent = Accepting(ip, credential, oid, true);
            if (!agent)
                return std::nullopt;

            SnmpReply reply;
            auto it = agent->values.upper_bound(oid);
            if (it != agent->values.end())
                reply.varbind = it->second;
            else if (credential.version == common::SnmpVersion::V1)
                reply.error_status = common::snmp::ERROR_NO_SUCH_NAME;
            else
                reply.varbind = VarBind{oid, ValueType::EndOfMibView, ""};
            return reply;
        }

        std::vector<Request> Requests() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_requests;
        }

    private:
        const Agent *Accepting(const std::string &ip, const common::SnmpCredential &credential,
                               const std::string &oid, bool next)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_requests.push_back({ip, credential.community, oid, next});
            }
            if (m_broken.count(ip))
                throw common::NetworkError("sendto " + ip + ": Network is unreachable");

            auto it = m_agents.find(ip);
            if (it == m_agents.end() || !it->second.communities.count(credential.community))
                return nullptr;
            return &it->second;
        }

        std::map<std::string, Agent> m_agents;
        std::set<std::string> m_broken;
        mutable std::mutex m_mutex;
        std::vector<Request> m_requests;
    };

    Agent CiscoSwitch(std::set<std::string> communities)
    {
        Agent agent;
        agent.communities = std::move(communities);
        agent.Set(common::OID_SYS_DESCR, ValueType::OctetString,
                  "Cisco IOS Software, C2960 Software (C2960-LANBASEK9-M), Version 15.0(2)SE");
        agent.Set(common::OID_SYS_OBJECT_ID, ValueType::ObjectId, "1.3.6.1.4.1.9.1.1208");
        agent.Set(SYS_UPTIME, ValueType::TimeTicks, "123456");
        agent.Set(common::OID_SYS_NAME, ValueType::OctetString, "core-sw1");
        for (int i = 1; i <= 10; ++i)
            agent.Set("1.3.6.1.2.1.2.2.1.2." + std::to_string(i), ValueType::OctetString, "Gi0/" + std::to_string(i));
        agent.Set("1.3.6.1.2.1.4.1.0", ValueType::Integer, "2");
        return agent;
    }

    class SnmpScannerTest : public ::testing::Test
    {
    protected:
        SnmpScannerTest() : m_errors(false), m_transport(std::make_shared<FakeTransport>())
        {
            m_config = test::TestConfig();
            m_config.snmp.credentials = {{common::SnmpVersion::V2c, "public"}, {common::SnmpVersion::V2c, "private"}};
            m_config.snmp.walk_oids = {"1.3.6.1.2.1.2"};
        }

        common::PhaseResult Run(const std::vector<std::string> &targets, bool cancelled = false)
        {
            SnmpScanner scanner(m_transport);
            auto cancel = std::make_shared<std::atomic<bool>>(cancelled);
            core::ScanContext context(common::PhaseId::Snmp, cancel, m_errors, std::chrono::seconds(60), false);
            return scanner.Scan(targets, m_config, context);
        }

        core::ErrorHandler m_errors;
        std::shared_ptr<FakeTransport> m_transport;
        common::DiscoveryConfig m_config;
    };
}

TEST_F(SnmpScannerTest, FirstAnsweringCredentialIsUsed)
{
    m_transport->AddAgent("192.168.1.10", CiscoSwitch({"private"}));

    auto result = Run({"192.168.1.10"});

    EXPECT_EQ(result.status, common::ScanStatus::Completed);
    EXPECT_EQ(result.strategy_used, "udp");
    ASSERT_EQ(result.observations.size(), 1u);

    auto requests = m_transport->Requests();
    ASSERT_GE(requests.size(), 2u);
    EXPECT_EQ(requests[0].community, "public");
    EXPECT_EQ(requests[0].oid, common::OID_SYS_DESCR);
    for (std::size_t i = 1; i < requests.size(); ++i)
        EXPECT_EQ(requests[i].community, "private");

    bool named_index = false;
    for (const auto &line : result.log)
    {
        EXPECT_EQ(line.find("private"), std::string::npos) << line;
        if (line.find("credential #2") != std::string::npos)
            named_index = true;
    }
    EXPECT_TRUE(named_index);
}

TEST_F(SnmpScannerTest, LaterCredentialsAreNotTriedAfterAMatch)
{
    m_transport->AddAgent("192.168.1.10", CiscoSwitch({"public", "private"}));

    auto result = Run({"192.168.1.10"});

    ASSERT_EQ(result.observations.size(), 1u);
    for (const auto &request : m_transport->Requests())
        EXPECT_EQ(request.community, "public");
}

TEST_F(SnmpScannerTest, CollectsSystemGroupAndEnriches)
{
    m_transport->AddAgent("192.168.1.10", CiscoSwitch({"public"}));

    auto result = Run({"192.168.1.10"});
    ASSERT_EQ(result.observations.size(), 1u);

    const auto &device = result.observations[0];
    ASSERT_TRUE(device.snmp_data.has_value());
    EXPECT_EQ(device.snmp_data->at(SYS_UPTIME), "123456");
    EXPECT_EQ(device.hostname, std::optional<std::string>("core-sw1"));
    EXPECT_EQ(device.manufacturer, std::optional<std::string>("Cisco"));
    ASSERT_TRUE(device.os_info.has_value());
    EXPECT_NE(device.os_info->find("C2960"), std::string::npos);
    // Missing sysContact/sysLocation leave no entry behind.
    EXPECT_EQ(device.snmp_data->count("1.3.6.1.2.1.1.4.0"), 0u);
}

TEST_F(SnmpScannerTest, WalkStopsAtSubtreeEnd)
{
    m_transport->AddAgent("192.168.1.10", CiscoSwitch({"public"}));

    auto result = Run({"192.168.1.10"});
    ASSERT_EQ(result.observations.size(), 1u);

    const auto &data = *result.observations[0].snmp_data;
    EXPECT_EQ(data.count("1.3.6.1.2.1.2.2.1.2.10"), 1u);
    EXPECT_EQ(data.count("1.3.6.1.2.1.4.1.0"), 0u);
}

TEST_F(SnmpScannerTest, WalkIsCappedPerSubtree)
{
    m_config.snmp.max_walk_oids = 3;
    m_transport->AddAgent("192.168.1.10", CiscoSwitch({"public"}));

    auto result = Run({"192.168.1.10"});
    ASSERT_EQ(result.observations.size(), 1u);

    std::size_t walked = 0;
    for (const auto &entry : *result.observations[0].snmp_data)
    {
        if (common::snmp::OidInSubtree(entry.first, "1.3.6.1.2.1.2"))
            ++walked;
    }
    EXPECT_EQ(walked, 3u);
}

TEST_F(SnmpScannerTest, V1ErrorStatusStillAuthenticates)
{
    Agent agent;
    agent.communities = {"public"};
    agent.Set(common::OID_SYS_NAME, ValueType::OctetString, "printer-3f");
    m_transport->AddAgent("192.168.1.30", agent);

    m_config.snmp.credentials = {{common::SnmpVersion::V1, "public"}};
    m_config.snmp.walk_oids.clear();

    auto result = Run({"192.168.1.30"});

    ASSERT_EQ(result.observations.size(), 1u);
    EXPECT_EQ(result.observations[0].hostname, std::optional<std::string>("printer-3f"));
    EXPECT_EQ(result.observations[0].snmp_data->count(common::OID_SYS_DESCR), 0u);
}

TEST_F(SnmpScannerTest, SilentDeviceIsNotAnError)
{
    auto result = Run({"192.168.1.99"});

    EXPECT_EQ(result.status, common::ScanStatus::Completed);
    EXPECT_TRUE(result.observations.empty());
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(m_transport->Requests().size(), 2u);
}

TEST_F(SnmpScannerTest, NetworkFailureAfterRetriesMarksPartial)
{
    m_transport->AddAgent("192.168.1.10", CiscoSwitch({"public"}));
    m_transport->Break("192.168.1.20");

    auto result = Run({"192.168.1.10", "192.168.1.20"});

    EXPECT_EQ(result.status, common::ScanStatus::Partial);
    ASSERT_EQ(result.observations.size(), 1u);
    EXPECT_EQ(result.observations[0].ip_address, "192.168.1.10");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].category, common::ErrorCategory::Network);
    EXPECT_EQ(result.errors[0].target, std::optional<std::string>("192.168.1.20"));
    EXPECT_EQ(m_errors.Count(common::ErrorCategory::Network), 2u);
}

TEST_F(SnmpScannerTest, CancelledBeforeStartQueriesNothing)
{
    m_transport->AddAgent("192.168.1.10", CiscoSwitch({"public"}));

    auto result = Run({"192.168.1.10"}, true);

    EXPECT_EQ(result.status, common::ScanStatus::Partial);
    EXPECT_TRUE(result.observations.empty());
    EXPECT_TRUE(m_transport->Requests().empty());
}

TEST(SnmpEnrichTest, KeepsExistingFields)
{
    common::DeviceRecord record = test::Device("10.0.0.1");
    record.hostname = "from-nmap";
    record.snmp_data = common::SnmpData{{common::OID_SYS_NAME, "from-snmp"},
                                        {common::OID_SYS_OBJECT_ID, "1.3.6.1.4.1.2636.1.1.1.2.29"}};

    SnmpScanner::Enrich(record);

    EXPECT_EQ(record.hostname, std::optional<std::string>("from-nmap"));
    EXPECT_EQ(record.manufacturer, std::optional<std::string>("Juniper"));
    EXPECT_FALSE(record.os_info.has_value());
}

TEST(SnmpEnrichTest, UnknownEnterpriseLeavesManufacturerEmpty)
{
    common::DeviceRecord record = test::Device("10.0.0.1");
    record.snmp_data = common::SnmpData{{common::OID_SYS_OBJECT_ID, "1.3.6.1.4.1.8072.3.2.10"}};

    SnmpScanner::Enrich(record);

    EXPECT_FALSE(record.manufacturer.has_value());
}
