#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ProcessExecutor.hpp"
#include "ScanCapability.hpp"

namespace net_discovery::scanners
{
    struct ArpReply
    {
        std::string ip;
        std::optional<std::string> mac;
    };

    class ArpProbeStrategy
    {
    public:
        virtual ~ArpProbeStrategy() = default;

        virtual std::string Name() const = 0;

        // Throws PermissionError or ToolError when the strategy cannot run on this host.
        virtual void CheckAvailable() const = 0;

        // nullopt: no answer within timeout. Throws NetworkError on a failure
        // that says nothing about the target.
        virtual std::optional<ArpReply> Probe(const std::string &ip, std::chrono::milliseconds timeout,
                                              const std::atomic<bool> *cancel) = 0;
    };

    class ArpingProbe : public ArpProbeStrategy
    {
    public:
        ArpingProbe(std::shared_ptr<ProcessExecutor> executor, std::string interface_name);

        std::string Name() const override { return "arping"; }
        void CheckAvailable() const override;
        std::optional<ArpReply> Probe(const std::string &ip, std::chrono::milliseconds timeout,
                                      const std::atomic<bool> *cancel) override;

        static std::vector<ArpReply> ParseOutput(const std::string &text);

    private:
        std::shared_ptr<ProcessExecutor> m_executor;
        std::string m_interface;
    };

    // Raw ARP request/reply through libtins. Needs root.
    class TinsArpProbe : public ArpProbeStrategy
    {
    public:
        explicit TinsArpProbe(std::string interface_name);

        std::string Name() const override { return "libtins"; }
        void CheckAvailable() const override;
        std::optional<ArpReply> Probe(const std::string &ip, std::chrono::milliseconds timeout,
                                      const std::atomic<bool> *cancel) override;

    private:
        std::string m_interface;
    };

    // ICMP echo through the system ping, MAC taken from the kernel neighbour table.
    class IcmpPingProbe : public ArpProbeStrategy
    {
    public:
        IcmpPingProbe(std::shared_ptr<ProcessExecutor> executor, std::string interface_name,
                      std::string neighbour_table_path = "/proc/net/arp");

        std::string Name() const override { return "ping"; }
        void CheckAvailable() const override;
        std::optional<ArpReply> Probe(const std::string &ip, std::chrono::milliseconds timeout,
                                      const std::atomic<bool> *cancel) override;

    private:
        std::shared_ptr<ProcessExecutor> m_executor;
        std::string m_interface;
        std::string m_table_path;
    };

    // Parses /proc/net/arp content into ip -> mac, skipping incomplete entries.
    std::map<std::string, std::string> ParseNeighbourTable(const std::string &text,
                                                           const std::string &interface_name = "");

    class ArpScanner : public ScanCapability
    {
    public:
        using StrategyFactory = std::function<std::unique_ptr<ArpProbeStrategy>(common::ArpMethod,
                                                                                const common::DiscoveryConfig &)>;

        explicit ArpScanner(std::shared_ptr<ProcessExecutor> executor);
        explicit ArpScanner(StrategyFactory factory);

        common::PhaseId Phase() const override { return common::PhaseId::Arp; }

        common::PhaseResult Scan(const std::vector<std::string> &targets,
                                 const common::DiscoveryConfig &config,
                                 core::ScanContext &context) override;

        static std::optional<common::ArpMethod> FallbackFor(common::ArpMethod method);

    private:
        std::unique_ptr<ArpProbeStrategy> SelectStrategy(const common::DiscoveryConfig &config,
                                                         core::ScanContext &context,
                                                         common::PhaseResult &result);

        StrategyFactory m_factory;
    };
}
