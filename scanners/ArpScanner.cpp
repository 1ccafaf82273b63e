#include "ArpScanner.hpp"
#include "../common/IpUtils.hpp"
#include "../common/ScanErrors.hpp"
#include "../core/WorkerPool.hpp"

#include <tins/tins.h>
#include <algorithm>
#include <fstream>
#include <mutex>
#include <regex>
#include <set>
#include <sstream>

namespace net_discovery::scanners
{
    namespace
    {
        int WholeSeconds(std::chrono::milliseconds timeout)
        {
            auto secs = (timeout.count() + 999) / 1000;
            return static_cast<int>(std::max<long long>(1, secs));
        }

        std::string ReadWholeFile(const std::string &path)
        {
            std::ifstream file(path);
            if (!file.is_open())
                return "";
            std::stringstream ss;
            ss << file.rdbuf();
            return ss.str();
        }
    }

    // arping

    ArpingProbe::ArpingProbe(std::shared_ptr<ProcessExecutor> executor, std::string interface_name)
        : m_executor(std::move(executor)), m_interface(std::move(interface_name)) {}

    void ArpingProbe::CheckAvailable() const
    {
        if (!m_executor->IsAvailable("arping"))
            throw common::ToolError("arping not found in PATH");
    }

    std::optional<ArpReply> ArpingProbe::Probe(const std::string &ip, std::chrono::milliseconds timeout,
                                               const std::atomic<bool> *cancel)
    {
        std::vector<std::string> argv = {"arping", "-c", "1", "-w", std::to_string(WholeSeconds(timeout))};
        if (!m_interface.empty())
        {
            argv.push_back("-I");
            argv.push_back(m_interface);
        }
        argv.push_back(ip);

        ProcessResult run = m_executor->Execute(argv, timeout + std::chrono::seconds(1), cancel);
        if (!run.launched)
            throw common::ToolError("arping: " + run.launch_error);
        if (run.cancelled || run.timed_out)
            return std::nullopt;

        for (const auto &reply : ParseOutput(run.stdout_text))
        {
            if (reply.ip == ip)
                return reply;
        }

        // iputils arping exits 1 for "no reply" and 2 for local failures.
        if (run.exit_code == 2)
            throw common::NetworkError("arping " + ip + " failed: " + run.stderr_text);
        return std::nullopt;
    }

    std::vector<ArpReply> ArpingProbe::ParseOutput(const std::string &text)
    {
        static const std::regex reply_from(R"((?:Unicast reply|Reply) from (\d{1,3}(?:\.\d{1,3}){3}) \[([0-9A-Fa-f]{2}(?:[:-][0-9A-Fa-f]{2}){5})\])");
        static const std::regex is_at(R"((\d{1,3}(?:\.\d{1,3}){3}) is at ([0-9A-Fa-f]{2}(?:[:-][0-9A-Fa-f]{2}){5}))");
        static const std::regex bytes_from(R"(bytes from ([0-9A-Fa-f]{2}(?:[:-][0-9A-Fa-f]{2}){5}) \((\d{1,3}(?:\.\d{1,3}){3})\))");

        std::vector<ArpReply> replies;
        std::set<std::string> seen;
        std::istringstream stream(text);
        std::string line;

        while (std::getline(stream, line))
        {
            std::smatch match;
            std::string ip, mac;
            if (std::regex_search(line, match, reply_from) || std::regex_search(line, match, is_at))
            {
                ip = match[1];
                mac = match[2];
            }
            else if (std::regex_search(line, match, bytes_from))
            {
                ip = match[2];
                mac = match[1];
            }
            else
            {
                continue;
            }

            if (!common::IsValidIpv4(ip) || !seen.insert(ip).second)
                continue;
            replies.push_back({ip, common::NormalizeMac(mac)});
        }
        return replies;
    }

    // libtins

    TinsArpProbe::TinsArpProbe(std::string interface_name) : m_interface(std::move(interface_name)) {}

    void TinsArpProbe::CheckAvailable() const
    {
        if (!IsRoot())
            throw common::PermissionError("raw ARP probes need root");
    }

    std::optional<ArpReply> TinsArpProbe::Probe(const std::string &ip, std::chrono::milliseconds timeout,
                                                const std::atomic<bool> *)
    {
        try
        {
            Tins::IPv4Address target(ip);
            Tins::NetworkInterface iface = m_interface.empty() ? Tins::NetworkInterface(target)
                                                               : Tins::NetworkInterface(m_interface);
            Tins::NetworkInterface::Info info = iface.info();

            Tins::EthernetII request = Tins::ARP::make_arp_request(target, info.ip_addr, info.hw_addr);
            Tins::PacketSender sender(iface, static_cast<uint32_t>(WholeSeconds(timeout)));

            std::unique_ptr<Tins::PDU> response(sender.send_recv(request, iface));
            if (!response)
                return std::nullopt;

            const Tins::ARP *arp = response->find_pdu<Tins::ARP>();
            if (!arp || arp->opcode() != Tins::ARP::REPLY)
                return std::nullopt;

            return ArpReply{ip, common::NormalizeMac(arp->sender_hw_addr().to_string())};
        }
        catch (const std::exception &e)
        {
            throw common::NetworkError("ARP probe to " + ip + " failed: " + e.what());
        }
    }

    // ping + neighbour table

    IcmpPingProbe::IcmpPingProbe(std::shared_ptr<ProcessExecutor> executor, std::string interface_name,
                                 std::string neighbour_table_path)
        : m_executor(std::move(executor)), m_interface(std::move(interface_name)),
          m_table_path(std::move(neighbour_table_path)) {}

    void IcmpPingProbe::CheckAvailable() const
    {
        if (!m_executor->IsAvailable("ping"))
            throw common::ToolError("ping not found in PATH");
    }

    std::optional<ArpReply> IcmpPingProbe::Probe(const std::string &ip, std::chrono::milliseconds timeout,
                                                 const std::atomic<bool> *cancel)
    {
        std::vector<std::string> argv = {"ping", "-c", "1", "-W", std::to_string(WholeSeconds(timeout))};
        if (!m_interface.empty())
        {
            argv.push_back("-I");
            argv.push_back(m_interface);
        }
        argv.push_back(ip);

        ProcessResult run = m_executor->Execute(argv, timeout + std::chrono::seconds(1), cancel);
        if (!run.launched)
            throw common::ToolError("ping: " + run.launch_error);
        if (run.cancelled || run.timed_out || run.exit_code == 1)
            return std::nullopt;
        if (run.exit_code != 0)
            throw common::NetworkError("ping " + ip + " failed: " + run.stderr_text);

        ArpReply reply{ip, std::nullopt};
        auto table = ParseNeighbourTable(ReadWholeFile(m_table_path), m_interface);
        auto it = table.find(ip);
        if (it != table.end())
            reply.mac = it->second;
        return reply;
    }

    std::map<std::string, std::string> ParseNeighbourTable(const std::string &text, const std::string &interface_name)
    {
        std::map<std::string, std::string> table;
        std::istringstream stream(text);
        std::string line;
        std::getline(stream, line);

        while (std::getline(stream, line))
        {
            std::stringstream ss(line);
            std::string ip, hw_type, flags, mac, mask, dev;
            if (!(ss >> ip >> hw_type >> flags >> mac >> mask >> dev))
                continue;

            if (!interface_name.empty() && dev != interface_name)
                continue;
            if (flags == "0x0" || mac == "00:00:00:00:00:00" || !common::IsValidMac(mac))
                continue;

            table[ip] = common::NormalizeMac(mac);
        }
        return table;
    }

    // capability

    ArpScanner::ArpScanner(std::shared_ptr<ProcessExecutor> executor)
        : m_factory([executor](common::ArpMethod method, const common::DiscoveryConfig &config)
                        -> std::unique_ptr<ArpProbeStrategy>
                    {
                        const std::string &iface = config.network.interface_name;
                        switch (method)
                        {
                        case common::ArpMethod::Arping:
                            return std::make_unique<ArpingProbe>(executor, iface);
                        case common::ArpMethod::Libtins:
                            return std::make_unique<TinsArpProbe>(iface);
                        case common::ArpMethod::Ping:
                            return std::make_unique<IcmpPingProbe>(executor, iface);
                        }
                        return nullptr;
                    })
    {
    }

    ArpScanner::ArpScanner(StrategyFactory factory) : m_factory(std::move(factory)) {}

    std::optional<common::ArpMethod> ArpScanner::FallbackFor(common::ArpMethod method)
    {
        switch (method)
        {
        case common::ArpMethod::Arping:
        case common::ArpMethod::Libtins:
            return common::ArpMethod::Ping;
        case common::ArpMethod::Ping:
            return std::nullopt;
        }
        return std::nullopt;
    }

    std::unique_ptr<ArpProbeStrategy> ArpScanner::SelectStrategy(const common::DiscoveryConfig &config,
                                                                 core::ScanContext &context,
                                                                 common::PhaseResult &result)
    {
        common::ArpMethod method = config.arp.method;

        while (true)
        {
            std::unique_ptr<ArpProbeStrategy> strategy = m_factory(method, config);
            if (!strategy)
            {
                context.Log().Error("No strategy registered for method " + common::ToString(method));
                return nullptr;
            }

            try
            {
                strategy->CheckAvailable();
                if (method != config.arp.method)
                    context.Log().Warn("Using fallback strategy '" + strategy->Name() + "'");
                return strategy;
            }
            catch (const common::ScanError &e)
            {
                auto fallback = FallbackFor(method);

                core::ErrorContext error_context;
                error_context.phase = common::PhaseId::Arp;
                error_context.fallback_available = fallback.has_value();

                core::RecoveryAction action = context.Errors().Handle(e, error_context);
                result.errors.push_back({e.Category(), std::nullopt, strategy->Name() + ": " + e.what()});

                if (action == core::RecoveryAction::Fallback && fallback)
                {
                    method = *fallback;
                    continue;
                }

                context.Log().Error("No usable ARP strategy: " + std::string(e.what()));
                return nullptr;
            }
        }
    }

    common::PhaseResult ArpScanner::Scan(const std::vector<std::string> &targets,
                                         const common::DiscoveryConfig &config,
                                         core::ScanContext &context)
    {
        common::PhaseResult result;
        result.phase = common::PhaseId::Arp;
        result.status = common::ScanStatus::InProgress;
        result.targets_given = targets.size();

        auto &log = context.Log();
        log.Info("Probing " + std::to_string(targets.size()) + " targets (method " +
                 common::ToString(config.arp.method) + ")");

        std::unique_ptr<ArpProbeStrategy> strategy = SelectStrategy(config, context, result);
        if (!strategy)
        {
            result.status = common::ScanStatus::Failed;
            result.log = log.Lines();
            result.elapsed = context.Elapsed();
            return result;
        }
        result.strategy_used = strategy->Name();

        const int probes_per_target = std::max(1, config.arp.retries);
        const std::chrono::milliseconds probe_timeout = std::chrono::seconds(config.arp.timeout_seconds);

        std::mutex results_mutex;
        std::size_t target_errors = 0;

        std::size_t skipped = core::RunForEachTarget(
            targets, static_cast<std::size_t>(config.arp.workers),
            [&context]
            { return context.ShouldStop(); },
            [&](const std::string &ip)
            {
                int network_failures = 0;
                int probes = 0;

                while (probes < probes_per_target && !context.ShouldStop())
                {
                    try
                    {
                        auto reply = strategy->Probe(ip, context.Bounded(probe_timeout), context.Cancel().get());
                        if (reply)
                        {
                            common::DeviceRecord record;
                            record.ip_address = ip;
                            record.mac_address = reply->mac;

                            std::lock_guard<std::mutex> lock(results_mutex);
                            result.observations.push_back(std::move(record));
                            return;
                        }
                        ++probes;
                    }
                    catch (const common::ScanError &e)
                    {
                        core::ErrorContext error_context;
                        error_context.phase = common::PhaseId::Arp;
                        error_context.target = ip;
                        error_context.attempt = network_failures;
                        error_context.max_retries = config.arp.retries;

                        if (context.Errors().Handle(e, error_context) == core::RecoveryAction::Retry)
                        {
                            ++network_failures;
                            continue;
                        }

                        std::lock_guard<std::mutex> lock(results_mutex);
                        result.errors.push_back({e.Category(), ip, e.what()});
                        ++target_errors;
                        return;
                    }
                }
            });

        std::sort(result.observations.begin(), result.observations.end(),
                  [](const common::DeviceRecord &a, const common::DeviceRecord &b)
                  { return common::IpLess{}(a.ip_address, b.ip_address); });

        if (context.IsCancelled())
        {
            log.Warn("Cancelled, " + std::to_string(skipped) + " targets not probed");
            result.status = common::ScanStatus::Partial;
        }
        else if (skipped > 0 || context.DeadlineExpired())
        {
            log.Warn("Phase timeout reached, " + std::to_string(skipped) + " targets not probed");
            result.status = common::ScanStatus::Partial;
        }
        else if (target_errors > 0)
        {
            result.status = common::ScanStatus::Partial;
        }
        else
        {
            result.status = common::ScanStatus::Completed;
        }

        log.Info(std::to_string(result.observations.size()) + " hosts answered via " + strategy->Name());
        result.log = log.Lines();
        result.elapsed = context.Elapsed();
        return result;
    }
}
