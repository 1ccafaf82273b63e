#include "ScannerOrchestrator.hpp"
#include "../common/ScanErrors.hpp"
#include "../scanners/ArpScanner.hpp"
#include "../scanners/PortScanner.hpp"
#include "../scanners/ProcessExecutor.hpp"
#include "../scanners/SnmpClient.hpp"
#include "../scanners/SnmpScanner.hpp"
#include "DeviceMerger.hpp"

#include <iostream>
#include <set>

namespace net_discovery::core
{
    namespace
    {
        double Seconds(std::chrono::milliseconds duration)
        {
            return static_cast<double>(duration.count()) / 1000.0;
        }
    }

    ScannerOrchestrator::ScannerOrchestrator(common::DiscoveryConfig config,
                                             std::shared_ptr<NetworkDetector> detector,
                                             std::shared_ptr<scanners::ScanCapability> arp,
                                             std::shared_ptr<scanners::ScanCapability> port_scan,
                                             std::shared_ptr<scanners::ScanCapability> snmp)
        : m_config(std::move(config)), m_detector(std::move(detector)), m_arp(std::move(arp)),
          m_port_scan(std::move(port_scan)), m_snmp(std::move(snmp)), m_classifier(m_config.classifier),
          m_cancel(std::make_shared<std::atomic<bool>>(false))
    {
    }

    std::unique_ptr<ScannerOrchestrator> ScannerOrchestrator::CreateDefault(const common::DiscoveryConfig &config)
    {
        auto executor = std::make_shared<scanners::SubprocessExecutor>();
        return std::make_unique<ScannerOrchestrator>(
            config,
            std::make_shared<NetworkDetector>(config.network),
            std::make_shared<scanners::ArpScanner>(executor),
            std::make_shared<scanners::PortScanner>(executor),
            std::make_shared<scanners::SnmpScanner>(std::make_shared<scanners::SnmpClient>()));
    }

    void ScannerOrchestrator::Cancel()
    {
        m_cancel->store(true);
    }

    void ScannerOrchestrator::Info(const std::string &message) const
    {
        if (!m_quiet)
            std::cout << "[Orchestrator] " << message << "\n";
    }

    void ScannerOrchestrator::Warn(const std::string &message) const
    {
        if (!m_quiet)
            std::cerr << "[Orchestrator] WARN: " << message << "\n";
    }

    common::PhaseResult ScannerOrchestrator::NotRun(common::PhaseId phase, const std::string &reason)
    {
        common::PhaseResult result;
        result.phase = phase;
        result.status = common::ScanStatus::NotStarted;
        result.log.push_back("INFO " + reason);
        Info(PhaseTag(phase) + " not started: " + reason);
        return result;
    }

    common::PhaseResult ScannerOrchestrator::RunPhase(scanners::ScanCapability &capability,
                                                      const std::vector<std::string> &targets,
                                                      int timeout_seconds, ErrorHandler &errors)
    {
        common::PhaseId phase = capability.Phase();
        ScanContext context(phase, m_cancel, errors, std::chrono::seconds(timeout_seconds), !m_quiet);
        Info("Starting " + PhaseTag(phase) + " on " + std::to_string(targets.size()) + " targets");

        common::PhaseResult result;
        try
        {
            result = capability.Scan(targets, m_config, context);
        }
        catch (const std::exception &e)
        {
            ErrorContext error_context;
            error_context.phase = phase;
            errors.Handle(common::ErrorCategory::Tool, e.what(), error_context);

            context.Log().Error(std::string("capability failed: ") + e.what());
            result = common::PhaseResult();
            result.status = common::ScanStatus::Failed;
            result.targets_given = targets.size();
            result.errors.push_back({common::ErrorCategory::Tool, std::nullopt, e.what()});
            result.log = context.Log().Lines();
            result.elapsed = context.Elapsed();
        }

        result.phase = phase;
        if (result.status == common::ScanStatus::InProgress || result.status == common::ScanStatus::NotStarted)
            result.status = common::ScanStatus::Failed;

        Info(PhaseTag(phase) + " " + common::ToString(result.status) + ": " +
             std::to_string(result.observations.size()) + " hosts, " + std::to_string(result.errors.size()) +
             " errors in " + std::to_string(Seconds(result.elapsed)) + "s");
        return result;
    }

    common::CompleteScanResult ScannerOrchestrator::ExecuteFullScan()
    {
        common::CompleteScanResult result;
        result.started_at = std::chrono::system_clock::now();
        auto started = std::chrono::steady_clock::now();
        auto finish = [&]()
        {
            result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
            result.cancelled = IsCancelled();
            result.status = OverallStatus(result);
            result.statistics = BuildStatistics(result);
            Info("Scan " + common::ToString(result.status) + ", " + std::to_string(result.devices.size()) +
                 " devices in " + std::to_string(Seconds(result.duration)) + "s");
            return result;
        };

        result.arp.phase = common::PhaseId::Arp;
        result.port_scan.phase = common::PhaseId::PortScan;
        result.snmp.phase = common::PhaseId::Snmp;

        ErrorHandler errors(!m_quiet);

        try
        {
            m_config.Validate();
            m_detector->SetEcho(!m_quiet);
            result.network_info = m_detector->Detect();
        }
        catch (const common::ScanError &e)
        {
            ErrorContext error_context;
            errors.Handle(common::ErrorCategory::Configuration, e.what(), error_context);
            result.abort_reason = e.what();
            return finish();
        }

        const std::vector<std::string> &targets = result.network_info.scan_range;
        Info("Scanning " + std::to_string(targets.size()) + " addresses on " + result.network_info.network_address +
             "/" + std::to_string(result.network_info.prefix_length));

        std::vector<std::string> survivors = targets;
        if (m_config.skip_arp)
        {
            result.arp = NotRun(common::PhaseId::Arp, "skipped by configuration, all targets go to the port scan");
        }
        else if (!IsCancelled())
        {
            result.arp = RunPhase(*m_arp, targets, m_config.arp.phase_timeout_seconds, errors);

            if (result.arp.status == common::ScanStatus::Failed || result.arp.observations.empty())
            {
                Warn("ARP found no hosts, port scan covers the full range");
            }
            else
            {
                survivors.clear();
                for (const auto &record : result.arp.observations)
                    survivors.push_back(record.ip_address);
            }
        }

        if (IsCancelled())
        {
            Warn("Cancelled, skipping remaining phases");
        }
        else
        {
            result.port_scan = RunPhase(*m_port_scan, survivors, m_config.portscan.timeout_seconds, errors);

            std::vector<std::string> candidates = scanners::PortScanner::SnmpCandidates(result.port_scan);
            if (IsCancelled())
                Warn("Cancelled, skipping SNMP");
            else if (candidates.empty())
                result.snmp = NotRun(common::PhaseId::Snmp, "no host exposes the SNMP port");
            else
                result.snmp = RunPhase(*m_snmp, candidates, m_config.snmp.phase_timeout_seconds, errors);
        }

        common::DeviceMap merged = DeviceMerger::Merge(result.arp, result.port_scan, result.snmp);

        std::set<std::string> in_range(targets.begin(), targets.end());
        for (auto &pair : merged)
        {
            if (in_range.count(pair.first))
                result.devices.insert(std::move(pair));
            else
                Warn("Dropping " + pair.first + ", outside the scan range");
        }

        m_classifier.ClassifyAll(result.devices);
        return finish();
    }

    common::ScanStatus ScannerOrchestrator::OverallStatus(const common::CompleteScanResult &result)
    {
        if (result.abort_reason)
            return common::ScanStatus::Failed;
        if (result.cancelled)
            return common::ScanStatus::Partial;

        for (const auto *phase : {&result.arp, &result.port_scan, &result.snmp})
        {
            if (phase->status != common::ScanStatus::NotStarted && phase->status != common::ScanStatus::Completed)
                return common::ScanStatus::Partial;
        }
        return common::ScanStatus::Completed;
    }

    common::ScanStatistics ScannerOrchestrator::BuildStatistics(const common::CompleteScanResult &result)
    {
        common::ScanStatistics stats;
        stats.total_addresses_scanned = result.network_info.scan_range.size();

        for (const auto *phase : {&result.arp, &result.port_scan, &result.snmp})
        {
            std::string name = common::ToString(phase->phase);
            stats.devices_found[name] = phase->observations.size();
            stats.scan_times[name] = Seconds(phase->elapsed);

            for (const auto &error : phase->errors)
                stats.errors_encountered.push_back(name + " " + common::FormatPhaseError(error));
        }
        stats.devices_found["total"] = result.devices.size();
        stats.scan_times["total"] = Seconds(result.duration);

        for (auto type : {common::DeviceType::IoT, common::DeviceType::Windows, common::DeviceType::Linux,
                          common::DeviceType::NetworkEquipment, common::DeviceType::Unknown})
            stats.device_types[common::ToString(type)] = 0;
        for (const auto &pair : result.devices)
            ++stats.device_types[common::ToString(pair.second.device_type)];

        if (result.abort_reason)
            stats.errors_encountered.push_back("aborted: " + *result.abort_reason);
        return stats;
    }
}
