#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "../common/ScanConfig.hpp"
#include "../common/Types.hpp"
#include "../scanners/ScanCapability.hpp"
#include "DeviceClassifier.hpp"
#include "ErrorHandler.hpp"
#include "NetworkDetector.hpp"
#include "ScanContext.hpp"

namespace net_discovery::core
{
    // Runs ARP, port scan and SNMP in order, then merges and classifies.
    class ScannerOrchestrator
    {
    public:
        ScannerOrchestrator(common::DiscoveryConfig config,
                            std::shared_ptr<NetworkDetector> detector,
                            std::shared_ptr<scanners::ScanCapability> arp,
                            std::shared_ptr<scanners::ScanCapability> port_scan,
                            std::shared_ptr<scanners::ScanCapability> snmp);

        static std::unique_ptr<ScannerOrchestrator> CreateDefault(const common::DiscoveryConfig &config);

        common::CompleteScanResult ExecuteFullScan();

        // Safe to call from another thread; the running phase stops and later phases are skipped.
        void Cancel();
        bool IsCancelled() const { return m_cancel->load(); }

        void SetQuiet(bool quiet) { m_quiet = quiet; }

        static common::ScanStatus OverallStatus(const common::CompleteScanResult &result);
        static common::ScanStatistics BuildStatistics(const common::CompleteScanResult &result);

    private:
        common::PhaseResult RunPhase(scanners::ScanCapability &capability,
                                     const std::vector<std::string> &targets,
                                     int timeout_seconds, ErrorHandler &errors);

        common::PhaseResult NotRun(common::PhaseId phase, const std::string &reason);

        void Info(const std::string &message) const;
        void Warn(const std::string &message) const;

        common::DiscoveryConfig m_config;
        std::shared_ptr<NetworkDetector> m_detector;
        std::shared_ptr<scanners::ScanCapability> m_arp;
        std::shared_ptr<scanners::ScanCapability> m_port_scan;
        std::shared_ptr<scanners::ScanCapability> m_snmp;
        DeviceClassifier m_classifier;
        CancelFlag m_cancel;
        bool m_quiet = false;
    };
}
