#include "../common/ScanConfig.hpp"
#include "../common/ScanErrors.hpp"
#include "../core/ScannerOrchestrator.hpp"
#include "../report/JsonReportWriter.hpp"
#include "../storage/ScanStore.hpp"

#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>

namespace
{
    struct Options
    {
        std::string config_path;
        std::string output_dir;
        std::string db_path;
        std::string interface_name;
        bool skip_arp = false;
    };

    void PrintUsage(const char *program)
    {
        std::cout << "Usage: " << program
                  << " [--config <file>] [--output <dir>] [--db <file>] [--skip-arp] [--interface <name>]\n";
    }

    // Returns false when the arguments are unusable.
    bool ParseArgs(int argc, char *argv[], Options &options)
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto value = [&](std::string &out)
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "[Main] " << arg << " needs a value\n";
                    return false;
                }
                out = argv[++i];
                return true;
            };

            if (arg == "--config" || arg == "-c")
            {
                if (!value(options.config_path))
                    return false;
            }
            else if (arg == "--output" || arg == "-o")
            {
                if (!value(options.output_dir))
                    return false;
            }
            else if (arg == "--db")
            {
                if (!value(options.db_path))
                    return false;
            }
            else if (arg == "--interface" || arg == "-i")
            {
                if (!value(options.interface_name))
                    return false;
            }
            else if (arg == "--skip-arp")
            {
                options.skip_arp = true;
            }
            else
            {
                std::cerr << "[Main] Unknown argument: " << arg << "\n";
                return false;
            }
        }
        return true;
    }

    // SIGINT/SIGTERM are blocked in every thread and collected here instead.
    void StartSignalWatcher(net_discovery::core::ScannerOrchestrator &orchestrator)
    {
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);

        std::thread([signals, &orchestrator]() mutable
                    {
                        int received = 0;
                        bool cancelled = false;
                        while (sigwait(&signals, &received) == 0)
                        {
                            if (cancelled)
                            {
                                std::cerr << "[Main] Second interrupt, exiting immediately.\n";
                                std::_Exit(130);
                            }
                            std::cerr << "[Main] Interrupted, finishing with partial results...\n";
                            orchestrator.Cancel();
                            cancelled = true;
                        } })
            .detach();
    }

    void PrintSummary(const net_discovery::common::CompleteScanResult &result)
    {
        using namespace net_discovery::common;

        std::cout << "\n[Main] Scan " << ToString(result.status);
        if (result.abort_reason)
            std::cout << " (" << *result.abort_reason << ")";
        std::cout << ": " << result.devices.size() << " devices\n";

        for (const auto &pair : result.devices)
        {
            const DeviceRecord &device = pair.second;
            std::cout << "  " << std::left << std::setw(16) << device.ip_address
                      << std::setw(19) << device.mac_address.value_or("-")
                      << std::setw(18) << ToString(device.device_type)
                      << device.hostname.value_or("") << "\n";
        }

        for (const auto &error : result.statistics.errors_encountered)
            std::cerr << "[Main] " << error << "\n";
    }
}

int main(int argc, char *argv[])
{
    using namespace net_discovery;

    Options options;
    if (!ParseArgs(argc, argv, options))
    {
        PrintUsage(argv[0]);
        return 2;
    }

    try
    {
        common::DiscoveryConfig config = options.config_path.empty() ? common::DefaultConfig()
                                                                     : common::LoadConfigFile(options.config_path);
        if (!options.output_dir.empty())
            config.output.report_dir = options.output_dir;
        if (!options.db_path.empty())
            config.output.database_path = options.db_path;
        if (!options.interface_name.empty())
            config.network.interface_name = options.interface_name;
        if (options.skip_arp)
            config.skip_arp = true;

        auto orchestrator = core::ScannerOrchestrator::CreateDefault(config);
        StartSignalWatcher(*orchestrator);

        common::CompleteScanResult result = orchestrator->ExecuteFullScan();
        PrintSummary(result);

        report::JsonReportWriter writer(config);
        bool report_written = writer.Write(result, config.output.report_dir).has_value();

        if (!config.output.database_path.empty())
        {
            storage::ScanStore store;
            if (!store.Initialize(config.output.database_path) || !store.SaveScan(result))
                std::cerr << "[Main] Scan was not stored in " << config.output.database_path << "\n";
            store.Shutdown();
        }

        if (result.status == common::ScanStatus::Failed)
            return 1;
        if (result.cancelled)
            return 130;
        return report_written ? 0 : 1;
    }
    catch (const common::ScanError &e)
    {
        std::cerr << "[Main] " << common::ToString(e.Category()) << " error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Main] Fatal: " << e.what() << "\n";
        return 1;
    }
}
