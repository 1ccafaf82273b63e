#include "JsonReportWriter.hpp"
#include "../scanners/PortScanner.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace net_discovery::report
{
    namespace
    {
        constexpr int MAX_COLLISIONS = 999;

        template <typename T>
        nlohmann::json OrNull(const std::optional<T> &value)
        {
            return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
        }
    }

    JsonReportWriter::JsonReportWriter(common::DiscoveryConfig config) : m_config(std::move(config)) {}

    nlohmann::json DeviceToJson(const common::DeviceRecord &device)
    {
        nlohmann::json services = nlohmann::json::object();
        for (const auto &pair : device.services)
            services[std::to_string(pair.first)] = pair.second;

        return {
            {"ip_address", device.ip_address},
            {"mac_address", OrNull(device.mac_address)},
            {"hostname", OrNull(device.hostname)},
            {"device_type", common::ToString(device.device_type)},
            {"os_info", OrNull(device.os_info)},
            {"manufacturer", OrNull(device.manufacturer)},
            {"model", OrNull(device.model)},
            {"open_ports", device.open_ports},
            {"services", services},
            {"snmp_data", OrNull(device.snmp_data)},
        };
    }

    nlohmann::json PhaseToJson(const common::PhaseResult &phase)
    {
        nlohmann::json errors = nlohmann::json::array();
        for (const auto &error : phase.errors)
        {
            errors.push_back({{"category", common::ToString(error.category)},
                              {"target", OrNull(error.target)},
                              {"message", error.message}});
        }

        return {
            {"status", common::ToString(phase.status)},
            {"strategy", phase.strategy_used.empty() ? nlohmann::json(nullptr) : nlohmann::json(phase.strategy_used)},
            {"targets", phase.targets_given},
            {"devices_found", phase.observations.size()},
            {"duration_seconds", static_cast<double>(phase.elapsed.count()) / 1000.0},
            {"errors", errors},
            {"log", phase.log},
        };
    }

    nlohmann::json JsonReportWriter::ConfigurationSummary() const
    {
        nlohmann::json versions = nlohmann::json::array();
        for (const auto &credential : m_config.snmp.credentials)
        {
            std::string version = common::ToString(credential.version);
            if (std::find(versions.begin(), versions.end(), version) == versions.end())
                versions.push_back(version);
        }

        return {
            {"arp", {{"method", common::ToString(m_config.arp.method)},
                     {"timeout", m_config.arp.timeout_seconds},
                     {"retries", m_config.arp.retries},
                     {"workers", m_config.arp.workers},
                     {"skipped", m_config.skip_arp}}},
            {"portscan", {{"command", scanners::PortScanner::BuildCommand(m_config.portscan, m_config.portscan.executable, {})},
                          {"timeout", m_config.portscan.timeout_seconds}}},
            {"snmp", {{"versions", versions},
                      {"credential_count", m_config.snmp.credentials.size()},
                      {"timeout", m_config.snmp.timeout_seconds},
                      {"retries", m_config.snmp.retries},
                      {"walk_oids", m_config.snmp.walk_oids},
                      {"max_walk_oids", m_config.snmp.max_walk_oids}}},
        };
    }

    nlohmann::json JsonReportWriter::ToJson(const common::CompleteScanResult &result) const
    {
        const auto &net = result.network_info;
        const auto &stats = result.statistics;

        std::string network_scanned;
        if (!net.network_address.empty())
            network_scanned = net.network_address + "/" + std::to_string(net.prefix_length);

        nlohmann::json metadata = {
            {"timestamp", common::FormatTimestamp(result.started_at)},
            {"scan_duration", static_cast<double>(result.duration.count()) / 1000.0},
            {"network_scanned", network_scanned},
            {"host_ip", net.host_ip},
            {"excluded_addresses", net.excluded_addresses},
            {"configurations_used", ConfigurationSummary()},
            {"scan_status", common::ToString(result.status)},
            {"cancelled", result.cancelled},
            {"abort_reason", OrNull(result.abort_reason)},
        };

        nlohmann::json network_info = {
            {"host_ip", net.host_ip},
            {"netmask", net.netmask},
            {"network_address", net.network_address},
            {"broadcast_address", net.broadcast_address},
            {"interface_name", net.interface_name},
            {"prefix_length", net.prefix_length},
            {"scan_range_size", net.scan_range.size()},
        };

        nlohmann::json statistics = {
            {"total_addresses_scanned", stats.total_addresses_scanned},
            {"devices_found", stats.devices_found},
            {"device_types", stats.device_types},
            {"scan_times", stats.scan_times},
            {"errors_encountered", stats.errors_encountered},
        };

        // DeviceMap iterates in numeric IP order already.
        nlohmann::json devices = nlohmann::json::array();
        for (const auto &pair : result.devices)
            devices.push_back(DeviceToJson(pair.second));

        return {
            {"scan_metadata", metadata},
            {"network_info", network_info},
            {"scan_statistics", statistics},
            {"phases", {{"arp", PhaseToJson(result.arp)},
                        {"portscan", PhaseToJson(result.port_scan)},
                        {"snmp", PhaseToJson(result.snmp)}}},
            {"devices", devices},
        };
    }

    std::string JsonReportWriter::BaseFilename(std::chrono::system_clock::time_point time)
    {
        std::time_t raw = std::chrono::system_clock::to_time_t(time);
        std::tm local{};
        localtime_r(&raw, &local);

        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local);
        return std::string("network_discovery_") + buffer;
    }

    std::optional<std::string> JsonReportWriter::Write(const common::CompleteScanResult &result,
                                                       const std::string &directory) const
    {
        namespace fs = std::filesystem;

        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec)
        {
            std::cerr << "[Report] Cannot create " << directory << ": " << ec.message() << "\n";
            return std::nullopt;
        }

        const std::string base = BaseFilename(result.started_at);
        fs::path path = fs::path(directory) / (base + ".json");
        for (int counter = 1; fs::exists(path); ++counter)
        {
            if (counter > MAX_COLLISIONS)
            {
                std::cerr << "[Report] Too many reports named " << base << " in " << directory << "\n";
                return std::nullopt;
            }
            char suffix[8];
            std::snprintf(suffix, sizeof(suffix), "_%03d", counter);
            path = fs::path(directory) / (base + suffix + ".json");
        }

        // Tool output is not guaranteed to be UTF-8; bad bytes become U+FFFD.
        const std::string document = ToJson(result).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

        std::ofstream out(path);
        if (!out.is_open())
        {
            std::cerr << "[Report] Cannot open " << path.string() << " for writing\n";
            return std::nullopt;
        }

        out << document << "\n";
        if (!out.good())
        {
            std::cerr << "[Report] Write to " << path.string() << " failed\n";
            return std::nullopt;
        }

        std::cout << "[Report] Wrote " << path.string() << "\n";
        return path.string();
    }
}
