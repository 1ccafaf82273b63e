#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "../common/ScanConfig.hpp"
#include "../common/Types.hpp"

namespace net_discovery::report
{
    class JsonReportWriter
    {
    public:
        explicit JsonReportWriter(common::DiscoveryConfig config);

        nlohmann::json ToJson(const common::CompleteScanResult &result) const;

        // Returns the written path, or nullopt if the file could not be created.
        std::optional<std::string> Write(const common::CompleteScanResult &result, const std::string &directory) const;

        static std::string BaseFilename(std::chrono::system_clock::time_point time);

    private:
        nlohmann::json ConfigurationSummary() const;

        common::DiscoveryConfig m_config;
    };

    nlohmann::json DeviceToJson(const common::DeviceRecord &device);
    nlohmann::json PhaseToJson(const common::PhaseResult &phase);
}
