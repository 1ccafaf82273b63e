#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "../common/Types.hpp"

namespace net_discovery::storage
{
    struct StoredScan
    {
        std::string id;
        std::string started_at;
        std::string status;
        std::string network;
        std::string interface_name;
        long long duration_ms = 0;
        int device_count = 0;
        bool cancelled = false;
        std::optional<std::string> abort_reason;
    };

    class ScanStore
    {
    public:
        ScanStore();
        ~ScanStore();

        ScanStore(const ScanStore &) = delete;
        ScanStore &operator=(const ScanStore &) = delete;

        bool Initialize(const std::string &db_path);
        void Shutdown();

        // Returns the new scan id, or nullopt if nothing was written.
        std::optional<std::string> SaveScan(const common::CompleteScanResult &result);

        std::vector<StoredScan> ListScans();
        std::vector<common::DeviceRecord> GetDevicesForScan(const std::string &scan_id);

    private:
        bool InsertDevice(const std::string &scan_id, const common::DeviceRecord &device);

        sqlite3 *m_db;
        sqlite3_stmt *m_stmt_insert_device;
        std::mutex m_db_mutex;
    };

    // 32 hex characters from OpenSSL's RNG; nullopt if the RNG fails.
    std::optional<std::string> GenerateScanId();
}
