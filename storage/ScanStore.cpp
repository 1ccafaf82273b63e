#include "ScanStore.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <openssl/rand.h>
#include <set>
#include <sstream>

namespace net_discovery::storage
{
    namespace
    {
        void BindOptional(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value)
        {
            if (value)
                sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
            else
                sqlite3_bind_null(stmt, index);
        }

        std::optional<std::string> ColumnText(sqlite3_stmt *stmt, int column)
        {
            const unsigned char *text = sqlite3_column_text(stmt, column);
            if (!text)
                return std::nullopt;
            return std::string(reinterpret_cast<const char *>(text));
        }

        common::DeviceType ParseDeviceType(const std::string &name)
        {
            for (auto type : {common::DeviceType::IoT, common::DeviceType::Windows, common::DeviceType::Linux,
                              common::DeviceType::NetworkEquipment})
            {
                if (common::ToString(type) == name)
                    return type;
            }
            return common::DeviceType::Unknown;
        }

        // Values come from tool output and may not be valid UTF-8.
        std::string DumpText(const nlohmann::json &value)
        {
            return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        std::string PortsToText(const std::set<int> &ports)
        {
            std::string text;
            for (int port : ports)
            {
                if (!text.empty())
                    text += ",";
                text += std::to_string(port);
            }
            return text;
        }

        std::set<int> PortsFromText(const std::string &text)
        {
            std::set<int> ports;
            std::stringstream ss(text);
            std::string item;
            while (std::getline(ss, item, ','))
            {
                if (!item.empty())
                    ports.insert(std::stoi(item));
            }
            return ports;
        }
    }

    std::optional<std::string> GenerateScanId()
    {
        unsigned char bytes[16];
        if (RAND_bytes(bytes, sizeof(bytes)) != 1)
            return std::nullopt;

        std::ostringstream ss;
        for (unsigned char b : bytes)
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
        return ss.str();
    }

    ScanStore::ScanStore() : m_db(nullptr), m_stmt_insert_device(nullptr) {}

    ScanStore::~ScanStore()
    {
        Shutdown();
    }

    bool ScanStore::Initialize(const std::string &db_path)
    {
        std::lock_guard<std::mutex> lock(m_db_mutex);

        if (sqlite3_open(db_path.c_str(), &m_db) != SQLITE_OK)
        {
            std::cerr << "[DB] Open failed: " << sqlite3_errmsg(m_db) << std::endl;
            sqlite3_close(m_db);
            m_db = nullptr;
            return false;
        }

        sqlite3_exec(m_db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        sqlite3_exec(m_db, "PRAGMA foreign_keys = ON;", nullptr, nullptr, nullptr);

        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS scans ("
            "id TEXT PRIMARY KEY, "
            "started_at TEXT NOT NULL, "
            "duration_ms INTEGER NOT NULL, "
            "status TEXT NOT NULL, "
            "network TEXT, "
            "interface TEXT, "
            "host_ip TEXT, "
            "total_addresses INTEGER DEFAULT 0, "
            "device_count INTEGER DEFAULT 0, "
            "cancelled INTEGER DEFAULT 0, "
            "abort_reason TEXT"
            ");"

            "CREATE TABLE IF NOT EXISTS devices ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "scan_id TEXT NOT NULL, "
            "ip_address TEXT NOT NULL, "
            "mac_address TEXT, "
            "hostname TEXT, "
            "os_info TEXT, "
            "device_type TEXT NOT NULL, "
            "manufacturer TEXT, "
            "model TEXT, "
            "open_ports TEXT DEFAULT '', "
            "services TEXT DEFAULT '{}', "
            "snmp_data TEXT, "
            "UNIQUE(scan_id, ip_address), "
            "FOREIGN KEY(scan_id) REFERENCES scans(id) ON DELETE CASCADE"
            ");";

        char *err_msg = nullptr;
        if (sqlite3_exec(m_db, sql_tables, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[DB] Schema error: " << err_msg << std::endl;
            sqlite3_free(err_msg);
            return false;
        }

        const char *sql_insert_device =
            "INSERT INTO devices (scan_id, ip_address, mac_address, hostname, os_info, device_type, "
            "manufacturer, model, open_ports, services, snmp_data) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
        if (sqlite3_prepare_v2(m_db, sql_insert_device, -1, &m_stmt_insert_device, nullptr) != SQLITE_OK)
        {
            std::cerr << "[DB] Prepare failed: " << sqlite3_errmsg(m_db) << std::endl;
            return false;
        }
        return true;
    }

    void ScanStore::Shutdown()
    {
        std::lock_guard<std::mutex> lock(m_db_mutex);
        if (m_stmt_insert_device)
        {
            sqlite3_finalize(m_stmt_insert_device);
            m_stmt_insert_device = nullptr;
        }
        if (m_db)
        {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    bool ScanStore::InsertDevice(const std::string &scan_id, const common::DeviceRecord &device)
    {
        sqlite3_stmt *stmt = m_stmt_insert_device;
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);

        nlohmann::json services = nlohmann::json::object();
        for (const auto &pair : device.services)
            services[std::to_string(pair.first)] = pair.second;

        std::optional<std::string> snmp;
        if (device.snmp_data)
            snmp = DumpText(nlohmann::json(*device.snmp_data));

        sqlite3_bind_text(stmt, 1, scan_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, device.ip_address.c_str(), -1, SQLITE_TRANSIENT);
        BindOptional(stmt, 3, device.mac_address);
        BindOptional(stmt, 4, device.hostname);
        BindOptional(stmt, 5, device.os_info);
        sqlite3_bind_text(stmt, 6, common::ToString(device.device_type).c_str(), -1, SQLITE_TRANSIENT);
        BindOptional(stmt, 7, device.manufacturer);
        BindOptional(stmt, 8, device.model);
        sqlite3_bind_text(stmt, 9, PortsToText(device.open_ports).c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 10, DumpText(services).c_str(), -1, SQLITE_TRANSIENT);
        BindOptional(stmt, 11, snmp);

        if (sqlite3_step(stmt) != SQLITE_DONE)
        {
            std::cerr << "[DB] Insert device " << device.ip_address << " failed: " << sqlite3_errmsg(m_db) << std::endl;
            return false;
        }
        return true;
    }

    std::optional<std::string> ScanStore::SaveScan(const common::CompleteScanResult &result)
    {
        std::lock_guard<std::mutex> lock(m_db_mutex);
        if (!m_db || !m_stmt_insert_device)
            return std::nullopt;

        auto scan_id = GenerateScanId();
        if (!scan_id)
        {
            std::cerr << "[DB] OpenSSL RNG failed.\n";
            return std::nullopt;
        }

        if (sqlite3_exec(m_db, "BEGIN;", nullptr, nullptr, nullptr) != SQLITE_OK)
            return std::nullopt;

        const char *sql =
            "INSERT INTO scans (id, started_at, duration_ms, status, network, interface, host_ip, "
            "total_addresses, device_count, cancelled, abort_reason) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
            return std::nullopt;
        }

        const auto &net = result.network_info;
        std::string network = net.network_address.empty() ? "" : net.network_address + "/" + std::to_string(net.prefix_length);

        sqlite3_bind_text(stmt, 1, scan_id->c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, common::FormatTimestamp(result.started_at).c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(result.duration.count()));
        sqlite3_bind_text(stmt, 4, common::ToString(result.status).c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, network.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, net.interface_name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 7, net.host_ip.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(net.scan_range.size()));
        sqlite3_bind_int(stmt, 9, static_cast<int>(result.devices.size()));
        sqlite3_bind_int(stmt, 10, result.cancelled ? 1 : 0);
        BindOptional(stmt, 11, result.abort_reason);

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);

        try
        {
            for (const auto &pair : result.devices)
            {
                if (!success)
                    break;
                success = InsertDevice(*scan_id, pair.second);
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[DB] Encoding device row failed: " << e.what() << std::endl;
            success = false;
        }

        if (!success)
        {
            std::cerr << "[DB] Saving scan failed: " << sqlite3_errmsg(m_db) << std::endl;
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
            return std::nullopt;
        }

        if (sqlite3_exec(m_db, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
        {
            std::cerr << "[DB] Commit failed: " << sqlite3_errmsg(m_db) << std::endl;
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
            return std::nullopt;
        }

        std::cout << "[DB] Saved scan " << *scan_id << " with " << result.devices.size() << " devices\n";
        return scan_id;
    }

    std::vector<StoredScan> ScanStore::ListScans()
    {
        std::lock_guard<std::mutex> lock(m_db_mutex);
        std::vector<StoredScan> scans;
        if (!m_db)
            return scans;

        const char *sql =
            "SELECT id, started_at, status, network, interface, duration_ms, device_count, cancelled, abort_reason "
            "FROM scans ORDER BY started_at DESC, rowid DESC;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return scans;

        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            StoredScan scan;
            scan.id = ColumnText(stmt, 0).value_or("");
            scan.started_at = ColumnText(stmt, 1).value_or("");
            scan.status = ColumnText(stmt, 2).value_or("");
            scan.network = ColumnText(stmt, 3).value_or("");
            scan.interface_name = ColumnText(stmt, 4).value_or("");
            scan.duration_ms = sqlite3_column_int64(stmt, 5);
            scan.device_count = sqlite3_column_int(stmt, 6);
            scan.cancelled = sqlite3_column_int(stmt, 7) != 0;
            scan.abort_reason = ColumnText(stmt, 8);
            scans.push_back(std::move(scan));
        }
        sqlite3_finalize(stmt);
        return scans;
    }

    std::vector<common::DeviceRecord> ScanStore::GetDevicesForScan(const std::string &scan_id)
    {
        std::lock_guard<std::mutex> lock(m_db_mutex);
        std::vector<common::DeviceRecord> devices;
        if (!m_db)
            return devices;

        const char *sql =
            "SELECT ip_address, mac_address, hostname, os_info, device_type, manufacturer, model, "
            "open_ports, services, snmp_data FROM devices WHERE scan_id = ?;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return devices;

        sqlite3_bind_text(stmt, 1, scan_id.c_str(), -1, SQLITE_TRANSIENT);

        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            common::DeviceRecord device;
            device.ip_address = ColumnText(stmt, 0).value_or("");
            device.mac_address = ColumnText(stmt, 1);
            device.hostname = ColumnText(stmt, 2);
            device.os_info = ColumnText(stmt, 3);
            device.device_type = ParseDeviceType(ColumnText(stmt, 4).value_or(""));
            device.manufacturer = ColumnText(stmt, 5);
            device.model = ColumnText(stmt, 6);

            try
            {
                device.open_ports = PortsFromText(ColumnText(stmt, 7).value_or(""));

                auto services = nlohmann::json::parse(ColumnText(stmt, 8).value_or("{}"));
                for (auto it = services.begin(); it != services.end(); ++it)
                    device.services[std::stoi(it.key())] = it.value().get<std::string>();

                if (auto snmp = ColumnText(stmt, 9))
                    device.snmp_data = nlohmann::json::parse(*snmp).get<common::SnmpData>();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[DB] Corrupt device row for " << device.ip_address << ": " << e.what() << std::endl;
            }

            devices.push_back(std::move(device));
        }
        sqlite3_finalize(stmt);

        std::sort(devices.begin(), devices.end(), [](const common::DeviceRecord &a, const common::DeviceRecord &b)
                  { return common::IpLess{}(a.ip_address, b.ip_address); });
        return devices;
    }
}
