#include "SnapshotStore.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

namespace lanwatch::registry
{
    namespace
    {
        std::string ColumnText(sqlite3_stmt *stmt, int col)
        {
            const unsigned char *text = sqlite3_column_text(stmt, col);
            return text ? reinterpret_cast<const char *>(text) : "";
        }

        sqlite3_int64 ToNanos(common::Clock::time_point tp)
        {
            return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
        }

        common::Clock::time_point FromNanos(sqlite3_int64 nanos)
        {
            return common::Clock::time_point(
                std::chrono::duration_cast<common::Clock::duration>(std::chrono::nanoseconds(nanos)));
        }
    }

    SnapshotStore::SnapshotStore(std::string path) : m_path(std::move(path)), m_db(nullptr) {}

    SnapshotStore::~SnapshotStore()
    {
        Close();
    }

    bool SnapshotStore::Open(int flags)
    {
        Close();
        if (sqlite3_open_v2(m_path.c_str(), &m_db, flags, nullptr) != SQLITE_OK)
        {
            std::cerr << "[SnapshotStore] Open failed: " << sqlite3_errmsg(m_db) << std::endl;
            Close();
            return false;
        }
        return true;
    }

    void SnapshotStore::Close()
    {
        if (m_db)
        {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    bool SnapshotStore::Exec(const char *sql)
    {
        char *err_msg = nullptr;
        if (sqlite3_exec(m_db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK)
        {
            std::cerr << "[SnapshotStore] SQL error: " << (err_msg ? err_msg : "unknown") << std::endl;
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    bool SnapshotStore::CreateSchema()
    {
        const char *sql_tables =
            "CREATE TABLE IF NOT EXISTS devices ("
            "address TEXT PRIMARY KEY, "
            "hostname TEXT NOT NULL DEFAULT '', "
            "mac_address TEXT NOT NULL DEFAULT '', "
            "os_guess TEXT NOT NULL DEFAULT '', "
            "device_type TEXT NOT NULL DEFAULT 'unknown', "
            "status TEXT NOT NULL DEFAULT 'offline', "
            "last_seen INTEGER NOT NULL DEFAULT 0"
            ");"

            "CREATE TABLE IF NOT EXISTS device_ports ("
            "address TEXT NOT NULL, "
            "port INTEGER NOT NULL, "
            "PRIMARY KEY(address, port), "
            "FOREIGN KEY(address) REFERENCES devices(address) ON DELETE CASCADE"
            ");"

            "CREATE TABLE IF NOT EXISTS device_services ("
            "address TEXT NOT NULL, "
            "port INTEGER NOT NULL, "
            "name TEXT NOT NULL DEFAULT '', "
            "product TEXT NOT NULL DEFAULT '', "
            "version TEXT NOT NULL DEFAULT '', "
            "PRIMARY KEY(address, port), "
            "FOREIGN KEY(address) REFERENCES devices(address) ON DELETE CASCADE"
            ");";

        return Exec("PRAGMA foreign_keys = ON;") && Exec(sql_tables);
    }

    bool SnapshotStore::InsertRecord(const common::DeviceRecord &record)
    {
        const char *sql =
            "INSERT INTO devices (address, hostname, mac_address, os_guess, device_type, status, last_seen) "
            "VALUES (?, ?, ?, ?, ?, ?, ?);";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        std::string type = common::ToString(record.device_type);
        std::string status = common::ToString(record.status);
        sqlite3_bind_text(stmt, 1, record.address.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, record.hostname.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, record.mac_address.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, record.os_guess.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 5, type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, status.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 7, ToNanos(record.last_seen));

        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        if (!success)
            return false;

        const char *sql_port = "INSERT INTO device_ports (address, port) VALUES (?, ?);";
        if (sqlite3_prepare_v2(m_db, sql_port, -1, &stmt, nullptr) != SQLITE_OK)
            return false;
        for (int port : record.open_ports)
        {
            sqlite3_reset(stmt);
            sqlite3_bind_text(stmt, 1, record.address.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 2, port);
            if (sqlite3_step(stmt) != SQLITE_DONE)
            {
                success = false;
                break;
            }
        }
        sqlite3_finalize(stmt);
        if (!success)
            return false;

        const char *sql_service =
            "INSERT INTO device_services (address, port, name, product, version) VALUES (?, ?, ?, ?, ?);";
        if (sqlite3_prepare_v2(m_db, sql_service, -1, &stmt, nullptr) != SQLITE_OK)
            return false;
        for (const auto &[port, info] : record.services)
        {
            sqlite3_reset(stmt);
            sqlite3_bind_text(stmt, 1, record.address.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(stmt, 2, port);
            sqlite3_bind_text(stmt, 3, info.name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 4, info.product.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 5, info.version.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(stmt) != SQLITE_DONE)
            {
                success = false;
                break;
            }
        }
        sqlite3_finalize(stmt);
        return success;
    }

    bool SnapshotStore::Save(const std::vector<common::DeviceRecord> &records)
    {
        if (!Open(SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE))
            return false;

        if (!CreateSchema() || !Exec("BEGIN TRANSACTION;"))
        {
            Close();
            return false;
        }

        bool success = Exec("DELETE FROM device_services; DELETE FROM device_ports; DELETE FROM devices;");
        for (const auto &record : records)
        {
            if (!success)
                break;
            success = InsertRecord(record);
            if (!success)
                std::cerr << "[SnapshotStore] Insert failed for " << record.address << ": "
                          << sqlite3_errmsg(m_db) << std::endl;
        }

        if (success)
            success = Exec("COMMIT;");
        else if (!Exec("ROLLBACK;"))
            std::cerr << "[SnapshotStore] Rollback failed for " << m_path << std::endl;
        Close();
        return success;
    }

    bool SnapshotStore::LoadPorts(std::map<std::string, common::DeviceRecord> &records)
    {
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, "SELECT address, port FROM device_ports;", -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            auto it = records.find(ColumnText(stmt, 0));
            if (it != records.end())
                it->second.open_ports.insert(sqlite3_column_int(stmt, 1));
        }
        sqlite3_finalize(stmt);
        return rc == SQLITE_DONE;
    }

    bool SnapshotStore::LoadServices(std::map<std::string, common::DeviceRecord> &records)
    {
        const char *sql = "SELECT address, port, name, product, version FROM device_services;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK)
            return false;

        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            auto it = records.find(ColumnText(stmt, 0));
            if (it == records.end())
                continue;

            common::ServiceInfo info;
            info.name = ColumnText(stmt, 2);
            info.product = ColumnText(stmt, 3);
            info.version = ColumnText(stmt, 4);
            it->second.services[sqlite3_column_int(stmt, 1)] = info;
        }
        sqlite3_finalize(stmt);
        return rc == SQLITE_DONE;
    }

    std::optional<std::vector<common::DeviceRecord>> SnapshotStore::Load()
    {
        std::error_code ec;
        if (!std::filesystem::exists(m_path, ec))
        {
            std::cout << "[SnapshotStore] " << m_path << " not found, starting empty.\n";
            return std::vector<common::DeviceRecord>{};
        }

        if (!Open(SQLITE_OPEN_READONLY))
            return std::nullopt;

        const char *sql =
            "SELECT address, hostname, mac_address, os_guess, device_type, status, last_seen FROM devices;";
        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK)
        {
            std::cerr << "[SnapshotStore] Unreadable snapshot " << m_path << ": " << sqlite3_errmsg(m_db) << std::endl;
            Close();
            return std::nullopt;
        }

        std::map<std::string, common::DeviceRecord> records;
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            common::DeviceRecord record;
            record.address = ColumnText(stmt, 0);
            record.hostname = ColumnText(stmt, 1);
            record.mac_address = ColumnText(stmt, 2);
            record.os_guess = ColumnText(stmt, 3);
            record.device_type = common::DeviceTypeFromString(ColumnText(stmt, 4)).value_or(common::DeviceType::Unknown);
            record.status = common::DeviceStatusFromString(ColumnText(stmt, 5)).value_or(common::DeviceStatus::Offline);
            record.last_seen = FromNanos(sqlite3_column_int64(stmt, 6));
            records[record.address] = record;
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE || !LoadPorts(records) || !LoadServices(records))
        {
            std::cerr << "[SnapshotStore] Corrupt snapshot " << m_path << ": " << sqlite3_errmsg(m_db) << std::endl;
            Close();
            return std::nullopt;
        }
        Close();

        std::vector<common::DeviceRecord> result;
        result.reserve(records.size());
        for (auto &pair : records)
            result.push_back(std::move(pair.second));
        return result;
    }
}
