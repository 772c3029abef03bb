#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "../common/DeviceRecord.hpp"

namespace lanwatch::registry
{
    // SQLite file holding the registry content, one row per address plus
    // per-port rows for open ports and identified services.
    class SnapshotStore
    {
    public:
        explicit SnapshotStore(std::string path);
        ~SnapshotStore();

        SnapshotStore(const SnapshotStore &) = delete;
        SnapshotStore &operator=(const SnapshotStore &) = delete;

        // Replaces the stored content in one transaction.
        bool Save(const std::vector<common::DeviceRecord> &records);

        // Missing file: empty set. Unreadable or corrupt file: nullopt.
        std::optional<std::vector<common::DeviceRecord>> Load();

    private:
        bool Open(int flags);
        void Close();
        bool CreateSchema();
        bool Exec(const char *sql);

        bool InsertRecord(const common::DeviceRecord &record);
        bool LoadPorts(std::map<std::string, common::DeviceRecord> &records);
        bool LoadServices(std::map<std::string, common::DeviceRecord> &records);

        std::string m_path;
        sqlite3 *m_db;
    };
}
