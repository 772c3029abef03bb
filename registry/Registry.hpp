#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../common/DeviceRecord.hpp"

namespace lanwatch::registry
{
    enum class EventKind
    {
        Added,
        StatusChanged,
        Unchanged
    };

    struct RegistryEvent
    {
        EventKind kind = EventKind::Unchanged;
        std::string address;
        common::DeviceStatus old_status = common::DeviceStatus::Offline;
        common::DeviceStatus new_status = common::DeviceStatus::Offline;
        common::DeviceRecord record;
    };

    const char *ToString(EventKind kind);

    // Dashboard summary: totals and a count per device type.
    struct RegistryStats
    {
        size_t total = 0;
        size_t online = 0;
        size_t offline = 0;
        std::map<common::DeviceType, size_t> by_type;
    };

    nlohmann::json ToJson(const RegistryStats &stats);

    using Snapshot = std::map<std::string, common::DeviceRecord>;

    // Authoritative address -> DeviceRecord store. Every mutation takes the
    // one lock and reports what happened. Nothing in here deletes a record
    // except Remove().
    class Registry
    {
    public:
        Registry() = default;

        Registry(const Registry &) = delete;
        Registry &operator=(const Registry &) = delete;

        RegistryEvent Apply(const common::DeviceRecord &record);

        // Status (and for MarkOnline last_seen) only; nullopt for unknown
        // addresses. Neither ever re-creates a removed record.
        std::optional<RegistryEvent> MarkOnline(const std::string &address, common::Clock::time_point seen);
        std::optional<RegistryEvent> MarkOffline(const std::string &address);

        bool Remove(const std::string &address);

        // Replaces the whole content without producing events.
        void Restore(const std::vector<common::DeviceRecord> &records);

        Snapshot GetSnapshot() const;
        std::optional<common::DeviceRecord> Get(const std::string &address) const;
        std::vector<common::DeviceRecord> List() const;
        std::vector<std::string> Addresses() const;
        bool Contains(const std::string &address) const;
        size_t Size() const;
        RegistryStats Stats() const;

        bool SaveSnapshot(const std::string &path) const;

        // Missing file leaves the registry empty and succeeds.
        bool LoadSnapshot(const std::string &path);

    private:
        mutable std::mutex m_mutex;
        std::map<std::string, common::DeviceRecord> m_devices;
    };
}
