#include "Registry.hpp"
#include "SnapshotStore.hpp"
#include <iostream>

namespace lanwatch::registry
{
    const char *ToString(EventKind kind)
    {
        switch (kind)
        {
        case EventKind::Added:
            return "added";
        case EventKind::StatusChanged:
            return "status_changed";
        case EventKind::Unchanged:
            break;
        }
        return "unchanged";
    }

    nlohmann::json ToJson(const RegistryStats &stats)
    {
        nlohmann::json types = nlohmann::json::object();
        for (const auto &[type, count] : stats.by_type)
            types[common::ToString(type)] = count;

        return {
            {"total_devices", stats.total},
            {"online_devices", stats.online},
            {"offline_devices", stats.offline},
            {"device_types", types}};
    }

    RegistryEvent Registry::Apply(const common::DeviceRecord &record)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        RegistryEvent event;
        event.address = record.address;
        event.new_status = record.status;

        auto it = m_devices.find(record.address);
        if (it == m_devices.end())
        {
            event.kind = EventKind::Added;
            event.old_status = record.status;
            it = m_devices.emplace(record.address, record).first;
        }
        else
        {
            event.old_status = it->second.status;
            event.kind = event.old_status != event.new_status ? EventKind::StatusChanged : EventKind::Unchanged;
            it->second = record;
        }

        event.record = it->second;
        return event;
    }

    std::optional<RegistryEvent> Registry::MarkOnline(const std::string &address, common::Clock::time_point seen)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_devices.find(address);
        if (it == m_devices.end())
            return std::nullopt;

        RegistryEvent event;
        event.address = address;
        event.old_status = it->second.status;
        event.new_status = common::DeviceStatus::Online;
        event.kind = event.old_status == common::DeviceStatus::Offline ? EventKind::StatusChanged : EventKind::Unchanged;

        it->second.status = common::DeviceStatus::Online;
        it->second.last_seen = seen;
        event.record = it->second;
        return event;
    }

    std::optional<RegistryEvent> Registry::MarkOffline(const std::string &address)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_devices.find(address);
        if (it == m_devices.end())
            return std::nullopt;

        RegistryEvent event;
        event.address = address;
        event.old_status = it->second.status;
        event.new_status = common::DeviceStatus::Offline;
        event.kind = event.old_status == common::DeviceStatus::Online ? EventKind::StatusChanged : EventKind::Unchanged;

        it->second.status = common::DeviceStatus::Offline;
        event.record = it->second;
        return event;
    }

    bool Registry::Remove(const std::string &address)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices.erase(address) > 0;
    }

    void Registry::Restore(const std::vector<common::DeviceRecord> &records)
    {
        std::map<std::string, common::DeviceRecord> restored;
        for (const auto &record : records)
            restored[record.address] = record;

        std::lock_guard<std::mutex> lock(m_mutex);
        m_devices.swap(restored);
    }

    Snapshot Registry::GetSnapshot() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices;
    }

    std::optional<common::DeviceRecord> Registry::Get(const std::string &address) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_devices.find(address);
        if (it == m_devices.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<common::DeviceRecord> Registry::List() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<common::DeviceRecord> records;
        records.reserve(m_devices.size());
        for (const auto &pair : m_devices)
            records.push_back(pair.second);
        return records;
    }

    std::vector<std::string> Registry::Addresses() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::string> addresses;
        addresses.reserve(m_devices.size());
        for (const auto &pair : m_devices)
            addresses.push_back(pair.first);
        return addresses;
    }

    bool Registry::Contains(const std::string &address) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices.count(address) > 0;
    }

    size_t Registry::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices.size();
    }

    RegistryStats Registry::Stats() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        RegistryStats stats;
        stats.total = m_devices.size();
        for (const auto &pair : m_devices)
        {
            if (pair.second.status == common::DeviceStatus::Online)
                ++stats.online;
            else
                ++stats.offline;
            ++stats.by_type[pair.second.device_type];
        }
        return stats;
    }

    bool Registry::SaveSnapshot(const std::string &path) const
    {
        std::vector<common::DeviceRecord> records = List();
        SnapshotStore store(path);
        if (!store.Save(records))
            return false;

        std::cout << "[Registry] Saved " << records.size() << " devices to " << path << "\n";
        return true;
    }

    bool Registry::LoadSnapshot(const std::string &path)
    {
        SnapshotStore store(path);
        auto records = store.Load();
        if (!records)
            return false;

        Restore(*records);
        std::cout << "[Registry] Loaded " << records->size() << " devices from " << path << "\n";
        return true;
    }
}
