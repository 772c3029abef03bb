#include "../registry/Registry.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace lanwatch;
using registry::EventKind;

namespace
{
    common::DeviceRecord OnlineDevice(const std::string &address)
    {
        common::DeviceRecord record;
        record.address = address;
        record.open_ports = {80};
        record.device_type = common::DeviceType::IotDevice;
        record.status = common::DeviceStatus::Online;
        record.last_seen = common::Clock::now();
        return record;
    }
}

TEST(RegistryTest, FirstApplyAdds)
{
    registry::Registry registry;
    auto event = registry.Apply(OnlineDevice("10.0.0.5"));

    EXPECT_EQ(event.kind, EventKind::Added);
    EXPECT_EQ(event.address, "10.0.0.5");
    EXPECT_EQ(event.record.address, "10.0.0.5");
    EXPECT_TRUE(registry.Contains("10.0.0.5"));
    EXPECT_EQ(registry.Size(), 1u);
}

TEST(RegistryTest, ReapplyingSameRecordIsNoOp)
{
    registry::Registry registry;
    auto record = OnlineDevice("10.0.0.5");

    registry.Apply(record);
    auto second = registry.Apply(record);

    EXPECT_EQ(second.kind, EventKind::Unchanged);
    EXPECT_EQ(registry.Size(), 1u);
    EXPECT_EQ(*registry.Get("10.0.0.5"), record);
}

TEST(RegistryTest, StatusFlipReported)
{
    registry::Registry registry;
    auto record = OnlineDevice("10.0.0.5");
    registry.Apply(record);

    record.status = common::DeviceStatus::Offline;
    auto down = registry.Apply(record);
    EXPECT_EQ(down.kind, EventKind::StatusChanged);
    EXPECT_EQ(down.old_status, common::DeviceStatus::Online);
    EXPECT_EQ(down.new_status, common::DeviceStatus::Offline);

    record.status = common::DeviceStatus::Online;
    auto up = registry.Apply(record);
    EXPECT_EQ(up.kind, EventKind::StatusChanged);
    EXPECT_EQ(up.new_status, common::DeviceStatus::Online);
}

TEST(RegistryTest, ApplyRefreshesLastSeen)
{
    registry::Registry registry;
    auto record = OnlineDevice("10.0.0.5");
    registry.Apply(record);

    record.last_seen += std::chrono::seconds(30);
    EXPECT_EQ(registry.Apply(record).kind, EventKind::Unchanged);
    EXPECT_EQ(registry.Get("10.0.0.5")->last_seen, record.last_seen);
}

TEST(RegistryTest, MarkOfflineFlipsOnceAndKeepsFields)
{
    registry::Registry registry;
    auto record = OnlineDevice("10.0.0.5");
    record.hostname = "camera";
    registry.Apply(record);

    auto first = registry.MarkOffline("10.0.0.5");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->kind, EventKind::StatusChanged);

    auto second = registry.MarkOffline("10.0.0.5");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->kind, EventKind::Unchanged);

    auto stored = registry.Get("10.0.0.5");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, common::DeviceStatus::Offline);
    EXPECT_EQ(stored->hostname, "camera");
    EXPECT_EQ(stored->last_seen, record.last_seen);

    EXPECT_FALSE(registry.MarkOffline("10.0.0.99").has_value());
}

TEST(RegistryTest, SnapshotIsACopy)
{
    registry::Registry registry;
    registry.Apply(OnlineDevice("10.0.0.5"));

    registry::Snapshot snapshot = registry.GetSnapshot();
    registry.MarkOffline("10.0.0.5");
    registry.Apply(OnlineDevice("10.0.0.6"));

    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot.at("10.0.0.5").status, common::DeviceStatus::Online);
}

TEST(RegistryTest, RemoveIsExplicit)
{
    registry::Registry registry;
    registry.Apply(OnlineDevice("10.0.0.5"));

    EXPECT_TRUE(registry.Remove("10.0.0.5"));
    EXPECT_FALSE(registry.Remove("10.0.0.5"));
    EXPECT_FALSE(registry.Get("10.0.0.5").has_value());
}

TEST(RegistryTest, ConcurrentAppliesForDifferentAddresses)
{
    registry::Registry registry;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back([&registry, t]()
                             {
            for (int i = 0; i < 50; ++i)
                registry.Apply(OnlineDevice("10." + std::to_string(t) + ".0." + std::to_string(i))); });
    }
    for (auto &thread : threads)
        thread.join();

    EXPECT_EQ(registry.Size(), 400u);
    EXPECT_EQ(registry.List().size(), 400u);
    EXPECT_EQ(registry.Addresses().size(), 400u);
}

TEST(RegistryTest, ToJsonUsesDashboardKeys)
{
    auto record = OnlineDevice("10.0.0.5");
    record.services[80] = {"http", "lighttpd", "1.4"};
    auto json = common::ToJson(record);

    EXPECT_EQ(json["ip"], "10.0.0.5");
    EXPECT_EQ(json["device_type"], "iot_device");
    EXPECT_EQ(json["status"], "online");
    EXPECT_EQ(json["open_ports"][0], 80);
    EXPECT_EQ(json["services"]["80"]["product"], "lighttpd");
    EXPECT_FALSE(json["last_seen"].get<std::string>().empty());
}

TEST(RegistryTest, MarkOnlineTouchesOnlyStatusAndLastSeen)
{
    registry::Registry registry;
    auto record = OnlineDevice("10.0.0.5");
    record.hostname = "camera";
    record.services[80] = {"http", "lighttpd", "1.4"};
    record.status = common::DeviceStatus::Offline;
    registry.Apply(record);

    auto seen = record.last_seen + std::chrono::seconds(60);
    auto up = registry.MarkOnline("10.0.0.5", seen);
    ASSERT_TRUE(up.has_value());
    EXPECT_EQ(up->kind, EventKind::StatusChanged);
    EXPECT_EQ(up->old_status, common::DeviceStatus::Offline);
    EXPECT_EQ(up->new_status, common::DeviceStatus::Online);

    auto stored = registry.Get("10.0.0.5");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, common::DeviceStatus::Online);
    EXPECT_EQ(stored->last_seen, seen);
    EXPECT_EQ(stored->hostname, "camera");
    EXPECT_EQ(stored->services, record.services);

    auto again = registry.MarkOnline("10.0.0.5", seen);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->kind, EventKind::Unchanged);
}

TEST(RegistryTest, MarkOnlineNeverResurrectsRemovedDevice)
{
    registry::Registry registry;
    registry.Apply(OnlineDevice("10.0.0.5"));
    ASSERT_TRUE(registry.Remove("10.0.0.5"));

    EXPECT_FALSE(registry.MarkOnline("10.0.0.5", common::Clock::now()).has_value());
    EXPECT_FALSE(registry.Contains("10.0.0.5"));
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(RegistryTest, MarkOnlineKeepsNewerFingerprint)
{
    registry::Registry registry;
    registry.Apply(OnlineDevice("10.0.0.5"));

    auto refreshed = OnlineDevice("10.0.0.5");
    refreshed.open_ports = {22, 80};
    refreshed.device_type = common::DeviceType::Server;
    registry.Apply(refreshed);

    registry.MarkOnline("10.0.0.5", common::Clock::now());
    auto stored = registry.Get("10.0.0.5");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->open_ports, (std::set<int>{22, 80}));
    EXPECT_EQ(stored->device_type, common::DeviceType::Server);
}

TEST(RegistryTest, StatsCountStatusAndType)
{
    registry::Registry registry;
    registry.Apply(OnlineDevice("10.0.0.1"));
    registry.Apply(OnlineDevice("10.0.0.2"));
    auto printer = OnlineDevice("10.0.0.3");
    printer.device_type = common::DeviceType::Printer;
    registry.Apply(printer);
    registry.MarkOffline("10.0.0.2");

    registry::RegistryStats stats = registry.Stats();
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.online, 2u);
    EXPECT_EQ(stats.offline, 1u);
    EXPECT_EQ(stats.by_type.at(common::DeviceType::IotDevice), 2u);
    EXPECT_EQ(stats.by_type.at(common::DeviceType::Printer), 1u);
    EXPECT_EQ(stats.by_type.count(common::DeviceType::Router), 0u);

    auto json = registry::ToJson(stats);
    EXPECT_EQ(json["total_devices"], 3);
    EXPECT_EQ(json["online_devices"], 2);
    EXPECT_EQ(json["offline_devices"], 1);
    EXPECT_EQ(json["device_types"]["iot_device"], 2);
    EXPECT_EQ(json["device_types"]["printer"], 1);
}

TEST(RegistryTest, StatsOfEmptyRegistry)
{
    registry::Registry registry;
    auto stats = registry.Stats();
    EXPECT_EQ(stats.total, 0u);
    EXPECT_TRUE(stats.by_type.empty());
    EXPECT_TRUE(registry::ToJson(stats)["device_types"].empty());
}
