#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace lanwatch::common
{
    enum class DeviceType
    {
        Router,
        Server,
        Printer,
        IotDevice,
        Computer,
        Unknown
    };

    enum class DeviceStatus
    {
        Online,
        Offline
    };

    struct ServiceInfo
    {
        std::string name;
        std::string product;
        std::string version;

        bool operator==(const ServiceInfo &other) const
        {
            return name == other.name && product == other.product && version == other.version;
        }
        bool operator!=(const ServiceInfo &other) const { return !(*this == other); }
    };

    using Clock = std::chrono::system_clock;

    struct DeviceRecord
    {
        std::string address;
        std::string hostname;
        std::string mac_address;
        std::set<int> open_ports;
        std::map<int, ServiceInfo> services;
        std::string os_guess;
        DeviceType device_type = DeviceType::Unknown;
        DeviceStatus status = DeviceStatus::Offline;
        Clock::time_point last_seen{};

        bool operator==(const DeviceRecord &other) const;
        bool operator!=(const DeviceRecord &other) const { return !(*this == other); }
    };

    std::string ToString(DeviceType type);
    std::string ToString(DeviceStatus status);

    std::optional<DeviceType> DeviceTypeFromString(const std::string &text);
    std::optional<DeviceStatus> DeviceStatusFromString(const std::string &text);

    // ISO-8601 local time, e.g. 2024-05-01T13:37:00
    std::string FormatTimestamp(Clock::time_point tp);

    nlohmann::json ToJson(const DeviceRecord &record);
}
