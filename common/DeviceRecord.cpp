#include "DeviceRecord.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace lanwatch::common
{
    bool DeviceRecord::operator==(const DeviceRecord &other) const
    {
        return address == other.address &&
               hostname == other.hostname &&
               mac_address == other.mac_address &&
               open_ports == other.open_ports &&
               services == other.services &&
               os_guess == other.os_guess &&
               device_type == other.device_type &&
               status == other.status &&
               last_seen == other.last_seen;
    }

    std::string ToString(DeviceType type)
    {
        switch (type)
        {
        case DeviceType::Router:
            return "router";
        case DeviceType::Server:
            return "server";
        case DeviceType::Printer:
            return "printer";
        case DeviceType::IotDevice:
            return "iot_device";
        case DeviceType::Computer:
            return "computer";
        case DeviceType::Unknown:
            break;
        }
        return "unknown";
    }

    std::string ToString(DeviceStatus status)
    {
        return status == DeviceStatus::Online ? "online" : "offline";
    }

    std::optional<DeviceType> DeviceTypeFromString(const std::string &text)
    {
        static const std::map<std::string, DeviceType> table = {
            {"router", DeviceType::Router},
            {"server", DeviceType::Server},
            {"printer", DeviceType::Printer},
            {"iot_device", DeviceType::IotDevice},
            {"computer", DeviceType::Computer},
            {"unknown", DeviceType::Unknown}};

        auto it = table.find(text);
        if (it == table.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<DeviceStatus> DeviceStatusFromString(const std::string &text)
    {
        if (text == "online")
            return DeviceStatus::Online;
        if (text == "offline")
            return DeviceStatus::Offline;
        return std::nullopt;
    }

    std::string FormatTimestamp(Clock::time_point tp)
    {
        if (tp == Clock::time_point{})
            return "";

        std::time_t t = Clock::to_time_t(tp);
        std::tm local{};
        localtime_r(&t, &local);

        std::stringstream ss;
        ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
        return ss.str();
    }

    nlohmann::json ToJson(const DeviceRecord &record)
    {
        nlohmann::json services = nlohmann::json::object();
        for (const auto &[port, info] : record.services)
        {
            services[std::to_string(port)] = {
                {"name", info.name},
                {"product", info.product},
                {"version", info.version}};
        }

        return {
            {"ip", record.address},
            {"hostname", record.hostname},
            {"mac_address", record.mac_address},
            {"open_ports", record.open_ports},
            {"services", services},
            {"os_guess", record.os_guess},
            {"device_type", ToString(record.device_type)},
            {"status", ToString(record.status)},
            {"last_seen", FormatTimestamp(record.last_seen)}};
    }
}
