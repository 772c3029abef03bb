#pragma once

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace lanwatch::common
{
    inline constexpr const char *DEFAULT_CONFIG_PATH = "network_config.json";

    class ConfigError : public std::runtime_error
    {
    public:
        explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
    };

    struct AdminCredential
    {
        std::string username = "admin";
        std::string password;
    };

    struct SecuritySettings
    {
        bool alert_on_new_devices = true;
        bool block_unknown_devices = false; // not enforced
        nlohmann::json bandwidth_limits = nlohmann::json::object();
    };

    struct PortScanSettings
    {
        bool enabled = true;
        std::vector<int> ports = {22, 80, 443, 631, 3389, 8080, 9100};
    };

    struct Config
    {
        std::string default_subnet = "192.168.1.0/24";
        std::chrono::seconds scan_timeout{30};
        std::chrono::milliseconds probe_timeout{1000};
        std::chrono::milliseconds monitoring_interval{60000};
        int max_threads = 50;
        std::map<std::string, AdminCredential> admin_credentials;
        SecuritySettings security;
        PortScanSettings port_scan;
        std::string snapshot_path = "devices.db";
    };

    // Candidate ports always probed regardless of configuration.
    const std::vector<int> &RequiredPorts();

    // Builds a Config from parsed JSON. Missing keys keep their defaults.
    // Throws ConfigError on wrong types or invalid values.
    Config ConfigFromJson(const nlohmann::json &json);
    nlohmann::json ConfigToJson(const Config &config);

    // Missing file: defaults are written to path and returned.
    // Unreadable or malformed file: throws ConfigError.
    Config LoadConfig(const std::string &path = DEFAULT_CONFIG_PATH);
    bool SaveConfig(const std::string &path, const Config &config);
}
