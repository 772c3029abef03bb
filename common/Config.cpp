#include "Config.hpp"
#include "AddressRange.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace lanwatch::common
{
    namespace
    {
        // Upper bound for every configured duration.
        constexpr double MAX_DURATION_SECONDS = 7 * 24 * 3600.0;

        // Finite, non-negative and at most max, or ConfigError. Missing key
        // gives fallback.
        double ReadNumber(const nlohmann::json &json, const char *key, double fallback, double max)
        {
            if (!json.contains(key))
                return fallback;

            double value = json.at(key).get<double>();
            if (!std::isfinite(value) || value < 0.0 || value > max)
                throw ConfigError(std::string(key) + " out of range");
            return value;
        }

        void MergeRequiredPorts(std::vector<int> &ports)
        {
            for (int port : RequiredPorts())
                ports.push_back(port);
            std::sort(ports.begin(), ports.end());
            ports.erase(std::unique(ports.begin(), ports.end()), ports.end());
        }

        void Validate(const Config &config)
        {
            if (config.max_threads < 1)
                throw ConfigError("max_threads must be at least 1");
            if (config.scan_timeout.count() < 0)
                throw ConfigError("scan_timeout must not be negative");
            if (config.probe_timeout.count() <= 0)
                throw ConfigError("probe_timeout_ms must be positive");
            if (config.monitoring_interval.count() <= 0)
                throw ConfigError("monitoring_interval must be positive");

            try
            {
                ParseCidr(config.default_subnet);
            }
            catch (const std::invalid_argument &e)
            {
                throw ConfigError(std::string("default_subnet: ") + e.what());
            }

            for (int port : config.port_scan.ports)
            {
                if (port < 1 || port > 65535)
                    throw ConfigError("port out of range: " + std::to_string(port));
            }
        }
    }

    const std::vector<int> &RequiredPorts()
    {
        static const std::vector<int> ports = {22, 80, 443, 3389};
        return ports;
    }

    Config ConfigFromJson(const nlohmann::json &json)
    {
        if (!json.is_object())
            throw ConfigError("configuration root must be an object");

        Config config;
        try
        {
            config.default_subnet = json.value("default_subnet", config.default_subnet);
            config.scan_timeout = std::chrono::seconds(static_cast<long long>(
                ReadNumber(json, "scan_timeout", static_cast<double>(config.scan_timeout.count()), MAX_DURATION_SECONDS)));
            config.probe_timeout = std::chrono::milliseconds(std::llround(
                ReadNumber(json, "probe_timeout_ms", static_cast<double>(config.probe_timeout.count()),
                           MAX_DURATION_SECONDS * 1000.0)));
            config.monitoring_interval = std::chrono::milliseconds(std::llround(
                ReadNumber(json, "monitoring_interval", config.monitoring_interval.count() / 1000.0,
                           MAX_DURATION_SECONDS) *
                1000.0));
            config.max_threads = json.value("max_threads", config.max_threads);
            config.snapshot_path = json.value("snapshot_path", config.snapshot_path);

            if (json.contains("admin_credentials"))
            {
                for (const auto &item : json.at("admin_credentials").items())
                {
                    AdminCredential credential;
                    credential.username = item.value().value("username", credential.username);
                    credential.password = item.value().value("password", credential.password);
                    config.admin_credentials[item.key()] = credential;
                }
            }

            if (json.contains("security_settings"))
            {
                const auto &security = json.at("security_settings");
                config.security.alert_on_new_devices = security.value("alert_on_new_devices", config.security.alert_on_new_devices);
                config.security.block_unknown_devices = security.value("block_unknown_devices", config.security.block_unknown_devices);
                if (security.contains("bandwidth_limits"))
                    config.security.bandwidth_limits = security.at("bandwidth_limits");
            }

            if (json.contains("port_scan"))
            {
                const auto &scan = json.at("port_scan");
                config.port_scan.enabled = scan.value("enabled", config.port_scan.enabled);
                if (scan.contains("ports"))
                    config.port_scan.ports = scan.at("ports").get<std::vector<int>>();
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            throw ConfigError(std::string("invalid configuration value: ") + e.what());
        }

        Validate(config);
        MergeRequiredPorts(config.port_scan.ports);
        return config;
    }

    nlohmann::json ConfigToJson(const Config &config)
    {
        nlohmann::json credentials = nlohmann::json::object();
        for (const auto &[ip, creds] : config.admin_credentials)
            credentials[ip] = {{"username", creds.username}, {"password", creds.password}};

        return {
            {"default_subnet", config.default_subnet},
            {"scan_timeout", config.scan_timeout.count()},
            {"probe_timeout_ms", config.probe_timeout.count()},
            {"monitoring_interval", config.monitoring_interval.count() / 1000.0},
            {"max_threads", config.max_threads},
            {"admin_credentials", credentials},
            {"security_settings",
             {{"block_unknown_devices", config.security.block_unknown_devices},
              {"alert_on_new_devices", config.security.alert_on_new_devices},
              {"bandwidth_limits", config.security.bandwidth_limits}}},
            {"port_scan",
             {{"enabled", config.port_scan.enabled},
              {"ports", config.port_scan.ports}}},
            {"snapshot_path", config.snapshot_path}};
    }

    bool SaveConfig(const std::string &path, const Config &config)
    {
        std::ofstream out(path);
        if (!out.is_open())
        {
            std::cerr << "[Config] Cannot write " << path << "\n";
            return false;
        }
        out << ConfigToJson(config).dump(4) << "\n";
        return out.good();
    }

    Config LoadConfig(const std::string &path)
    {
        if (!std::filesystem::exists(path))
        {
            Config defaults;
            std::cout << "[Config] " << path << " not found, writing defaults.\n";
            if (!SaveConfig(path, defaults))
                std::cerr << "[Config] Continuing with in-memory defaults.\n";
            return defaults;
        }

        std::ifstream in(path);
        if (!in.is_open())
            throw ConfigError("cannot open " + path);

        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw ConfigError(path + ": " + e.what());
        }

        return ConfigFromJson(json);
    }
}
