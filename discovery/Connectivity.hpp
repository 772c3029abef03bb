#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "Prober.hpp"
#include "../common/DeviceRecord.hpp"

namespace lanwatch::discovery
{
    struct ConnectivityReport
    {
        std::string target;
        bool reachable = false;
        double latency_ms = -1.0;
        common::Clock::time_point timestamp;
    };

    ConnectivityReport TestConnectivity(Prober &prober, const std::string &target = "8.8.8.8");

    nlohmann::json ToJson(const ConnectivityReport &report);
}
