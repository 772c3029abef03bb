#include "Connectivity.hpp"
#include <cmath>

namespace lanwatch::discovery
{
    ConnectivityReport TestConnectivity(Prober &prober, const std::string &target)
    {
        ConnectivityReport report;
        report.target = target;
        report.timestamp = common::Clock::now();

        ProbeResult result = prober.Probe(target);
        report.reachable = result.reachable;
        if (result.reachable)
            report.latency_ms = result.latency_ms;
        return report;
    }

    nlohmann::json ToJson(const ConnectivityReport &report)
    {
        nlohmann::json json = {
            {"target", report.target},
            {"reachable", report.reachable},
            {"timestamp", common::FormatTimestamp(report.timestamp)}};

        if (report.reachable)
            json["latency_ms"] = std::round(report.latency_ms * 100.0) / 100.0;
        return json;
    }
}
