#pragma once

#include <optional>
#include <string>

namespace lanwatch::discovery
{
    enum class ProbeError
    {
        None,
        Timeout,
        Transport,
        InvalidAddress,
        PermissionDenied
    };

    // Outcome of one reachability probe. Any error means unreachable.
    struct ProbeResult
    {
        bool reachable = false;
        ProbeError error = ProbeError::Timeout;
        double latency_ms = -1.0;
        int ttl = 0; // 0 when the strategy that answered carries no TTL

        static ProbeResult Reachable(double latency_ms, int ttl = 0)
        {
            return ProbeResult{true, ProbeError::None, latency_ms, ttl};
        }

        static ProbeResult Unreachable(ProbeError error)
        {
            return ProbeResult{false, error, -1.0, 0};
        }
    };

    struct Resolution
    {
        std::optional<std::string> hostname;
        std::optional<std::string> mac;
    };

    const char *ToString(ProbeError error);

    // Reachability and identity lookups against a single address.
    // Implementations never throw and never block past their probe timeout.
    class Prober
    {
    public:
        virtual ~Prober() = default;
        virtual ProbeResult Probe(const std::string &address) = 0;
        virtual Resolution Resolve(const std::string &address) = 0;
    };
}
