#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include "Prober.hpp"

namespace lanwatch::discovery
{
    // Raw-socket prober: ICMP echo first, ARP who-has as fallback.
    // Needs CAP_NET_RAW (normally root).
    class TinsProber : public Prober
    {
    public:
        explicit TinsProber(std::chrono::milliseconds timeout);

        ProbeResult Probe(const std::string &address) override;
        Resolution Resolve(const std::string &address) override;

    private:
        ProbeResult EchoProbe(const std::string &address);
        ProbeResult ArpProbe(const std::string &address);

        struct ArpReply
        {
            std::string mac;
            double latency_ms;
        };
        std::optional<ArpReply> ArpRequest(const std::string &address, ProbeError &error);

        std::chrono::milliseconds m_timeout;
        std::atomic<uint16_t> m_echo_id;
    };
}
