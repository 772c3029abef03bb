#pragma once

#include <chrono>
#include <vector>
#include "Prober.hpp"

namespace lanwatch::discovery
{
    // Unprivileged fallback: a host counts as up when any of a few TCP ports
    // accepts or actively refuses a connection. MAC comes from the kernel ARP
    // cache only.
    class ConnectProber : public Prober
    {
    public:
        explicit ConnectProber(std::chrono::milliseconds timeout,
                               std::vector<int> ports = {80, 443, 22, 445, 139});

        ProbeResult Probe(const std::string &address) override;
        Resolution Resolve(const std::string &address) override;

    private:
        std::chrono::milliseconds m_timeout;
        std::vector<int> m_ports;
    };
}
