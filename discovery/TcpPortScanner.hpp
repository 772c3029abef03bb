#pragma once

#include <chrono>
#include "PortScanner.hpp"

namespace lanwatch::discovery
{
    // Connect scan with banner grabbing. Ports are probed in order until the
    // per-host budget runs out; ports not reached are reported closed. A zero
    // budget means no limit.
    class TcpPortScanner : public PortScanner
    {
    public:
        TcpPortScanner(std::chrono::milliseconds connect_timeout, std::chrono::milliseconds host_budget);

        PortScanResult Scan(const std::string &address, const std::vector<int> &ports) override;

    private:
        std::chrono::milliseconds m_connect_timeout;
        std::chrono::milliseconds m_host_budget;
    };
}
