#include "ConnectProber.hpp"
#include "HostResolver.hpp"
#include "TcpConnection.hpp"
#include "../common/AddressRange.hpp"
#include <algorithm>

namespace lanwatch::discovery
{
    static constexpr std::chrono::milliseconds MIN_PORT_TIMEOUT{100};

    ConnectProber::ConnectProber(std::chrono::milliseconds timeout, std::vector<int> ports)
        : m_timeout(timeout), m_ports(std::move(ports))
    {
    }

    ProbeResult ConnectProber::Probe(const std::string &address)
    {
        if (!common::IsValidIPv4(address))
            return ProbeResult::Unreachable(ProbeError::InvalidAddress);
        if (m_ports.empty())
            return ProbeResult::Unreachable(ProbeError::Transport);

        auto deadline = std::chrono::steady_clock::now() + m_timeout;
        auto slice = std::max(MIN_PORT_TIMEOUT,
                              std::chrono::milliseconds(m_timeout.count() / static_cast<long>(m_ports.size())));
        bool transport_only = true;

        for (int port : m_ports)
        {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
                break;
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

            TcpConnection connection;
            auto start = std::chrono::steady_clock::now();
            ConnectOutcome outcome = connection.Connect(address, port, std::min(slice, remaining));

            if (outcome == ConnectOutcome::Connected || outcome == ConnectOutcome::Refused)
            {
                std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
                return ProbeResult::Reachable(elapsed.count());
            }
            if (outcome == ConnectOutcome::Timeout)
                transport_only = false;
        }

        return ProbeResult::Unreachable(transport_only ? ProbeError::Transport : ProbeError::Timeout);
    }

    Resolution ConnectProber::Resolve(const std::string &address)
    {
        Resolution resolution;
        if (!common::IsValidIPv4(address))
            return resolution;

        resolution.hostname = ReverseLookup(address);
        resolution.mac = LookupArpCache(address);
        return resolution;
    }
}
