#include "TcpPortScanner.hpp"
#include "ServiceIdentifier.hpp"
#include "TcpConnection.hpp"
#include <iostream>

namespace lanwatch::discovery
{
    TcpPortScanner::TcpPortScanner(std::chrono::milliseconds connect_timeout, std::chrono::milliseconds host_budget)
        : m_connect_timeout(connect_timeout), m_host_budget(host_budget)
    {
    }

    PortScanResult TcpPortScanner::Scan(const std::string &address, const std::vector<int> &ports)
    {
        PortScanResult result;
        auto deadline = std::chrono::steady_clock::now() + m_host_budget;

        for (int port : ports)
        {
            if (m_host_budget.count() > 0 && std::chrono::steady_clock::now() >= deadline)
            {
                std::cerr << "[PortScanner] Scan budget exhausted for " << address
                          << ", skipping remaining ports.\n";
                break;
            }

            TcpConnection connection;
            if (connection.Connect(address, port, m_connect_timeout) != ConnectOutcome::Connected)
                continue;

            result.open_ports.insert(port);

            std::string banner;
            std::string request = BannerRequestFor(port);
            if (request.empty() || connection.Send(request))
                banner = connection.Receive(m_connect_timeout);

            common::ServiceInfo info = IdentifyService(port, banner);
            if (!info.name.empty() || !info.product.empty() || !info.version.empty())
                result.services[port] = info;
        }

        return result;
    }
}
