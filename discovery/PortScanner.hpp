#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include "../common/DeviceRecord.hpp"

namespace lanwatch::discovery
{
    struct PortScanResult
    {
        std::set<int> open_ports;
        std::map<int, common::ServiceInfo> services;
    };

    class PortScanner
    {
    public:
        virtual ~PortScanner() = default;
        virtual PortScanResult Scan(const std::string &address, const std::vector<int> &ports) = 0;
    };

    // Selected when port scanning is disabled in the configuration.
    class NullPortScanner : public PortScanner
    {
    public:
        PortScanResult Scan(const std::string &, const std::vector<int> &) override { return {}; }
    };
}
