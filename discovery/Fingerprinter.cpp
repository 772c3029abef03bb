#include "Fingerprinter.hpp"
#include "DeviceClassifier.hpp"
#include <iostream>

namespace lanwatch::discovery
{
    Fingerprinter::Fingerprinter(Prober &prober, PortScanner &scanner, std::vector<int> candidate_ports)
        : m_prober(prober), m_scanner(scanner), m_ports(std::move(candidate_ports))
    {
    }

    common::DeviceRecord Fingerprinter::Fingerprint(const std::string &address)
    {
        common::DeviceRecord record;
        record.address = address;

        try
        {
            Resolution resolution = m_prober.Resolve(address);
            record.hostname = resolution.hostname.value_or("");
            record.mac_address = resolution.mac.value_or("");
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Fingerprinter] Name/MAC lookup failed for " << address << ": " << e.what() << "\n";
        }

        try
        {
            PortScanResult scan = m_scanner.Scan(address, m_ports);
            record.open_ports = std::move(scan.open_ports);
            record.services = std::move(scan.services);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Fingerprinter] Port scan failed for " << address << ": " << e.what() << "\n";
        }

        int ttl = 0;
        try
        {
            ProbeResult probe = m_prober.Probe(address);
            if (probe.reachable)
                ttl = probe.ttl;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Fingerprinter] TTL probe failed for " << address << ": " << e.what() << "\n";
        }

        record.os_guess = GuessOs(ttl, record.open_ports, record.services);
        record.device_type = ClassifyDevice(record.open_ports, record.services);
        record.status = common::DeviceStatus::Online;
        record.last_seen = common::Clock::now();
        return record;
    }
}
