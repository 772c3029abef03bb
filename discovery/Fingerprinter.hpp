#pragma once

#include <string>
#include <vector>
#include "PortScanner.hpp"
#include "Prober.hpp"
#include "../common/DeviceRecord.hpp"

namespace lanwatch::discovery
{
    // Builds a full DeviceRecord for a reachable address. Every step is
    // best-effort: a failing lookup leaves its fields empty and the rest
    // still run.
    class Fingerprinter
    {
    public:
        Fingerprinter(Prober &prober, PortScanner &scanner, std::vector<int> candidate_ports);

        common::DeviceRecord Fingerprint(const std::string &address);

        const std::vector<int> &CandidatePorts() const { return m_ports; }

    private:
        Prober &m_prober;
        PortScanner &m_scanner;
        std::vector<int> m_ports;
    };
}
