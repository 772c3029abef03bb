#pragma once

#include <set>
#include <string>
#include <vector>
#include "Prober.hpp"

namespace lanwatch::discovery
{
    class Sweeper
    {
    public:
        // max_threads caps how many probes are in flight at once.
        Sweeper(Prober &prober, int max_threads);

        // Addresses whose probe came back reachable. Returns once every probe
        // has finished.
        std::set<std::string> Sweep(const std::vector<std::string> &addresses);

        // Expands the CIDR first; throws std::invalid_argument if malformed.
        std::set<std::string> SweepRange(const std::string &cidr);

        int MaxThreads() const { return m_max_threads; }

    private:
        Prober &m_prober;
        int m_max_threads;
    };
}
