#include "Sweeper.hpp"
#include "WorkerPool.hpp"
#include "../common/AddressRange.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace lanwatch::discovery
{
    Sweeper::Sweeper(Prober &prober, int max_threads)
        : m_prober(prober), m_max_threads(max_threads)
    {
        if (max_threads < 1)
            throw std::invalid_argument("max_threads must be at least 1");
    }

    std::set<std::string> Sweeper::Sweep(const std::vector<std::string> &addresses)
    {
        std::set<std::string> reachable;
        if (addresses.empty())
            return reachable;

        std::mutex resultsMutex;
        size_t workers = std::min(addresses.size(), static_cast<size_t>(m_max_threads));
        WorkerPool pool(workers);

        for (const auto &address : addresses)
        {
            pool.Submit([this, &address, &reachable, &resultsMutex]()
                        {
                ProbeResult result;
                try
                {
                    result = m_prober.Probe(address);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[Sweeper] Probe of " << address << " failed: " << e.what() << "\n";
                    return;
                }

                if (result.reachable)
                {
                    std::lock_guard<std::mutex> lock(resultsMutex);
                    reachable.insert(address);
                } });
        }

        pool.WaitIdle();
        return reachable;
    }

    std::set<std::string> Sweeper::SweepRange(const std::string &cidr)
    {
        std::vector<std::string> addresses = common::ExpandCidr(cidr);
        std::cout << "[Sweeper] Sweeping " << cidr << " (" << addresses.size()
                  << " hosts, " << m_max_threads << " threads)\n";

        std::set<std::string> reachable = Sweep(addresses);
        std::cout << "[Sweeper] " << reachable.size() << " hosts up in " << cidr << "\n";
        return reachable;
    }
}
