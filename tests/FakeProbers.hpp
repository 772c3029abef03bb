#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include "../discovery/PortScanner.hpp"
#include "../discovery/Prober.hpp"

namespace lanwatch::fakes
{
    // Scripted prober: addresses in the reachable set answer, everything else
    // times out. Tracks how many probes overlap.
    class FakeProber : public discovery::Prober
    {
    public:
        explicit FakeProber(std::set<std::string> reachable = {},
                            std::chrono::milliseconds delay = std::chrono::milliseconds(0))
            : m_reachable(std::move(reachable)), m_delay(delay)
        {
        }

        discovery::ProbeResult Probe(const std::string &address) override
        {
            int now = ++m_in_flight;
            int peak = m_peak.load();
            while (now > peak && !m_peak.compare_exchange_weak(peak, now))
            {
            }

            if (m_delay.count() > 0)
                std::this_thread::sleep_for(m_delay);

            bool up;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                ++m_probe_count[address];
                if (m_throwing.count(address) > 0)
                {
                    --m_in_flight;
                    throw std::runtime_error("probe exploded");
                }
                up = m_reachable.count(address) > 0;
            }

            --m_in_flight;
            if (up)
                return discovery::ProbeResult::Reachable(1.0, m_ttl);
            return discovery::ProbeResult::Unreachable(discovery::ProbeError::Timeout);
        }

        discovery::Resolution Resolve(const std::string &address) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            discovery::Resolution resolution;
            auto host = m_hostnames.find(address);
            if (host != m_hostnames.end())
                resolution.hostname = host->second;
            auto mac = m_macs.find(address);
            if (mac != m_macs.end())
                resolution.mac = mac->second;
            return resolution;
        }

        void SetReachable(const std::string &address, bool up)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (up)
                m_reachable.insert(address);
            else
                m_reachable.erase(address);
        }

        void SetHostname(const std::string &address, const std::string &name)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_hostnames[address] = name;
        }

        void SetMac(const std::string &address, const std::string &mac)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_macs[address] = mac;
        }

        void ThrowFor(const std::string &address)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_throwing.insert(address);
        }

        void SetTtl(int ttl) { m_ttl = ttl; }

        int PeakConcurrency() const { return m_peak; }

        int ProbeCount(const std::string &address) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_probe_count.find(address);
            return it == m_probe_count.end() ? 0 : it->second;
        }

    private:
        mutable std::mutex m_mutex;
        std::set<std::string> m_reachable;
        std::set<std::string> m_throwing;
        std::map<std::string, std::string> m_hostnames;
        std::map<std::string, std::string> m_macs;
        std::map<std::string, int> m_probe_count;
        std::chrono::milliseconds m_delay;
        std::atomic<int> m_ttl{0};
        std::atomic<int> m_in_flight{0};
        std::atomic<int> m_peak{0};
    };

    class FakePortScanner : public discovery::PortScanner
    {
    public:
        discovery::PortScanResult Scan(const std::string &address, const std::vector<int> &ports) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_requested_ports = ports;
            if (m_failing.count(address) > 0)
                throw std::runtime_error("scan failed");

            auto it = m_results.find(address);
            if (it == m_results.end())
                return {};
            return it->second;
        }

        void SetOpenPorts(const std::string &address, std::set<int> ports,
                          std::map<int, common::ServiceInfo> services = {})
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_results[address] = discovery::PortScanResult{std::move(ports), std::move(services)};
        }

        void FailFor(const std::string &address)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_failing.insert(address);
        }

        std::vector<int> RequestedPorts() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_requested_ports;
        }

    private:
        mutable std::mutex m_mutex;
        std::map<std::string, discovery::PortScanResult> m_results;
        std::set<std::string> m_failing;
        std::vector<int> m_requested_ports;
    };
}
