#include "Monitor.hpp"
#include "../common/AddressRange.hpp"
#include "../discovery/WorkerPool.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace lanwatch::monitor
{
    namespace
    {
        constexpr std::chrono::milliseconds SLEEP_SLICE{100};

        discovery::Prober &RequireProber(Context &context)
        {
            if (!context.prober)
                throw std::invalid_argument("context has no prober");
            return *context.prober;
        }

        discovery::PortScanner &RequireScanner(Context &context)
        {
            if (!context.scanner)
                throw std::invalid_argument("context has no port scanner");
            return *context.scanner;
        }

        void KeepChanges(std::vector<registry::RegistryEvent> &events, const registry::RegistryEvent &event)
        {
            if (event.kind != registry::EventKind::Unchanged)
                events.push_back(event);
        }

        void SortByAddress(std::vector<registry::RegistryEvent> &events)
        {
            std::sort(events.begin(), events.end(),
                      [](const registry::RegistryEvent &a, const registry::RegistryEvent &b)
                      { return common::IpToInt(a.address) < common::IpToInt(b.address); });
        }
    }

    Monitor::Monitor(Context &context)
        : m_context(context),
          m_sweeper(RequireProber(context), context.config.max_threads),
          m_fingerprinter(RequireProber(context), RequireScanner(context), context.config.port_scan.ports),
          m_running(false)
    {
    }

    Monitor::~Monitor()
    {
        Stop();
    }

    void Monitor::Start()
    {
        if (m_running)
            return;
        if (m_thread.joinable())
            m_thread.join();

        m_running = true;
        m_thread = std::thread(&Monitor::MonitorLoop, this);
        std::cout << "[Monitor] Network monitoring started\n";
    }

    void Monitor::Stop()
    {
        bool was_running = m_running.exchange(false);
        if (m_thread.joinable())
            m_thread.join();
        if (was_running)
            std::cout << "[Monitor] Network monitoring stopped\n";
    }

    void Monitor::Subscribe(EventCallback callback)
    {
        if (!callback)
            return;
        std::lock_guard<std::mutex> lock(m_subscribers_mutex);
        m_subscribers.push_back(std::move(callback));
    }

    void Monitor::Publish(const std::vector<registry::RegistryEvent> &events)
    {
        std::vector<EventCallback> subscribers;
        {
            std::lock_guard<std::mutex> lock(m_subscribers_mutex);
            subscribers = m_subscribers;
        }

        for (const auto &event : events)
        {
            for (const auto &callback : subscribers)
            {
                try
                {
                    callback(event);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[Monitor] Event subscriber failed: " << e.what() << "\n";
                }
            }
        }
    }

    std::vector<registry::RegistryEvent> Monitor::RefreshKnownDevices()
    {
        std::vector<registry::RegistryEvent> events;
        std::vector<std::string> known = m_context.registry.Addresses();
        if (known.empty())
            return events;

        std::set<std::string> reachable = m_sweeper.Sweep(known);
        auto now = common::Clock::now();

        for (const auto &address : known)
        {
            // Both return nullopt for a device removed while we were probing.
            std::optional<registry::RegistryEvent> event =
                reachable.count(address) > 0 ? m_context.registry.MarkOnline(address, now)
                                             : m_context.registry.MarkOffline(address);
            if (event)
                KeepChanges(events, *event);
        }
        SortByAddress(events);
        return events;
    }

    std::vector<registry::RegistryEvent> Monitor::FingerprintAndApply(const std::vector<std::string> &addresses)
    {
        std::vector<registry::RegistryEvent> events;
        if (addresses.empty())
            return events;

        std::mutex eventsMutex;
        size_t workers = std::min(addresses.size(), static_cast<size_t>(m_sweeper.MaxThreads()));
        discovery::WorkerPool pool(workers);

        for (const auto &address : addresses)
        {
            pool.Submit([this, &address, &events, &eventsMutex]()
                        {
                common::DeviceRecord record = m_fingerprinter.Fingerprint(address);
                registry::RegistryEvent event = m_context.registry.Apply(record);

                std::lock_guard<std::mutex> lock(eventsMutex);
                KeepChanges(events, event); });
        }
        pool.WaitIdle();

        SortByAddress(events);
        return events;
    }

    std::vector<registry::RegistryEvent> Monitor::DetectNewDevices()
    {
        // Offline devices count as known: a device coming back is a status
        // flip, not a new device.
        std::vector<std::string> candidates;
        for (const auto &address : common::ExpandCidr(m_context.config.default_subnet))
        {
            if (!m_context.registry.Contains(address))
                candidates.push_back(address);
        }

        std::set<std::string> reachable = m_sweeper.Sweep(candidates);
        std::vector<std::string> newcomers(reachable.begin(), reachable.end());

        std::vector<registry::RegistryEvent> events = FingerprintAndApply(newcomers);
        for (const auto &event : events)
        {
            if (event.kind != registry::EventKind::Added)
                continue;

            std::string message = "New device detected: " + event.address;
            std::cerr << "[Monitor] " << message << "\n";
            if (m_context.config.security.alert_on_new_devices && m_context.notifier)
                m_context.notifier->Notify(message);
        }
        return events;
    }

    std::vector<registry::RegistryEvent> Monitor::RunCycle()
    {
        std::vector<registry::RegistryEvent> events;

        try
        {
            events = RefreshKnownDevices();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Monitor] Status refresh failed: " << e.what() << "\n";
        }

        try
        {
            std::vector<registry::RegistryEvent> added = DetectNewDevices();
            events.insert(events.end(), added.begin(), added.end());
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Monitor] New device scan failed: " << e.what() << "\n";
        }

        Publish(events);
        return events;
    }

    std::vector<registry::RegistryEvent> Monitor::DiscoverNetwork()
    {
        return DiscoverNetwork(m_context.config.default_subnet);
    }

    std::vector<registry::RegistryEvent> Monitor::DiscoverNetwork(const std::string &cidr)
    {
        std::cout << "[Monitor] Starting network discovery on " << cidr << "\n";

        std::set<std::string> reachable = m_sweeper.SweepRange(cidr);
        std::vector<registry::RegistryEvent> events =
            FingerprintAndApply(std::vector<std::string>(reachable.begin(), reachable.end()));

        std::cout << "[Monitor] Discovered " << reachable.size() << " devices, "
                  << m_context.registry.Size() << " known in total\n";
        Publish(events);
        return events;
    }

    void Monitor::MonitorLoop()
    {
        while (m_running)
        {
            try
            {
                RunCycle();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Monitor] Monitoring error: " << e.what() << "\n";
            }

            auto waited = std::chrono::milliseconds(0);
            auto interval = m_context.config.monitoring_interval;
            while (m_running && waited < interval)
            {
                auto slice = std::min(SLEEP_SLICE, interval - waited);
                std::this_thread::sleep_for(slice);
                waited += slice;
            }
        }
    }
}
