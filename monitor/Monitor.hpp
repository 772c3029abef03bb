#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "Context.hpp"
#include "../discovery/Fingerprinter.hpp"
#include "../discovery/Sweeper.hpp"
#include "../registry/Registry.hpp"

namespace lanwatch::monitor
{
    enum class MonitorState
    {
        Idle,
        Running
    };

    using EventCallback = std::function<void(const registry::RegistryEvent &event)>;

    class Monitor
    {
    public:
        explicit Monitor(Context &context);
        ~Monitor();

        Monitor(const Monitor &) = delete;
        Monitor &operator=(const Monitor &) = delete;

        void Start();

        // Returns once the loop thread has exited; an in-flight cycle is
        // allowed to finish first.
        void Stop();

        bool IsRunning() const { return m_running; }
        MonitorState State() const { return m_running ? MonitorState::Running : MonitorState::Idle; }

        // Callbacks run on the monitor thread and only see Added and
        // StatusChanged events.
        void Subscribe(EventCallback callback);

        // One pass of the loop body: re-probe known devices, then sweep the
        // default subnet for newcomers.
        std::vector<registry::RegistryEvent> RunCycle();

        // Sweep and fully fingerprint every reachable host, known or not.
        std::vector<registry::RegistryEvent> DiscoverNetwork();
        std::vector<registry::RegistryEvent> DiscoverNetwork(const std::string &cidr);

    private:
        void MonitorLoop();

        std::vector<registry::RegistryEvent> RefreshKnownDevices();
        std::vector<registry::RegistryEvent> DetectNewDevices();
        std::vector<registry::RegistryEvent> FingerprintAndApply(const std::vector<std::string> &addresses);

        void Publish(const std::vector<registry::RegistryEvent> &events);

        Context &m_context;
        discovery::Sweeper m_sweeper;
        discovery::Fingerprinter m_fingerprinter;

        std::atomic<bool> m_running;
        std::thread m_thread;

        std::vector<EventCallback> m_subscribers;
        std::mutex m_subscribers_mutex;
    };
}
