#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include "../common/ThreadSafeQueue.hpp"

namespace lanwatch::discovery
{
    // Fixed number of worker threads draining one task queue, so at most
    // Size() tasks ever run at the same time.
    class WorkerPool
    {
    public:
        using Task = std::function<void()>;

        explicit WorkerPool(size_t size);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        void Submit(Task task);

        // Blocks until every submitted task has finished.
        void WaitIdle();

        size_t Size() const { return m_threads.size(); }

    private:
        void ProcessLoop();
        void FinishTask();
        void JoinAll();

        std::vector<std::thread> m_threads;
        common::ThreadSafeQueue<Task> m_tasks;

        std::mutex m_idle_mutex;
        std::condition_variable m_idle_cv;
        size_t m_pending = 0;
    };
}
