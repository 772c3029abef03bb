#include "WorkerPool.hpp"
#include <iostream>
#include <stdexcept>

namespace lanwatch::discovery
{
    WorkerPool::WorkerPool(size_t size)
    {
        if (size == 0)
            throw std::invalid_argument("worker pool needs at least one thread");

        try
        {
            m_threads.reserve(size);
            for (size_t i = 0; i < size; ++i)
                m_threads.emplace_back(&WorkerPool::ProcessLoop, this);
        }
        catch (const std::exception &e)
        {
            // No destructor runs for a half-built pool; release the workers
            // that did start before the queue goes away.
            std::cerr << "[WorkerPool] Started " << m_threads.size() << " of " << size
                      << " threads: " << e.what() << "\n";
            JoinAll();
            throw;
        }
    }

    WorkerPool::~WorkerPool()
    {
        JoinAll();
    }

    void WorkerPool::JoinAll()
    {
        m_tasks.Shutdown();
        for (auto &thread : m_threads)
        {
            if (thread.joinable())
                thread.join();
        }
    }

    void WorkerPool::Submit(Task task)
    {
        {
            std::lock_guard<std::mutex> lock(m_idle_mutex);
            ++m_pending;
        }

        if (!m_tasks.Push(std::move(task)))
        {
            FinishTask();
            throw std::logic_error("worker pool is shutting down");
        }
    }

    void WorkerPool::WaitIdle()
    {
        std::unique_lock<std::mutex> lock(m_idle_mutex);
        m_idle_cv.wait(lock, [this]
                       { return m_pending == 0; });
    }

    void WorkerPool::FinishTask()
    {
        std::lock_guard<std::mutex> lock(m_idle_mutex);
        if (--m_pending == 0)
            m_idle_cv.notify_all();
    }

    void WorkerPool::ProcessLoop()
    {
        while (auto task = m_tasks.Pop())
        {
            try
            {
                (*task)();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[WorkerPool] Task failed: " << e.what() << "\n";
            }
            FinishTask();
        }
    }
}
