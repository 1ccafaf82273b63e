#include "WorkerPool.hpp"
#include <algorithm>
#include <iostream>

namespace net_discovery::core
{
    WorkerPool::WorkerPool(std::size_t thread_count)
        : m_thread_count(std::max<std::size_t>(1, thread_count)), m_running(false) {}

    WorkerPool::~WorkerPool()
    {
        Stop();
    }

    void WorkerPool::Start()
    {
        if (m_running)
            return;

        m_running = true;
        for (std::size_t i = 0; i < m_thread_count; ++i)
            m_threads.emplace_back(&WorkerPool::ProcessLoop, this);
    }

    void WorkerPool::Stop()
    {
        if (!m_running)
            return;

        m_running = false;
        m_queue_cv.notify_all();

        for (auto &thread : m_threads)
        {
            if (thread.joinable())
                thread.join();
        }
        m_threads.clear();
    }

    void WorkerPool::AddJob(Job job)
    {
        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            m_job_queue.push(std::move(job));
        }
        m_queue_cv.notify_one();
    }

    void WorkerPool::WaitIdle()
    {
        std::unique_lock<std::mutex> lock(m_queue_mutex);
        m_idle_cv.wait(lock, [this]
                       { return m_job_queue.empty() && m_active == 0; });
    }

    std::size_t WorkerPool::DiscardPending()
    {
        std::size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            dropped = m_job_queue.size();
            std::queue<Job>().swap(m_job_queue);
        }
        m_idle_cv.notify_all();
        return dropped;
    }

    void WorkerPool::ProcessLoop()
    {
        while (true)
        {
            Job current_job;

            {
                std::unique_lock<std::mutex> lock(m_queue_mutex);

                m_queue_cv.wait(lock, [this]
                                { return !m_job_queue.empty() || !m_running; });

                if (!m_running && m_job_queue.empty())
                    break;

                current_job = std::move(m_job_queue.front());
                m_job_queue.pop();
                ++m_active;
            }

            try
            {
                current_job();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[WorkerPool] Error processing job: " << e.what() << "\n";
            }

            {
                std::lock_guard<std::mutex> lock(m_queue_mutex);
                --m_active;
                if (m_job_queue.empty() && m_active == 0)
                    m_idle_cv.notify_all();
            }
        }
    }

    std::size_t RunForEachTarget(const std::vector<std::string> &targets, std::size_t workers,
                                 const std::function<bool()> &should_stop,
                                 const std::function<void(const std::string &)> &job)
    {
        if (targets.empty())
            return 0;

        std::atomic<std::size_t> skipped{0};
        WorkerPool pool(std::min(workers, targets.size()));
        pool.Start();

        for (const auto &target : targets)
        {
            pool.AddJob([&, target]
                        {
                            if (should_stop())
                            {
                                ++skipped;
                                return;
                            }
                            job(target);
                        });
        }

        pool.WaitIdle();
        pool.Stop();
        return skipped.load();
    }
}
