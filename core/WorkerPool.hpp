#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace net_discovery::core
{
    using Job = std::function<void()>;

    // Fixed set of threads draining a shared job queue.
    class WorkerPool
    {
    public:
        explicit WorkerPool(std::size_t thread_count);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        void Start();
        void Stop();

        void AddJob(Job job);

        // Blocks until the queue is empty and no job is running.
        void WaitIdle();

        // Drops queued jobs that have not started yet; returns how many were dropped.
        std::size_t DiscardPending();

        std::size_t ThreadCount() const { return m_thread_count; }

    private:
        void ProcessLoop();

        std::size_t m_thread_count;
        std::vector<std::thread> m_threads;
        std::mutex m_queue_mutex;
        std::condition_variable m_queue_cv;
        std::condition_variable m_idle_cv;
        std::queue<Job> m_job_queue;
        std::size_t m_active = 0;
        std::atomic<bool> m_running;
    };

    // Runs job(target) for every target on a pool of `workers` threads.
    // Targets not yet started when should_stop() turns true are skipped; the
    // return value is the number of skipped targets.
    std::size_t RunForEachTarget(const std::vector<std::string> &targets, std::size_t workers,
                                 const std::function<bool()> &should_stop,
                                 const std::function<void(const std::string &)> &job);
}
