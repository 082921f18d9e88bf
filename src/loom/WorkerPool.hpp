#ifndef SRC_LOOM_WORKER_POOL_HPP_
#define SRC_LOOM_WORKER_POOL_HPP_

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace loom {

// Owns a set of worker threads that run jobs in the order they were enqueued. Shared by every project build in a
// process, so jobs must not block waiting on other jobs.
class WorkerPool {
public:
    WorkerPool();
    ~WorkerPool();

    // Start the worker threads, they will block until jobs are provided. If zero is provided as an argument the pool
    // will start a default of max(1, (hardwareThreads / 2) - 1)) threads. Returns false if already started.
    bool start(size_t numberOfThreads = 0);
    // Joins the worker threads. Jobs still in the queue are run on the calling thread before returning.
    void stop();

    // Runs |job| on a worker thread, or immediately on the calling thread if the pool isn't running.
    void enqueue(std::function<void()> job);

    size_t numberOfThreads() const { return m_workerThreads.size(); }

private:
    void workerThreadMain(size_t threadNumber);

    std::atomic<bool> m_running;
    std::atomic<bool> m_quit;
    std::vector<std::thread> m_workerThreads;

    // Protects m_jobQueue
    std::mutex m_jobQueueMutex;
    std::condition_variable m_jobQueueCondition;
    std::deque<std::function<void()>> m_jobQueue;
};

} // namespace loom

#endif // SRC_LOOM_WORKER_POOL_HPP_
