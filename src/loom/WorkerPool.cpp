#include "loom/WorkerPool.hpp"

#include "spdlog/spdlog.h"

namespace loom {

WorkerPool::WorkerPool(): m_running(false), m_quit(false) {}

WorkerPool::~WorkerPool() { stop(); }

bool WorkerPool::start(size_t numberOfThreads) {
    if (m_running) {
        SPDLOG_WARN("WorkerPool already started with {} threads.", m_workerThreads.size());
        return false;
    }

    if (numberOfThreads == 0) {
        unsigned hardwareThreads = std::thread::hardware_concurrency();
        if (hardwareThreads > 4) {
            numberOfThreads = (hardwareThreads / 2) - 1;
        } else {
            numberOfThreads = 1;
        }
    }

    m_quit = false;
    m_running = true;
    SPDLOG_DEBUG("WorkerPool starting {} threads.", numberOfThreads);
    for (size_t i = 0; i < numberOfThreads; ++i) {
        m_workerThreads.emplace_back(std::thread(&WorkerPool::workerThreadMain, this, i));
    }

    return true;
}

void WorkerPool::stop() {
    if (!m_running) { return; }

    {
        std::lock_guard<std::mutex> lock(m_jobQueueMutex);
        m_quit = true;
    }
    m_jobQueueCondition.notify_all();
    for (auto& thread : m_workerThreads) {
        thread.join();
    }
    m_workerThreads.clear();
    m_running = false;

    std::deque<std::function<void()>> remaining;
    {
        std::lock_guard<std::mutex> lock(m_jobQueueMutex);
        remaining.swap(m_jobQueue);
    }
    SPDLOG_DEBUG("WorkerPool terminated with {} jobs left in queue.", remaining.size());
    for (auto& job : remaining) {
        job();
    }
}

void WorkerPool::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(m_jobQueueMutex);
        if (m_running && !m_quit) {
            m_jobQueue.emplace_back(std::move(job));
            job = nullptr;
        }
    }

    if (job) {
        job();
        return;
    }
    m_jobQueueCondition.notify_one();
}

void WorkerPool::workerThreadMain(size_t threadNumber) {
    SPDLOG_TRACE("WorkerPool thread {} entry.", threadNumber);

    while (true) {
        std::function<void()> workFunction;

        {
            std::unique_lock<std::mutex> lock(m_jobQueueMutex);
            m_jobQueueCondition.wait(lock, [this] { return m_quit || m_jobQueue.size(); });
            if (m_quit) {
                break;
            }

            workFunction = std::move(m_jobQueue.front());
            m_jobQueue.pop_front();
        }

        workFunction();
    }

    SPDLOG_TRACE("WorkerPool thread {} normal exit.", threadNumber);
}

} // namespace loom
