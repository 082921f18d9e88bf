#include "loom/Timer.hpp"

#include "spdlog/spdlog.h"

namespace loom {

void LogPerfLogger::spanStarted(const std::string& name) {
    SPDLOG_TRACE("{} started", name);
}

void LogPerfLogger::spanFinished(const std::string& name, std::chrono::microseconds duration) {
    SPDLOG_DEBUG("{} took {:.3f}ms", name, static_cast<double>(duration.count()) / 1000.0);
}

Timer::Timer(std::string name, PerfLogger* perfLogger):
    m_name(std::move(name)),
    m_perfLogger(perfLogger),
    m_start(std::chrono::steady_clock::now()),
    m_running(perfLogger != nullptr) {
    if (m_perfLogger) {
        m_perfLogger->spanStarted(m_name);
    }
}

Timer::~Timer() {
    stop();
}

void Timer::stop() {
    if (!m_running) { return; }
    m_running = false;
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - m_start);
    m_perfLogger->spanFinished(m_name, duration);
}

} // namespace loom
