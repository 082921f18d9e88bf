#ifndef SRC_LOOM_TIMER_HPP_
#define SRC_LOOM_TIMER_HPP_

#include <chrono>
#include <string>
#include <utility>

namespace loom {

// Receives timing spans. Implementations must be thread safe, as concurrent project builds report to the same
// PerfLogger.
class PerfLogger {
public:
    PerfLogger() = default;
    virtual ~PerfLogger() = default;

    virtual void spanStarted(const std::string& name) = 0;
    virtual void spanFinished(const std::string& name, std::chrono::microseconds duration) = 0;
};

// Logs every finished span at debug level.
class LogPerfLogger : public PerfLogger {
public:
    LogPerfLogger() = default;
    virtual ~LogPerfLogger() = default;

    void spanStarted(const std::string& name) override;
    void spanFinished(const std::string& name, std::chrono::microseconds duration) override;
};

// Scoped timing span. Starts on construction and reports to the PerfLogger when stopped or destroyed, whichever comes
// first. A null PerfLogger makes the Timer do nothing.
class Timer {
public:
    Timer() = delete;
    Timer(std::string name, PerfLogger* perfLogger);
    ~Timer();

    void stop();

    // Times the call of |function| and returns its result.
    template <typename F> static auto time(std::string name, PerfLogger* perfLogger, F&& function) {
        Timer timer(std::move(name), perfLogger);
        return function();
    }

private:
    std::string m_name;
    PerfLogger* m_perfLogger;
    std::chrono::steady_clock::time_point m_start;
    bool m_running;
};

} // namespace loom

#endif // SRC_LOOM_TIMER_HPP_
