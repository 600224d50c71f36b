#ifndef CALCMCP_PERIODIC_TASK_HPP
#define CALCMCP_PERIODIC_TASK_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace calcmcp {

// One-shot cancellation flag that sleepers can wait on.
class CancellationSignal {
public:
    void cancel();
    bool cancelled() const;

    // Sleep for up to duration. Returns true if cancelled meanwhile.
    template <class Rep, class Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_; });
    }

    // Re-arm after cancel(); only valid while nobody is waiting.
    void reset();

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

/**
 * Runs a callback on a fixed interval on its own thread.
 *
 * The first run happens one interval after start(). stop() wakes the thread
 * immediately and joins it; the destructor stops a running task.
 */
class PeriodicTask {
public:
    PeriodicTask() = default;
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start(std::chrono::milliseconds interval, std::function<void()> callback);
    void stop();
    bool running() const { return thread_.joinable(); }

private:
    CancellationSignal cancel_;
    std::thread thread_;
};

} // namespace calcmcp

#endif // CALCMCP_PERIODIC_TASK_HPP
