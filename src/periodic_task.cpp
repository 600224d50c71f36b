#include <calcmcp/periodic_task.hpp>
#include <exception>
#include <iostream>
#include <stdexcept>

namespace calcmcp {

void CancellationSignal::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationSignal::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void CancellationSignal::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = false;
}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start(std::chrono::milliseconds interval, std::function<void()> callback) {
    if (thread_.joinable()) {
        throw std::logic_error("periodic task already running");
    }
    cancel_.reset();

    thread_ = std::thread([this, interval, callback = std::move(callback)] {
        while (!cancel_.wait_for(interval)) {
            try {
                callback();
            } catch (const std::exception& e) {
                std::cerr << "Periodic task failed: " << e.what() << std::endl;
            }
        }
    });
}

void PeriodicTask::stop() {
    if (!thread_.joinable()) {
        return;
    }
    cancel_.cancel();
    thread_.join();
}

} // namespace calcmcp
