#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace sw::concurrency {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(std::memory_order_acquire); }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }

    // Sleeps until the deadline, waking early when stop() is requested.
    template <typename Clock, typename Duration>
    void lazySleepUntil(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock lock(sleepMutex_);
        sleepCv_.wait_until(lock, deadline, [this] { return shouldStop(); });
    }

    virtual void runLoop() = 0;

private:
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

}
