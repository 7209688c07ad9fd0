#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace sdbx::concurrency {

class AsyncService {
public:
    explicit AsyncService(std::string serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    // Joins the worker. Safe to call from the worker itself, which then only
    // raises the interrupt flag.
    virtual void stop();

    virtual void restart();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }

    // Sleeps for d or until stop() is called.
    void lazySleep(std::chrono::milliseconds d);

private:
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
    std::mutex lifecycleMutex_;
};

}
