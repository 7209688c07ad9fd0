#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace sdbx::concurrency;

AsyncService::AsyncService(std::string serviceName)
    : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    std::scoped_lock lock(lifecycleMutex_);
    if (isRunning()) return;

    // A previous worker may have exited on its own
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::sync()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::sync()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (worker_.joinable() && std::this_thread::get_id() == worker_.get_id()) {
        interruptFlag_.store(true, std::memory_order_release);
        return;
    }

    std::scoped_lock lock(lifecycleMutex_);
    if (!worker_.joinable()) return;

    log::Registry::sync()->debug("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock sleepLock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();

    worker_.join();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    log::Registry::sync()->debug("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    log::Registry::sync()->debug("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

void AsyncService::lazySleep(const std::chrono::milliseconds d) {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait_for(lock, d, [this] { return shouldStop(); });
}
