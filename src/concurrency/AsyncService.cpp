#include "concurrency/AsyncService.hpp"
#include "logging/LogRegistry.hpp"

using namespace cf::concurrency;
using namespace cf::logging;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            LogRegistry::coffer()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    LogRegistry::coffer()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    LogRegistry::coffer()->info("[{}] Stopping service...", serviceName_);
    handleInterrupt();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    LogRegistry::coffer()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    LogRegistry::coffer()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

void AsyncService::handleInterrupt() {
    {
        std::lock_guard lock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();
}

void AsyncService::lazySleep(const std::chrono::milliseconds duration) {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait_for(lock, duration, [this] { return shouldStop(); });
}
