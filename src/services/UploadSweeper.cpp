#include "services/UploadSweeper.hpp"
#include "upload/MultipartCoordinator.hpp"
#include "logging/LogRegistry.hpp"

using namespace cf::services;
using namespace cf::upload;
using namespace cf::logging;

UploadSweeper::UploadSweeper(std::shared_ptr<MultipartCoordinator> coordinator)
    : UploadSweeper(coordinator, coordinator ? std::chrono::duration_cast<std::chrono::milliseconds>(
                                                   coordinator->config().sweep_interval)
                                             : std::chrono::milliseconds::zero()) {}

UploadSweeper::UploadSweeper(std::shared_ptr<MultipartCoordinator> coordinator, const std::chrono::milliseconds sweepInterval)
    : AsyncService("UploadSweeper"), coordinator_(std::move(coordinator)), sweep_interval_(sweepInterval) {
    if (!coordinator_) throw std::invalid_argument("[UploadSweeper] coordinator is required");
    if (sweep_interval_ <= std::chrono::milliseconds::zero())
        throw std::invalid_argument("[UploadSweeper] sweep interval must be positive");
}

UploadSweeper::~UploadSweeper() { stop(); }

size_t UploadSweeper::sweepOnce() {
    return coordinator_->reapStaleSessions(MultipartCoordinator::Clock::now());
}

void UploadSweeper::runLoop() {
    while (!shouldStop()) {
        try {
            sweepOnce();
        } catch (const std::exception& e) {
            LogRegistry::upload()->warn("[UploadSweeper] Failed to reap stale upload sessions: {}", e.what());
        }

        lazySleep(sweep_interval_);
    }
}
