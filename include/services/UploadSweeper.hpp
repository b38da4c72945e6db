#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <memory>

namespace cf::upload { class MultipartCoordinator; }

namespace cf::services {

// Periodically aborts multipart sessions that outlived their TTL.
class UploadSweeper final : public concurrency::AsyncService {
public:
    explicit UploadSweeper(std::shared_ptr<upload::MultipartCoordinator> coordinator);
    UploadSweeper(std::shared_ptr<upload::MultipartCoordinator> coordinator, std::chrono::milliseconds sweepInterval);
    ~UploadSweeper() override;

    // One pass, callable without starting the thread.
    size_t sweepOnce();

protected:
    void runLoop() override;

private:
    std::shared_ptr<upload::MultipartCoordinator> coordinator_;
    std::chrono::milliseconds sweep_interval_;
};

}
