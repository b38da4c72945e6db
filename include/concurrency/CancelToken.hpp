#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace cf::concurrency {

// Copies share one flag, so a token handed to a worker can be cancelled by
// whoever kept the original.
class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    [[nodiscard]] static CancelToken withDeadline(Clock::time_point deadline);
    [[nodiscard]] static CancelToken withTimeout(Clock::duration timeout);

    void cancel() const { flag_->store(true); }

    [[nodiscard]] bool cancelled() const;

    [[nodiscard]] const std::optional<Clock::time_point>& deadline() const { return deadline_; }

    // Time left before the deadline, nullopt when there is none.
    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const;

    void throwIfCancelled(const std::string& operation, const std::string& key) const;

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::optional<Clock::time_point> deadline_;
};

}
