#include "concurrency/CancelToken.hpp"
#include "storage/StorageError.hpp"

using namespace cf::concurrency;
using namespace cf::storage;

CancelToken CancelToken::withDeadline(const Clock::time_point deadline) {
    CancelToken token;
    token.deadline_ = deadline;
    return token;
}

CancelToken CancelToken::withTimeout(const Clock::duration timeout) {
    return withDeadline(Clock::now() + timeout);
}

bool CancelToken::cancelled() const {
    if (flag_->load()) return true;
    return deadline_ && Clock::now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> CancelToken::remaining() const {
    if (!deadline_) return std::nullopt;
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

void CancelToken::throwIfCancelled(const std::string& operation, const std::string& key) const {
    if (!cancelled()) return;
    const bool expired = !flag_->load();
    throw StorageError(ErrorCode::Cancelled, operation, key, expired ? "deadline exceeded" : "operation cancelled");
}
