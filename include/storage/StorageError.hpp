#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cf::storage {

enum class ErrorCode {
    UnsupportedBackend,
    NotFound,
    PermissionDenied,
    StorageFull,
    InvalidKey,
    UploadFailed,
    DownloadFailed,
    DeleteFailed,
    Corruption,
    ShareExpired,
    ShareExhausted,
    ShareRevoked,
    ShareForbidden,
    InvalidOperation,
    Cancelled
};

[[nodiscard]] std::string_view to_string(ErrorCode code);

// Every failure the core reports to its caller. Backend failures keep the
// original exception reachable through cause().
class StorageError : public std::runtime_error {
public:
    StorageError(ErrorCode code, std::string operation, std::string key, const std::string& message,
                 std::exception_ptr cause = nullptr);

    StorageError(ErrorCode code, const std::string& message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& operation() const noexcept { return operation_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] std::exception_ptr cause() const noexcept { return cause_; }

    // Rethrows cause() if one is attached.
    void rethrowCause() const;

private:
    ErrorCode code_;
    std::string operation_;
    std::string key_;
    std::exception_ptr cause_;
};

// Rethrows the in-flight exception as a StorageError of the given code, unless
// it already is one. Must be called from inside a catch block.
[[noreturn]] void rethrowWrapped(ErrorCode code, const std::string& operation, const std::string& key);

}
