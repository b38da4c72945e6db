#include "storage/StorageError.hpp"

#include <fmt/format.h>

namespace cf::storage {

std::string_view to_string(const ErrorCode code) {
    switch (code) {
        case ErrorCode::UnsupportedBackend: return "unsupported_backend";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::PermissionDenied: return "permission_denied";
        case ErrorCode::StorageFull: return "storage_full";
        case ErrorCode::InvalidKey: return "invalid_key";
        case ErrorCode::UploadFailed: return "upload_failed";
        case ErrorCode::DownloadFailed: return "download_failed";
        case ErrorCode::DeleteFailed: return "delete_failed";
        case ErrorCode::Corruption: return "corruption";
        case ErrorCode::ShareExpired: return "share_expired";
        case ErrorCode::ShareExhausted: return "share_exhausted";
        case ErrorCode::ShareRevoked: return "share_revoked";
        case ErrorCode::ShareForbidden: return "share_forbidden";
        case ErrorCode::InvalidOperation: return "invalid_operation";
        case ErrorCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

static std::string composeMessage(const ErrorCode code, const std::string& operation, const std::string& key,
                                  const std::string& message) {
    if (operation.empty() && key.empty()) return fmt::format("{}: {}", to_string(code), message);
    return fmt::format("{} [{} '{}']: {}", to_string(code), operation, key, message);
}

StorageError::StorageError(const ErrorCode code, std::string operation, std::string key, const std::string& message,
                           std::exception_ptr cause)
    : std::runtime_error(composeMessage(code, operation, key, message)),
      code_(code), operation_(std::move(operation)), key_(std::move(key)), cause_(std::move(cause)) {}

StorageError::StorageError(const ErrorCode code, const std::string& message)
    : std::runtime_error(composeMessage(code, {}, {}, message)), code_(code) {}

void StorageError::rethrowCause() const {
    if (cause_) std::rethrow_exception(cause_);
}

void rethrowWrapped(const ErrorCode code, const std::string& operation, const std::string& key) {
    const auto current = std::current_exception();
    try {
        std::rethrow_exception(current);
    } catch (const StorageError&) {
        throw;
    } catch (const std::exception& e) {
        throw StorageError(code, operation, key, e.what(), current);
    } catch (...) {
        throw StorageError(code, operation, key, "unknown failure", current);
    }
}

}
