#pragma once

#include "quota/QuotaTracker.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace cf::upload {

enum class SessionState { Initiated, Uploading, Completing, Completed, Aborted };

[[nodiscard]] std::string_view to_string(SessionState state);

struct UploadedPart {
    std::string id;     // backend-assigned identifier
    uintmax_t size = 0;
};

// Read-only snapshot handed out by MultipartCoordinator::describe().
struct SessionInfo {
    std::string upload_id;
    std::string key;
    SessionState state = SessionState::Initiated;
    std::map<unsigned int, UploadedPart> parts;
    unsigned int parts_in_flight = 0;
    uintmax_t reserved_bytes = 0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point expires_at;

    [[nodiscard]] uintmax_t uploadedBytes() const;
};

// Owned by MultipartCoordinator. All fields are guarded by mutex.
struct UploadSession {
    std::string upload_id;
    std::string backend_upload_id;
    std::string key;
    SessionState state = SessionState::Initiated;
    std::map<unsigned int, UploadedPart> parts;
    unsigned int parts_in_flight = 0;
    quota::QuotaReservation reservation;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point expires_at;

    mutable std::mutex mutex;

    [[nodiscard]] bool terminal() const {
        return state == SessionState::Completed || state == SessionState::Aborted;
    }

    [[nodiscard]] bool stale(const std::chrono::system_clock::time_point now) const {
        return !terminal() && now >= expires_at;
    }

    // Caller holds mutex.
    [[nodiscard]] SessionInfo snapshot() const;
};

void to_json(nlohmann::json& j, const SessionInfo& info);

}
