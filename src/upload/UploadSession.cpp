#include "upload/UploadSession.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace cf::upload {

std::string_view to_string(const SessionState state) {
    switch (state) {
        case SessionState::Initiated: return "initiated";
        case SessionState::Uploading: return "uploading";
        case SessionState::Completing: return "completing";
        case SessionState::Completed: return "completed";
        case SessionState::Aborted: return "aborted";
    }
    return "unknown";
}

uintmax_t SessionInfo::uploadedBytes() const {
    uintmax_t total = 0;
    for (const auto& [_, part] : parts) total += part.size;
    return total;
}

SessionInfo UploadSession::snapshot() const {
    return {
        .upload_id = upload_id,
        .key = key,
        .state = state,
        .parts = parts,
        .parts_in_flight = parts_in_flight,
        .reserved_bytes = reservation.active() ? reservation.bytes() : 0,
        .created_at = created_at,
        .expires_at = expires_at
    };
}

void to_json(nlohmann::json& j, const SessionInfo& info) {
    j = {
        {"upload_id", info.upload_id},
        {"key", info.key},
        {"state", std::string(to_string(info.state))},
        {"parts", info.parts.size()},
        {"parts_in_flight", info.parts_in_flight},
        {"uploaded_bytes", info.uploadedBytes()},
        {"reserved_bytes", info.reserved_bytes},
        {"created_at", util::timestampToString(std::chrono::system_clock::to_time_t(info.created_at))},
        {"expires_at", util::timestampToString(std::chrono::system_clock::to_time_t(info.expires_at))}
    };
}

}
