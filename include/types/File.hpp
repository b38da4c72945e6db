#pragma once

#include <ctime>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pqxx { class row; class result; }

namespace cf::types {

enum class FileKind { File, Directory };

enum class Lifecycle { Active, Tombstoned };

// Every lookup says whether tombstoned rows are wanted.
enum class Include { ActiveOnly, WithTombstoned };

struct File {
    std::string id;
    std::string owner_id;
    std::optional<std::string> parent_id; // nullopt: root of the owner's forest
    std::string name;
    std::string path;                     // "/" joined names from the root
    uintmax_t size_bytes = 0;
    std::string mime_type;
    std::string content_hash;
    FileKind kind = FileKind::File;
    bool is_public = false;
    std::optional<std::string> share_token;
    unsigned int current_version = 0;
    Lifecycle lifecycle = Lifecycle::Active;
    std::optional<std::time_t> tombstoned_at;
    std::optional<std::string> tombstone_batch; // shared by every row one tombstone() call touched
    std::time_t created_at = 0;
    std::time_t updated_at = 0;

    File() = default;
    explicit File(const pqxx::row& row);

    [[nodiscard]] bool isActive() const { return lifecycle == Lifecycle::Active; }
    [[nodiscard]] bool isDirectory() const { return kind == FileKind::Directory; }
};

[[nodiscard]] std::string to_string(FileKind kind);
[[nodiscard]] FileKind fileKindFromString(const std::string& s);

[[nodiscard]] bool matches(const File& f, Include include);

std::vector<File> files_from_pq_res(const pqxx::result& res);

void to_json(nlohmann::json& j, const File& f);

}
