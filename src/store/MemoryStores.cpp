#include "store/MemoryStores.hpp"

#include <algorithm>
#include <stdexcept>

using namespace cf::store;
using namespace cf::types;

// #########################################################################
// ################################ FILES ##################################
// #########################################################################

std::optional<File> MemoryFileStore::get(const std::string& id, const Include include) const {
    std::shared_lock lock(mutex_);
    const auto it = files_.find(id);
    if (it == files_.end() || !matches(it->second, include)) return std::nullopt;
    return it->second;
}

std::vector<File> MemoryFileStore::children(const std::string& ownerId, const std::optional<std::string>& parentId,
                                            const Include include) const {
    std::shared_lock lock(mutex_);
    std::vector<File> out;
    for (const auto& [_, f] : files_)
        if (f.owner_id == ownerId && f.parent_id == parentId && matches(f, include)) out.push_back(f);
    std::ranges::sort(out, {}, &File::name);
    return out;
}

std::optional<File> MemoryFileStore::findChild(const std::string& ownerId, const std::optional<std::string>& parentId,
                                               const std::string& name, const Include include) const {
    std::shared_lock lock(mutex_);
    for (const auto& [_, f] : files_)
        if (f.owner_id == ownerId && f.parent_id == parentId && f.name == name && matches(f, include)) return f;
    return std::nullopt;
}

void MemoryFileStore::insert(const File& file) {
    std::unique_lock lock(mutex_);
    if (!files_.emplace(file.id, file).second)
        throw std::runtime_error("[MemoryFileStore] Duplicate file id: " + file.id);
}

void MemoryFileStore::update(const File& file) {
    std::unique_lock lock(mutex_);
    const auto it = files_.find(file.id);
    if (it == files_.end()) throw std::runtime_error("[MemoryFileStore] No file with id: " + file.id);
    it->second = file;
}

void MemoryFileStore::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    files_.erase(id);
}

// #########################################################################
// ############################### VERSIONS ################################
// #########################################################################

std::optional<unsigned int> MemoryVersionStore::latestNumber(const std::string& fileId) const {
    std::shared_lock lock(mutex_);
    const auto it = versions_.find(fileId);
    if (it == versions_.end() || it->second.empty()) return std::nullopt;
    return it->second.rbegin()->first;
}

void MemoryVersionStore::insert(const FileVersion& version) {
    std::unique_lock lock(mutex_);
    if (!versions_[version.file_id].emplace(version.version_number, version).second)
        throw std::runtime_error("[MemoryVersionStore] Duplicate version " + std::to_string(version.version_number) +
                                 " for file " + version.file_id);
}

std::optional<FileVersion> MemoryVersionStore::get(const std::string& fileId, const unsigned int number) const {
    std::shared_lock lock(mutex_);
    const auto it = versions_.find(fileId);
    if (it == versions_.end()) return std::nullopt;
    const auto v = it->second.find(number);
    if (v == it->second.end()) return std::nullopt;
    return v->second;
}

std::vector<FileVersion> MemoryVersionStore::list(const std::string& fileId) const {
    std::shared_lock lock(mutex_);
    std::vector<FileVersion> out;
    if (const auto it = versions_.find(fileId); it != versions_.end())
        for (const auto& [_, v] : it->second) out.push_back(v);
    return out;
}

void MemoryVersionStore::remove(const std::string& fileId, const unsigned int number) {
    std::unique_lock lock(mutex_);
    if (const auto it = versions_.find(fileId); it != versions_.end()) it->second.erase(number);
}

void MemoryVersionStore::removeAll(const std::string& fileId) {
    std::unique_lock lock(mutex_);
    versions_.erase(fileId);
}

// #########################################################################
// ################################ SHARES #################################
// #########################################################################

std::optional<Share> MemoryShareStore::get(const std::string& id) const {
    std::shared_lock lock(mutex_);
    const auto it = shares_.find(id);
    if (it == shares_.end()) return std::nullopt;
    return it->second;
}

std::optional<Share> MemoryShareStore::getByToken(const std::string& token) const {
    std::shared_lock lock(mutex_);
    const auto it = byToken_.find(token);
    if (it == byToken_.end()) return std::nullopt;
    return shares_.at(it->second);
}

bool MemoryShareStore::tokenExists(const std::string& token) const {
    std::shared_lock lock(mutex_);
    return byToken_.contains(token);
}

void MemoryShareStore::insert(const Share& share) {
    std::unique_lock lock(mutex_);
    if (byToken_.contains(share.token)) throw std::runtime_error("[MemoryShareStore] Duplicate share token");
    if (!shares_.emplace(share.id, share).second)
        throw std::runtime_error("[MemoryShareStore] Duplicate share id: " + share.id);
    byToken_.emplace(share.token, share.id);
}

void MemoryShareStore::setActive(const std::string& id, const bool active) {
    std::unique_lock lock(mutex_);
    if (const auto it = shares_.find(id); it != shares_.end()) it->second.is_active = active;
}

bool MemoryShareStore::update(const Share& share) {
    std::unique_lock lock(mutex_);
    const auto it = shares_.find(share.id);
    if (it == shares_.end() || !it->second.is_active) return false;
    it->second.password_hash = share.password_hash;
    it->second.access = share.access;
    it->second.expires_at = share.expires_at;
    it->second.max_downloads = share.max_downloads;
    return true;
}

bool MemoryShareStore::tryIncrementDownloads(const std::string& id) {
    std::unique_lock lock(mutex_);
    const auto it = shares_.find(id);
    if (it == shares_.end() || !it->second.is_active || it->second.exhausted()) return false;
    ++it->second.download_count;
    return true;
}

std::vector<Share> MemoryShareStore::listForFile(const std::string& fileId) const {
    std::shared_lock lock(mutex_);
    std::vector<Share> out;
    for (const auto& [_, s] : shares_) if (s.file_id == fileId) out.push_back(s);
    std::ranges::sort(out, {}, &Share::created_at);
    return out;
}

std::vector<Share> MemoryShareStore::listForUser(const std::string& userId) const {
    std::shared_lock lock(mutex_);
    std::vector<Share> out;
    for (const auto& [_, s] : shares_) if (s.issued_by == userId) out.push_back(s);
    std::ranges::sort(out, {}, &Share::created_at);
    return out;
}

// #########################################################################
// ################################ QUOTAS #################################
// #########################################################################

std::optional<UserQuota> MemoryQuotaStore::get(const std::string& userId) const {
    std::shared_lock lock(mutex_);
    const auto it = quotas_.find(userId);
    if (it == quotas_.end()) return std::nullopt;
    return it->second;
}

void MemoryQuotaStore::upsert(const UserQuota& quota) {
    std::unique_lock lock(mutex_);
    quotas_[quota.user_id] = quota;
}
