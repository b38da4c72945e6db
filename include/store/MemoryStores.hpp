#pragma once

#include "store/FileStore.hpp"
#include "store/QuotaStore.hpp"
#include "store/ShareStore.hpp"
#include "store/VersionStore.hpp"

#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace cf::store {

// Process-local stores for tests and embedded use.

class MemoryFileStore final : public FileStore {
public:
    [[nodiscard]] std::optional<types::File> get(const std::string& id, types::Include include) const override;

    [[nodiscard]] std::vector<types::File> children(const std::string& ownerId,
                                                    const std::optional<std::string>& parentId,
                                                    types::Include include) const override;

    [[nodiscard]] std::optional<types::File> findChild(const std::string& ownerId,
                                                       const std::optional<std::string>& parentId,
                                                       const std::string& name,
                                                       types::Include include) const override;

    void insert(const types::File& file) override;
    void update(const types::File& file) override;
    void remove(const std::string& id) override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, types::File> files_;
};

class MemoryVersionStore final : public VersionStore {
public:
    [[nodiscard]] std::optional<unsigned int> latestNumber(const std::string& fileId) const override;
    void insert(const types::FileVersion& version) override;
    [[nodiscard]] std::optional<types::FileVersion> get(const std::string& fileId, unsigned int number) const override;
    [[nodiscard]] std::vector<types::FileVersion> list(const std::string& fileId) const override;
    void remove(const std::string& fileId, unsigned int number) override;
    void removeAll(const std::string& fileId) override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::map<unsigned int, types::FileVersion>> versions_;
};

class MemoryShareStore final : public ShareStore {
public:
    [[nodiscard]] std::optional<types::Share> get(const std::string& id) const override;
    [[nodiscard]] std::optional<types::Share> getByToken(const std::string& token) const override;
    [[nodiscard]] bool tokenExists(const std::string& token) const override;
    void insert(const types::Share& share) override;
    [[nodiscard]] bool update(const types::Share& share) override;
    void setActive(const std::string& id, bool active) override;
    [[nodiscard]] bool tryIncrementDownloads(const std::string& id) override;
    [[nodiscard]] std::vector<types::Share> listForFile(const std::string& fileId) const override;
    [[nodiscard]] std::vector<types::Share> listForUser(const std::string& userId) const override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, types::Share> shares_;
    std::unordered_map<std::string, std::string> byToken_;
};

class MemoryQuotaStore final : public QuotaStore {
public:
    [[nodiscard]] std::optional<types::UserQuota> get(const std::string& userId) const override;
    void upsert(const types::UserQuota& quota) override;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, types::UserQuota> quotas_;
};

}
