#include "lobbylink/storage/share_catalog.hpp"
#include "lobbylink/core/logger.hpp"
#include "lobbylink/core/utils.hpp"

namespace lobbylink::storage {

signaling::ShareInfo SharedFolder::to_share_info() const {
    signaling::ShareInfo info;
    info.id = id;
    info.name = name;
    info.owner_id = owner_id;
    info.expire_time = expire_time.value_or(0);
    info.created_at = created_at;
    return info;
}

core::Result ShareCatalog::add_local_share(const SharedFolder& share) {
    if (share.id.empty()) {
        return core::Result(core::ErrorCode::INVALID_MESSAGE, "Share id must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = local_.emplace(share.id, share);
    if (!inserted) {
        return core::Result(core::ErrorCode::INVALID_STATE, "Share already exists: " + share.id);
    }
    if (it->second.created_at == 0) {
        it->second.created_at = core::utils::TimeUtils::unix_millis();
    }

    LOG_INFO("Sharing '{}' ({}) from {}", share.name, share.id, share.folder_path.string());
    return core::Result();
}

core::Result ShareCatalog::update_local_share(const SharedFolder& share) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = local_.find(share.id);
    if (it == local_.end()) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Unknown share: " + share.id);
    }

    auto created_at = it->second.created_at;
    it->second = share;
    it->second.created_at = created_at;
    return core::Result();
}

core::Result ShareCatalog::remove_local_share(const std::string& share_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (local_.erase(share_id) == 0) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Unknown share: " + share_id);
    }
    LOG_INFO("Stopped sharing {}", share_id);
    return core::Result();
}

std::optional<SharedFolder> ShareCatalog::local_share(const std::string& share_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = local_.find(share_id);
    if (it == local_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SharedFolder> ShareCatalog::local_shares() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SharedFolder> shares;
    shares.reserve(local_.size());
    for (const auto& [id, share] : local_) {
        shares.push_back(share);
    }
    return shares;
}

core::Result ShareCatalog::resolve_local_path(const std::string& share_id, const std::string& relative_path,
                                              std::filesystem::path& resolved) const {
    auto share = local_share(share_id);
    if (!share) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Unknown share: " + share_id);
    }
    if (share->is_expired(core::utils::TimeUtils::unix_seconds())) {
        return core::Result(core::ErrorCode::NOT_FOUND, "Share has expired: " + share_id);
    }

    std::filesystem::path relative(relative_path);
    if (relative_path.empty() || relative.is_absolute() || relative.has_root_name()) {
        return core::Result(core::ErrorCode::INVALID_MESSAGE, "Invalid file path: " + relative_path);
    }
    for (const auto& part : relative) {
        if (part == "..") {
            return core::Result(core::ErrorCode::INVALID_MESSAGE, "Path escapes share: " + relative_path);
        }
    }

    resolved = share->folder_path / relative;
    return core::Result();
}

void ShareCatalog::apply_remote_added(const signaling::ShareInfo& share) {
    std::lock_guard<std::mutex> lock(mutex_);
    remote_[{share.owner_id, share.id}] = share;
    LOG_DEBUG("Remote share '{}' from {}", share.name, share.owner_id);
}

void ShareCatalog::apply_remote_updated(const signaling::ShareInfo& share) {
    std::lock_guard<std::mutex> lock(mutex_);
    remote_[{share.owner_id, share.id}] = share;
}

void ShareCatalog::apply_remote_removed(const std::string& owner_id, const std::string& share_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    remote_.erase({owner_id, share_id});
}

std::size_t ShareCatalog::remove_owner(const std::string& owner_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = remote_.begin(); it != remote_.end();) {
        if (it->first.first == owner_id) {
            it = remote_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<signaling::ShareInfo> ShareCatalog::remote_shares() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<signaling::ShareInfo> shares;
    shares.reserve(remote_.size());
    for (const auto& [key, share] : remote_) {
        shares.push_back(share);
    }
    return shares;
}

std::optional<signaling::ShareInfo> ShareCatalog::remote_share(const std::string& owner_id,
                                                               const std::string& share_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = remote_.find({owner_id, share_id});
    if (it == remote_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace lobbylink::storage
