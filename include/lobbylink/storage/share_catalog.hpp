#pragma once

#include "lobbylink/core/error.hpp"
#include "lobbylink/signaling/signaling_messages.hpp"
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lobbylink::storage {

struct SharedFolder {
    std::string id;
    std::string name;
    std::filesystem::path folder_path;  // never advertised
    std::string owner_id;
    std::optional<std::int64_t> expire_time;  // unix seconds
    std::int64_t created_at = 0;

    bool is_expired(std::int64_t now_seconds) const {
        return expire_time && *expire_time <= now_seconds;
    }

    signaling::ShareInfo to_share_info() const;
};

// Local shares this client serves and remote shares advertised by the lobby.
class ShareCatalog {
public:
    core::Result add_local_share(const SharedFolder& share);
    core::Result update_local_share(const SharedFolder& share);
    core::Result remove_local_share(const std::string& share_id);

    std::optional<SharedFolder> local_share(const std::string& share_id) const;
    std::vector<SharedFolder> local_shares() const;

    // Maps a share-relative path onto the local folder. Absolute paths,
    // ".." components and expired shares are rejected.
    core::Result resolve_local_path(const std::string& share_id, const std::string& relative_path,
                                    std::filesystem::path& resolved) const;

    void apply_remote_added(const signaling::ShareInfo& share);
    void apply_remote_updated(const signaling::ShareInfo& share);
    void apply_remote_removed(const std::string& owner_id, const std::string& share_id);
    std::size_t remove_owner(const std::string& owner_id);

    std::vector<signaling::ShareInfo> remote_shares() const;
    std::optional<signaling::ShareInfo> remote_share(const std::string& owner_id,
                                                     const std::string& share_id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, SharedFolder> local_;
    // keyed by (owner, share id)
    std::map<std::pair<std::string, std::string>, signaling::ShareInfo> remote_;
};

} // namespace lobbylink::storage
