#include "lobbylink/signaling/signaling_messages.hpp"
#include "lobbylink/core/error.hpp"
#include "lobbylink/core/json.hpp"

namespace lobbylink::signaling {

namespace {

namespace json = core::json;

template<typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

Json::Value encode_player(const PlayerInfo& player) {
    Json::Value value;
    value["playerId"] = player.player_id;
    value["playerName"] = player.player_name;
    value["virtualIp"] = player.virtual_ip;
    value["virtualDomain"] = player.virtual_domain;
    value["useDomain"] = player.use_domain;
    return value;
}

PlayerInfo decode_player(const Json::Value& value) {
    if (!value.isObject()) {
        throw core::ProtocolError("Player entry is not an object");
    }
    PlayerInfo player;
    player.player_id = json::require_string(value, "playerId");
    player.player_name = json::optional_string(value, "playerName");
    player.virtual_ip = json::optional_string(value, "virtualIp");
    player.virtual_domain = json::optional_string(value, "virtualDomain");
    player.use_domain = json::optional_bool(value, "useDomain");
    return player;
}

Json::Value encode_share(const ShareInfo& share) {
    Json::Value value;
    value["id"] = share.id;
    value["name"] = share.name;
    value["ownerId"] = share.owner_id;
    value["expireTime"] = Json::Int64(share.expire_time);
    value["createdAt"] = Json::Int64(share.created_at);
    return value;
}

ShareInfo decode_share(const Json::Value& value) {
    ShareInfo share;
    share.id = json::require_string(value, "id");
    share.name = json::optional_string(value, "name");
    share.owner_id = json::optional_string(value, "ownerId");
    share.expire_time = json::optional_int64(value, "expireTime");
    share.created_at = json::optional_int64(value, "createdAt");
    return share;
}

Json::Value encode_description(const rtc::SessionDescription& description) {
    Json::Value value;
    value["type"] = description.type;
    value["sdp"] = description.sdp;
    return value;
}

rtc::SessionDescription decode_description(const Json::Value& value) {
    return rtc::SessionDescription{json::require_string(value, "type"),
                                   json::require_string(value, "sdp")};
}

Json::Value encode_message(const SignalingMessage& message) {
    Json::Value root;
    root["type"] = SignalingCodec::type_name(message);

    std::visit(overloaded{
        [&](const RegisterMessage& m) {
            root["clientId"] = m.client_id;
            root["playerName"] = m.player_name;
            root["virtualIp"] = m.virtual_ip;
            root["virtualDomain"] = m.virtual_domain;
            root["useDomain"] = m.use_domain;
            root["lobbyName"] = m.lobby_name;
            root["lobbyPassword"] = m.lobby_password;
            root["clientVersion"] = m.client_version;
        },
        [&](const RegisterSuccess& m) { root["lobbyId"] = m.lobby_id; },
        [&](const RegisterError& m) { root["message"] = m.message; },
        [&](const VersionTooOld& m) {
            root["currentVersion"] = m.current_version;
            root["minimumVersion"] = m.minimum_version;
            root["downloadUrl"] = m.download_url;
        },
        [&](const PlayersList& m) {
            Json::Value players(Json::arrayValue);
            for (const auto& player : m.players) {
                players.append(encode_player(player));
            }
            root["players"] = players;
        },
        [&](const PlayerJoined& m) {
            auto player = encode_player(m.player);
            for (const auto& key : player.getMemberNames()) {
                root[key] = player[key];
            }
        },
        [&](const PlayerLeft& m) {
            root["playerId"] = m.player_id;
            root["virtualDomain"] = m.virtual_domain;
        },
        [&](const OfferMessage& m) {
            root["from"] = m.from;
            root["to"] = m.to;
            root["offer"] = encode_description(m.offer);
            if (!m.player_name.empty()) {
                root["playerName"] = m.player_name;
            }
        },
        [&](const AnswerMessage& m) {
            root["from"] = m.from;
            root["to"] = m.to;
            root["answer"] = encode_description(m.answer);
        },
        [&](const IceCandidateMessage& m) {
            root["from"] = m.from;
            root["to"] = m.to;
            Json::Value candidate;
            candidate["candidate"] = m.candidate.candidate;
            candidate["sdpMLineIndex"] = m.candidate.sdp_mline_index;
            candidate["sdpMid"] = m.candidate.sdp_mid;
            root["candidate"] = candidate;
        },
        [&](const StatusUpdate& m) {
            root["clientId"] = m.client_id;
            root["micEnabled"] = m.mic_enabled;
        },
        [&](const ChatMessage& m) {
            root["from"] = m.from;
            root["playerId"] = m.player_id;
            root["playerName"] = m.player_name;
            root["content"] = m.content;
            root["timestamp"] = Json::Int64(m.timestamp);
        },
        [&](const ShareAdded& m) {
            root["from"] = m.from;
            root["share"] = encode_share(m.share);
        },
        [&](const ShareUpdated& m) {
            root["from"] = m.from;
            root["share"] = encode_share(m.share);
        },
        [&](const ShareRemoved& m) {
            root["from"] = m.from;
            root["shareId"] = m.share_id;
        },
        [&](const LeaveMessage& m) { root["clientId"] = m.client_id; },
    }, message);

    return root;
}

}

const char* SignalingCodec::type_name(const SignalingMessage& message) {
    return std::visit(overloaded{
        [](const RegisterMessage&) { return "register"; },
        [](const RegisterSuccess&) { return "register-success"; },
        [](const RegisterError&) { return "register-error"; },
        [](const VersionTooOld&) { return "version-too-old"; },
        [](const PlayersList&) { return "players-list"; },
        [](const PlayerJoined&) { return "player-joined"; },
        [](const PlayerLeft&) { return "player-left"; },
        [](const OfferMessage&) { return "offer"; },
        [](const AnswerMessage&) { return "answer"; },
        [](const IceCandidateMessage&) { return "ice-candidate"; },
        [](const StatusUpdate&) { return "status-update"; },
        [](const ChatMessage&) { return "chat-message"; },
        [](const ShareAdded&) { return "share-added"; },
        [](const ShareUpdated&) { return "share-updated"; },
        [](const ShareRemoved&) { return "share-removed"; },
        [](const LeaveMessage&) { return "leave"; },
    }, message);
}

std::string SignalingCodec::encode(const SignalingMessage& message) {
    return json::write(encode_message(message));
}

std::optional<SignalingMessage> SignalingCodec::decode(const std::string& text) {
    auto root = json::parse_object(text);
    auto type = json::require_string(root, "type");

    if (type == "register") {
        RegisterMessage m;
        m.client_id = json::require_string(root, "clientId");
        m.player_name = json::optional_string(root, "playerName");
        m.virtual_ip = json::optional_string(root, "virtualIp");
        m.virtual_domain = json::optional_string(root, "virtualDomain");
        m.use_domain = json::optional_bool(root, "useDomain");
        m.lobby_name = json::optional_string(root, "lobbyName");
        m.lobby_password = json::optional_string(root, "lobbyPassword");
        m.client_version = json::optional_string(root, "clientVersion");
        return m;
    }
    if (type == "register-success") {
        return RegisterSuccess{json::optional_string(root, "lobbyId")};
    }
    if (type == "register-error") {
        return RegisterError{json::optional_string(root, "message", "Registration rejected")};
    }
    if (type == "version-too-old") {
        return VersionTooOld{json::optional_string(root, "currentVersion"),
                             json::optional_string(root, "minimumVersion"),
                             json::optional_string(root, "downloadUrl")};
    }
    if (type == "players-list") {
        const auto& players = root["players"];
        if (!players.isArray()) {
            throw core::ProtocolError("Missing array field: players");
        }
        PlayersList m;
        for (const auto& player : players) {
            m.players.push_back(decode_player(player));
        }
        return m;
    }
    if (type == "player-joined") {
        return PlayerJoined{decode_player(root)};
    }
    if (type == "player-left") {
        return PlayerLeft{json::require_string(root, "playerId"),
                          json::optional_string(root, "virtualDomain")};
    }
    if (type == "offer") {
        OfferMessage m;
        m.from = json::require_string(root, "from");
        m.to = json::optional_string(root, "to");
        m.offer = decode_description(json::require_object(root, "offer"));
        m.player_name = json::optional_string(root, "playerName");
        return m;
    }
    if (type == "answer") {
        AnswerMessage m;
        m.from = json::require_string(root, "from");
        m.to = json::optional_string(root, "to");
        m.answer = decode_description(json::require_object(root, "answer"));
        return m;
    }
    if (type == "ice-candidate") {
        IceCandidateMessage m;
        m.from = json::require_string(root, "from");
        m.to = json::optional_string(root, "to");
        const auto& candidate = json::require_object(root, "candidate");
        m.candidate.candidate = json::require_string(candidate, "candidate");
        m.candidate.sdp_mline_index = static_cast<int>(json::optional_int64(candidate, "sdpMLineIndex"));
        m.candidate.sdp_mid = json::optional_string(candidate, "sdpMid");
        return m;
    }
    if (type == "status-update") {
        return StatusUpdate{json::require_string(root, "clientId"),
                            json::require_bool(root, "micEnabled")};
    }
    if (type == "chat-message") {
        ChatMessage m;
        m.from = json::optional_string(root, "from");
        m.player_id = json::require_string(root, "playerId");
        m.player_name = json::optional_string(root, "playerName");
        m.content = json::require_string(root, "content");
        m.timestamp = json::optional_int64(root, "timestamp");
        return m;
    }
    if (type == "share-added") {
        return ShareAdded{json::require_string(root, "from"),
                          decode_share(json::require_object(root, "share"))};
    }
    if (type == "share-updated") {
        return ShareUpdated{json::require_string(root, "from"),
                            decode_share(json::require_object(root, "share"))};
    }
    if (type == "share-removed") {
        return ShareRemoved{json::require_string(root, "from"),
                            json::require_string(root, "shareId")};
    }
    if (type == "leave") {
        return LeaveMessage{json::require_string(root, "clientId")};
    }

    return std::nullopt;
}

}
