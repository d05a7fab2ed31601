#pragma once

#include "lobbylink/rtc/rtc_types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lobbylink::signaling {

struct PlayerInfo {
    std::string player_id;
    std::string player_name;
    std::string virtual_ip;
    std::string virtual_domain;
    bool use_domain = false;
};

struct ShareInfo {
    std::string id;
    std::string name;
    std::string owner_id;
    std::int64_t expire_time = 0;   // unix seconds, 0 = never
    std::int64_t created_at = 0;
};

struct RegisterMessage {
    std::string client_id;
    std::string player_name;
    std::string virtual_ip;
    std::string virtual_domain;
    bool use_domain = false;
    std::string lobby_name;
    std::string lobby_password;
    std::string client_version;
};

struct RegisterSuccess {
    std::string lobby_id;
};

struct RegisterError {
    std::string message;
};

struct VersionTooOld {
    std::string current_version;
    std::string minimum_version;
    std::string download_url;
};

struct PlayersList {
    std::vector<PlayerInfo> players;
};

struct PlayerJoined {
    PlayerInfo player;
};

struct PlayerLeft {
    std::string player_id;
    std::string virtual_domain;
};

struct OfferMessage {
    std::string from;
    std::string to;
    rtc::SessionDescription offer;
    std::string player_name;
};

struct AnswerMessage {
    std::string from;
    std::string to;
    rtc::SessionDescription answer;
};

struct IceCandidateMessage {
    std::string from;
    std::string to;
    rtc::IceCandidate candidate;
};

struct StatusUpdate {
    std::string client_id;
    bool mic_enabled = false;
};

struct ChatMessage {
    std::string from;
    std::string player_id;
    std::string player_name;
    std::string content;
    std::int64_t timestamp = 0;   // unix millis
};

struct ShareAdded {
    std::string from;
    ShareInfo share;
};

struct ShareUpdated {
    std::string from;
    ShareInfo share;
};

struct ShareRemoved {
    std::string from;
    std::string share_id;
};

struct LeaveMessage {
    std::string client_id;
};

using SignalingMessage = std::variant<
    RegisterMessage,
    RegisterSuccess,
    RegisterError,
    VersionTooOld,
    PlayersList,
    PlayerJoined,
    PlayerLeft,
    OfferMessage,
    AnswerMessage,
    IceCandidateMessage,
    StatusUpdate,
    ChatMessage,
    ShareAdded,
    ShareUpdated,
    ShareRemoved,
    LeaveMessage>;

// JSON text codec for the signaling wire format. The "type" field selects
// the message kind.
class SignalingCodec {
public:
    static std::string encode(const SignalingMessage& message);

    // Throws core::ProtocolError on malformed JSON or missing fields.
    // Returns std::nullopt for a well-formed message of an unknown type.
    static std::optional<SignalingMessage> decode(const std::string& text);

    static const char* type_name(const SignalingMessage& message);
};

}
