#include <gtest/gtest.h>
#include "lobbylink/core/error.hpp"
#include "lobbylink/core/json.hpp"
#include "lobbylink/signaling/signaling_messages.hpp"

using namespace lobbylink;
using namespace lobbylink::signaling;

TEST(SignalingCodecTest, RegisterCarriesIdentity) {
    RegisterMessage registration;
    registration.client_id = "player-100";
    registration.player_name = "Alice";
    registration.virtual_ip = "10.7.0.2";
    registration.virtual_domain = "alice.lobby";
    registration.use_domain = true;
    registration.lobby_name = "friday";
    registration.lobby_password = "secret";
    registration.client_version = "1.2.0";

    auto root = core::json::parse_object(SignalingCodec::encode(registration));
    EXPECT_EQ(root["type"].asString(), "register");
    EXPECT_EQ(root["clientId"].asString(), "player-100");
    EXPECT_EQ(root["lobbyName"].asString(), "friday");
    EXPECT_TRUE(root["useDomain"].asBool());
    EXPECT_EQ(root["clientVersion"].asString(), "1.2.0");
}

TEST(SignalingCodecTest, DecodesPlayersList) {
    auto message = SignalingCodec::decode(R"({"type":"players-list","players":[
        {"playerId":"player-100","playerName":"Alice","virtualIp":"10.7.0.2"},
        {"playerId":"player-200","playerName":"Bob","useDomain":true,"virtualDomain":"bob.lobby"}]})");

    ASSERT_TRUE(message.has_value());
    const auto& list = std::get<PlayersList>(*message);
    ASSERT_EQ(list.players.size(), 2u);
    EXPECT_EQ(list.players[0].player_id, "player-100");
    EXPECT_EQ(list.players[0].virtual_ip, "10.7.0.2");
    EXPECT_FALSE(list.players[0].use_domain);
    EXPECT_TRUE(list.players[1].use_domain);
    EXPECT_EQ(list.players[1].virtual_domain, "bob.lobby");
}

TEST(SignalingCodecTest, PlayerJoinedIsFlat) {
    PlayerJoined joined{PlayerInfo{"player-300", "Carol", "10.7.0.4", "", false}};
    auto text = SignalingCodec::encode(joined);

    auto root = core::json::parse_object(text);
    EXPECT_EQ(root["playerId"].asString(), "player-300");
    EXPECT_FALSE(root.isMember("player"));

    auto decoded = SignalingCodec::decode(text);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::get<PlayerJoined>(*decoded).player.player_name, "Carol");
}

TEST(SignalingCodecTest, OfferAnswerAndCandidate) {
    OfferMessage offer{"player-200", "player-100", {"offer", "v=0 offer"}, "Bob"};
    auto decoded_offer = SignalingCodec::decode(SignalingCodec::encode(offer));
    ASSERT_TRUE(decoded_offer.has_value());
    const auto& o = std::get<OfferMessage>(*decoded_offer);
    EXPECT_EQ(o.from, "player-200");
    EXPECT_EQ(o.to, "player-100");
    EXPECT_EQ(o.offer.sdp, "v=0 offer");
    EXPECT_EQ(o.player_name, "Bob");

    auto answer = SignalingCodec::decode(
        R"({"type":"answer","from":"player-100","answer":{"type":"answer","sdp":"v=0 answer"}})");
    ASSERT_TRUE(answer.has_value());
    EXPECT_EQ(std::get<AnswerMessage>(*answer).answer.type, "answer");

    auto candidate = SignalingCodec::decode(R"({"type":"ice-candidate","from":"player-100","to":"player-200",
        "candidate":{"candidate":"candidate:1 1 UDP 2122 10.0.0.1 5000 typ host","sdpMLineIndex":1,"sdpMid":"1"}})");
    ASSERT_TRUE(candidate.has_value());
    const auto& c = std::get<IceCandidateMessage>(*candidate);
    EXPECT_EQ(c.candidate.sdp_mline_index, 1);
    EXPECT_EQ(c.candidate.sdp_mid, "1");
}

TEST(SignalingCodecTest, VersionTooOld) {
    auto message = SignalingCodec::decode(
        R"({"type":"version-too-old","currentVersion":"1.0.0","minimumVersion":"1.2.0","downloadUrl":"https://example.invalid/dl"})");
    ASSERT_TRUE(message.has_value());
    const auto& notice = std::get<VersionTooOld>(*message);
    EXPECT_EQ(notice.minimum_version, "1.2.0");
    EXPECT_EQ(notice.download_url, "https://example.invalid/dl");
}

TEST(SignalingCodecTest, ShareMessagesKeepExpiry) {
    ShareAdded added{"player-100", ShareInfo{"s1", "Music", "player-100", 1900000000, 1700000000000}};
    auto decoded = SignalingCodec::decode(SignalingCodec::encode(added));
    ASSERT_TRUE(decoded.has_value());
    const auto& share = std::get<ShareAdded>(*decoded).share;
    EXPECT_EQ(share.expire_time, 1900000000);
    EXPECT_EQ(share.created_at, 1700000000000);

    auto removed = SignalingCodec::decode(R"({"type":"share-removed","from":"player-100","shareId":"s1"})");
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(std::get<ShareRemoved>(*removed).share_id, "s1");
}

TEST(SignalingCodecTest, StatusAndChat) {
    auto status = SignalingCodec::decode(R"({"type":"status-update","clientId":"player-200","micEnabled":true})");
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(std::get<StatusUpdate>(*status).mic_enabled);

    ChatMessage chat;
    chat.player_id = "player-100";
    chat.player_name = "Alice";
    chat.content = "gg";
    chat.timestamp = 1700000000123;
    auto decoded = SignalingCodec::decode(SignalingCodec::encode(chat));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::get<ChatMessage>(*decoded).timestamp, 1700000000123);
    EXPECT_STREQ(SignalingCodec::type_name(*decoded), "chat-message");
}

TEST(SignalingCodecTest, UnknownTypeIsIgnored) {
    auto message = SignalingCodec::decode(R"({"type":"server-motd","text":"hello"})");
    EXPECT_FALSE(message.has_value());
}

TEST(SignalingCodecTest, MalformedInputThrows) {
    EXPECT_THROW(SignalingCodec::decode("not json"), core::ProtocolError);
    EXPECT_THROW(SignalingCodec::decode("[1,2]"), core::ProtocolError);
    EXPECT_THROW(SignalingCodec::decode(R"({"no":"type"})"), core::ProtocolError);
    EXPECT_THROW(SignalingCodec::decode(R"({"type":"offer","from":"player-1"})"), core::ProtocolError);
    EXPECT_THROW(SignalingCodec::decode(R"({"type":"status-update","clientId":"p","micEnabled":"yes"})"),
                 core::ProtocolError);
    EXPECT_THROW(SignalingCodec::decode(R"({"type":"players-list","players":{}})"), core::ProtocolError);
}
