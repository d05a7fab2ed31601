#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "lobbylink/session/peer_session_manager.hpp"
#include "support/fakes.hpp"

using namespace lobbylink;
using namespace lobbylink::session;
using namespace lobbylink::signaling;
using lobbylink::testing::FakeDataChannel;
using lobbylink::testing::FakeMediaSource;
using lobbylink::testing::FakePeerConnection;
using lobbylink::testing::FakePeerConnectionFactory;
using lobbylink::testing::FakeSignalingTransport;
using ::testing::ElementsAre;

namespace {

constexpr const char* LOCAL = "player-200";

PlayerInfo player(const std::string& id, const std::string& name = "Guest") {
    PlayerInfo info;
    info.player_id = id;
    info.player_name = name;
    info.virtual_ip = "10.126.0.5";
    return info;
}

rtc::IceCandidate candidate(const std::string& text) {
    return rtc::IceCandidate{text, 0, "0"};
}

class RecordingObserver : public SessionObserver {
public:
    void on_registration(const core::Result& result) override { registrations.push_back(result); }
    void on_peer_joined(const PlayerInfo& p) override { joined.push_back(p.player_id); }
    void on_peer_left(const std::string& peer_id) override { left.push_back(peer_id); }
    void on_peer_status(const std::string& peer_id, bool mic) override { statuses.emplace_back(peer_id, mic); }
    void on_remote_stream(const std::string& peer_id, std::shared_ptr<rtc::AudioTrack>) override {
        streams.push_back(peer_id);
    }
    void on_chat(const ChatMessage& message) override { chats.push_back(message.content); }
    void on_transport_created(const std::string& peer_id,
                              std::shared_ptr<transport::DataChannelTransport>) override {
        transports.push_back(peer_id);
    }

    std::vector<core::Result> registrations;
    std::vector<std::string> joined;
    std::vector<std::string> left;
    std::vector<std::pair<std::string, bool>> statuses;
    std::vector<std::string> streams;
    std::vector<std::string> chats;
    std::vector<std::string> transports;
};

} // namespace

class PeerSessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.negotiation_wait = std::chrono::milliseconds(30);
        options.failure_retry = std::chrono::milliseconds(10);
        options.disconnect_grace = std::chrono::milliseconds(40);
        options.reconnect_settle = std::chrono::milliseconds(5);
        options.join_offer_delay = std::chrono::milliseconds(20);

        auto transport_ptr = std::make_unique<FakeSignalingTransport>(io_context);
        transport = transport_ptr.get();
        channel = std::make_unique<SignalingChannel>(io_context, std::move(transport_ptr), core::SignalingOptions{});
        manager = std::make_unique<PeerSessionManager>(io_context, *channel, factory, &media, options);
        manager->set_observer(&observer);

        LocalIdentity identity;
        identity.client_id = LOCAL;
        identity.player_name = "Ana";
        identity.lobby_name = "friday-night";

        core::Result registered(core::ErrorCode::INVALID_STATE);
        manager->initialize(identity, "ws://lobby.test/signaling",
                            [&registered](const core::Result& r) { registered = r; });
        poll();
        ASSERT_TRUE(registered.success());
    }

    void poll() {
        io_context.restart();
        io_context.poll();
    }

    void run_for(int ms) {
        io_context.restart();
        io_context.run_for(std::chrono::milliseconds(ms));
    }

    // Local side initiates toward a lower id and reaches CONNECTED.
    std::shared_ptr<FakePeerConnection> connect_to(const std::string& peer_id) {
        transport->deliver(PlayersList{{player(peer_id)}});
        poll();
        auto pc = factory.latest(peer_id);
        transport->deliver(AnswerMessage{peer_id, LOCAL, {"answer", "remote-answer"}});
        pc->emit_state(rtc::PeerConnectionState::CONNECTED);
        return pc;
    }

    boost::asio::io_context io_context;
    core::SessionOptions options;
    FakeSignalingTransport* transport = nullptr;
    std::unique_ptr<SignalingChannel> channel;
    FakePeerConnectionFactory factory{io_context};
    FakeMediaSource media;
    RecordingObserver observer;
    std::unique_ptr<PeerSessionManager> manager;
};

TEST(GlareRuleTest, GreaterIdInitiates) {
    EXPECT_TRUE(PeerSessionManager::should_initiate("player-200", "player-100"));
    EXPECT_FALSE(PeerSessionManager::should_initiate("player-100", "player-200"));
    EXPECT_FALSE(PeerSessionManager::should_initiate("player-100", "player-100"));
}

TEST_F(PeerSessionManagerTest, RegistersOnConnect) {
    auto registrations = transport->sent_of<RegisterMessage>();
    ASSERT_EQ(registrations.size(), 1u);
    EXPECT_EQ(registrations[0].client_id, LOCAL);
    EXPECT_EQ(registrations[0].lobby_name, "friday-night");

    transport->deliver(RegisterError{"Wrong password"});
    ASSERT_EQ(observer.registrations.size(), 1u);
    EXPECT_EQ(observer.registrations[0].error, core::ErrorCode::SIGNALING_REJECTED);
}

TEST_F(PeerSessionManagerTest, PlayersListOffersOnlyToLowerIds) {
    transport->deliver(PlayersList{{player("player-100", "Bo"), player(LOCAL, "Ana"), player("player-300", "Cy")}});

    EXPECT_TRUE(manager->has_session("player-100"));
    EXPECT_FALSE(manager->has_session("player-300"));
    EXPECT_TRUE(manager->is_negotiating("player-100"));
    EXPECT_EQ(manager->players().size(), 2u);
    EXPECT_THAT(observer.joined, ElementsAre("player-100", "player-300"));
    EXPECT_THAT(observer.transports, ElementsAre("player-100"));

    auto pc = factory.latest("player-100");
    EXPECT_EQ(pc->audio_senders, 1);
    ASSERT_EQ(pc->channels.size(), 2u);
    EXPECT_TRUE(pc->channel_inits.at(transport::CONTROL_CHANNEL_LABEL).ordered);
    EXPECT_FALSE(pc->channel_inits.at(transport::TRANSFER_CHANNEL_LABEL).ordered);

    poll();
    auto offers = transport->sent_of<OfferMessage>();
    ASSERT_EQ(offers.size(), 1u);
    EXPECT_EQ(offers[0].from, LOCAL);
    EXPECT_EQ(offers[0].to, "player-100");
    EXPECT_EQ(offers[0].offer.type, "offer");
    EXPECT_EQ(offers[0].player_name, "Ana");
}

TEST_F(PeerSessionManagerTest, JoinedPlayerGetsOfferAfterDelay) {
    transport->deliver(PlayerJoined{player("player-100")});
    transport->deliver(PlayerJoined{player("player-300")});
    EXPECT_FALSE(manager->has_session("player-100"));

    run_for(60);
    EXPECT_TRUE(manager->has_session("player-100"));
    EXPECT_FALSE(manager->has_session("player-300"));
    EXPECT_EQ(transport->sent_of<OfferMessage>().size(), 1u);
}

TEST_F(PeerSessionManagerTest, AnswersOfferFromHigherId) {
    transport->deliver(OfferMessage{"player-300", LOCAL, {"offer", "remote-offer"}, "Cy"});

    auto pc = factory.latest("player-300");
    ASSERT_NE(pc, nullptr);
    ASSERT_EQ(pc->remote_descriptions.size(), 1u);
    EXPECT_EQ(pc->remote_descriptions[0].sdp, "remote-offer");
    EXPECT_TRUE(pc->channels.empty());

    poll();
    auto answers = transport->sent_of<AnswerMessage>();
    ASSERT_EQ(answers.size(), 1u);
    EXPECT_EQ(answers[0].to, "player-300");
    EXPECT_EQ(answers[0].answer.type, "answer");
    EXPECT_FALSE(manager->is_negotiating("player-300"));

    // Channels created by the initiator arrive through on_data_channel
    auto control = std::make_shared<FakeDataChannel>(io_context, transport::CONTROL_CHANNEL_LABEL);
    auto files = std::make_shared<FakeDataChannel>(io_context, transport::TRANSFER_CHANNEL_LABEL);
    pc->emit_data_channel(control);
    pc->emit_data_channel(files);
    control->open();
    files->open();
    ASSERT_NE(manager->transport_for("player-300"), nullptr);
    EXPECT_TRUE(manager->transport_for("player-300")->is_ready());
}

TEST_F(PeerSessionManagerTest, CandidatesWaitForRemoteDescription) {
    transport->deliver(PlayersList{{player("player-100")}});
    poll();
    auto pc = factory.latest("player-100");

    for (const char* text : {"c1", "c2", "c3"}) {
        transport->deliver(IceCandidateMessage{"player-100", LOCAL, candidate(text)});
    }
    EXPECT_EQ(manager->pending_candidate_count("player-100"), 3u);
    EXPECT_TRUE(pc->added_candidates.empty());

    transport->deliver(AnswerMessage{"player-100", LOCAL, {"answer", "remote-answer"}});
    ASSERT_EQ(pc->added_candidates.size(), 3u);
    EXPECT_EQ(pc->added_candidates[0].candidate, "c1");
    EXPECT_EQ(pc->added_candidates[2].candidate, "c3");
    EXPECT_EQ(manager->pending_candidate_count("player-100"), 0u);

    transport->deliver(IceCandidateMessage{"player-100", LOCAL, candidate("c4")});
    EXPECT_EQ(pc->added_candidates.size(), 4u);
}

TEST_F(PeerSessionManagerTest, CandidatesBeforeSessionAreKept) {
    transport->deliver(IceCandidateMessage{"player-300", LOCAL, candidate("early")});
    EXPECT_FALSE(manager->has_session("player-300"));
    EXPECT_EQ(manager->pending_candidate_count("player-300"), 1u);

    transport->deliver(OfferMessage{"player-300", LOCAL, {"offer", "remote-offer"}, "Cy"});
    auto pc = factory.latest("player-300");
    ASSERT_EQ(pc->added_candidates.size(), 1u);
    EXPECT_EQ(pc->added_candidates[0].candidate, "early");
}

TEST_F(PeerSessionManagerTest, LocalCandidatesAreSignaled) {
    transport->deliver(PlayersList{{player("player-100")}});
    factory.latest("player-100")->emit_candidate(candidate("local-1"));

    auto sent = transport->sent_of<IceCandidateMessage>();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].to, "player-100");
    EXPECT_EQ(sent[0].candidate.candidate, "local-1");
}

TEST_F(PeerSessionManagerTest, HeldOfferProceedsAfterWait) {
    transport->deliver(PlayersList{{player("player-100")}});
    poll();
    auto pc = factory.latest("player-100");
    ASSERT_TRUE(manager->is_negotiating("player-100"));

    transport->deliver(OfferMessage{"player-100", LOCAL, {"offer", "crossing-offer"}, "Bo"});
    EXPECT_TRUE(pc->remote_descriptions.empty());
    EXPECT_EQ(pc->answers_created, 0);

    run_for(60);
    ASSERT_EQ(pc->remote_descriptions.size(), 1u);
    EXPECT_EQ(pc->remote_descriptions[0].sdp, "crossing-offer");
    EXPECT_EQ(pc->answers_created, 1);
    EXPECT_EQ(factory.count("player-100"), 1u);
    EXPECT_EQ(transport->sent_of<AnswerMessage>().size(), 1u);
}

TEST_F(PeerSessionManagerTest, HeldOfferRunsWhenNegotiationEnds) {
    auto pc = connect_to("player-100");
    ASSERT_TRUE(manager->set_mic_enabled(true));
    poll();
    ASSERT_TRUE(manager->is_negotiating("player-100"));

    transport->deliver(OfferMessage{"player-100", LOCAL, {"offer", "their-offer"}, "Bo"});
    EXPECT_EQ(pc->answers_created, 0);

    transport->deliver(AnswerMessage{"player-100", LOCAL, {"answer", "mic-answer"}});
    poll();

    EXPECT_EQ(pc->answers_created, 1);
    ASSERT_EQ(pc->remote_descriptions.size(), 3u);
    EXPECT_EQ(pc->remote_descriptions.back().sdp, "their-offer");
    EXPECT_EQ(manager->session_state("player-100"), SessionState::CONNECTED);
    EXPECT_EQ(factory.count("player-100"), 1u);
}

TEST_F(PeerSessionManagerTest, MicToggleRenegotiatesOnSameConnection) {
    auto pc = connect_to("player-100");
    EXPECT_EQ(manager->session_state("player-100"), SessionState::CONNECTED);

    ASSERT_TRUE(manager->set_mic_enabled(true));
    EXPECT_TRUE(manager->mic_enabled());
    EXPECT_EQ(manager->session_state("player-100"), SessionState::RENEGOTIATING);
    ASSERT_EQ(pc->replaced_tracks.size(), 1u);
    EXPECT_EQ(pc->replaced_tracks[0], media.tracks[0]);

    auto statuses = transport->sent_of<StatusUpdate>();
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_TRUE(statuses[0].mic_enabled);

    poll();
    EXPECT_EQ(pc->offers_created, 2);
    EXPECT_FALSE(pc->last_offer_ice_restart);

    transport->deliver(AnswerMessage{"player-100", LOCAL, {"answer", "mic-answer"}});
    EXPECT_EQ(manager->session_state("player-100"), SessionState::CONNECTED);

    ASSERT_TRUE(manager->set_mic_enabled(false));
    EXPECT_TRUE(media.tracks[0]->is_stopped());
    EXPECT_EQ(pc->replaced_tracks.back(), nullptr);
    EXPECT_EQ(factory.count("player-100"), 1u);
}

TEST_F(PeerSessionManagerTest, ToggleDuringNegotiationQueuesAnotherRound) {
    auto pc = connect_to("player-100");
    ASSERT_TRUE(manager->set_mic_enabled(true));
    poll();
    ASSERT_TRUE(manager->set_mic_enabled(false));
    poll();
    EXPECT_EQ(pc->offers_created, 2);

    transport->deliver(AnswerMessage{"player-100", LOCAL, {"answer", "first"}});
    poll();
    EXPECT_EQ(pc->offers_created, 3);
    EXPECT_EQ(manager->session_state("player-100"), SessionState::RENEGOTIATING);
}

TEST_F(PeerSessionManagerTest, MicFailsWithoutCapture) {
    media.unavailable = true;
    auto result = manager->set_mic_enabled(true);
    EXPECT_EQ(result.error, core::ErrorCode::INVALID_STATE);
    EXPECT_FALSE(manager->mic_enabled());
    EXPECT_TRUE(transport->sent_of<StatusUpdate>().empty());
}

TEST_F(PeerSessionManagerTest, NewSessionsStartWithActiveMicrophone) {
    ASSERT_TRUE(manager->set_mic_enabled(true));
    transport->deliver(PlayersList{{player("player-100")}});

    auto pc = factory.latest("player-100");
    ASSERT_EQ(pc->replaced_tracks.size(), 1u);
    EXPECT_EQ(pc->replaced_tracks[0], media.tracks[0]);
}

TEST_F(PeerSessionManagerTest, FailedConnectionRebuildsWithIceRestart) {
    auto pc = connect_to("player-100");
    pc->emit_state(rtc::PeerConnectionState::FAILED);
    EXPECT_EQ(manager->session_state("player-100"), SessionState::FAILED);

    run_for(60);
    EXPECT_TRUE(pc->closed);
    ASSERT_EQ(factory.count("player-100"), 2u);
    auto fresh = factory.latest("player-100");
    EXPECT_EQ(fresh->offers_created, 1);
    EXPECT_TRUE(fresh->last_offer_ice_restart);
    EXPECT_EQ(manager->session_state("player-100"), SessionState::CONNECTING);
}

TEST_F(PeerSessionManagerTest, DisconnectRecoveringWithinGraceKeepsSession) {
    auto pc = connect_to("player-100");
    pc->emit_state(rtc::PeerConnectionState::DISCONNECTED);
    EXPECT_EQ(manager->session_state("player-100"), SessionState::DISCONNECTED);

    run_for(10);
    pc->emit_state(rtc::PeerConnectionState::CONNECTED);
    EXPECT_EQ(manager->session_state("player-100"), SessionState::CONNECTED);

    run_for(80);
    EXPECT_EQ(factory.count("player-100"), 1u);
    EXPECT_FALSE(pc->closed);
}

TEST_F(PeerSessionManagerTest, DisconnectPastGraceRebuilds) {
    auto pc = connect_to("player-100");
    pc->emit_state(rtc::PeerConnectionState::DISCONNECTED);

    run_for(100);
    EXPECT_EQ(factory.count("player-100"), 2u);
    EXPECT_TRUE(factory.latest("player-100")->last_offer_ice_restart);
}

TEST_F(PeerSessionManagerTest, ResponderWaitsForInitiatorToReconnect) {
    transport->deliver(OfferMessage{"player-300", LOCAL, {"offer", "remote-offer"}, "Cy"});
    poll();
    auto pc = factory.latest("player-300");
    pc->emit_state(rtc::PeerConnectionState::CONNECTED);
    pc->emit_state(rtc::PeerConnectionState::FAILED);

    run_for(60);
    EXPECT_EQ(factory.count("player-300"), 1u);
    EXPECT_EQ(manager->session_state("player-300"), SessionState::FAILED);
}

TEST_F(PeerSessionManagerTest, RejectedAnswerRebuildsSession) {
    transport->deliver(PlayersList{{player("player-100")}});
    poll();
    factory.latest("player-100")->fail_remote_description = true;

    transport->deliver(AnswerMessage{"player-100", LOCAL, {"answer", "bad"}});
    EXPECT_EQ(manager->session_state("player-100"), SessionState::FAILED);

    run_for(60);
    EXPECT_EQ(factory.count("player-100"), 2u);
}

TEST_F(PeerSessionManagerTest, RejoinReplacesStaleSession) {
    transport->deliver(PlayersList{{player("player-100")}});
    poll();
    auto stale = factory.latest("player-100");

    transport->deliver(PlayerJoined{player("player-100")});
    EXPECT_TRUE(stale->closed);
    EXPECT_FALSE(manager->has_session("player-100"));

    run_for(60);
    EXPECT_EQ(factory.count("player-100"), 2u);
}

TEST_F(PeerSessionManagerTest, PlayerLeftRemovesSession) {
    auto pc = connect_to("player-100");
    transport->deliver(PlayerLeft{"player-100", ""});

    EXPECT_FALSE(manager->has_session("player-100"));
    EXPECT_TRUE(pc->closed);
    EXPECT_TRUE(manager->players().empty());
    EXPECT_EQ(observer.left, (std::vector<std::string>{"player-100"}));
}

TEST_F(PeerSessionManagerTest, LeaveBeforeDelayedOfferCancelsIt) {
    transport->deliver(PlayerJoined{player("player-100")});
    transport->deliver(PlayerLeft{"player-100", ""});

    run_for(60);
    EXPECT_EQ(factory.count("player-100"), 0u);
}

TEST_F(PeerSessionManagerTest, StatusChatAndRemoteAudio) {
    auto pc = connect_to("player-100");

    transport->deliver(StatusUpdate{"player-100", true});
    ASSERT_EQ(observer.statuses.size(), 1u);
    EXPECT_TRUE(observer.statuses[0].second);

    pc->emit_track(std::make_shared<lobbylink::testing::FakeAudioTrack>("remote-mic"));
    EXPECT_EQ(observer.streams, (std::vector<std::string>{"player-100"}));

    ASSERT_TRUE(manager->send_chat("gg"));
    auto chats = transport->sent_of<ChatMessage>();
    ASSERT_EQ(chats.size(), 1u);
    EXPECT_EQ(chats[0].from, LOCAL);
    EXPECT_EQ(chats[0].player_name, "Ana");
    EXPECT_EQ(manager->send_chat("").error, core::ErrorCode::INVALID_MESSAGE);

    transport->deliver(ChatMessage{"player-100", "player-100", "Bo", "wp", 0});
    EXPECT_EQ(observer.chats, (std::vector<std::string>{"wp"}));
}

TEST_F(PeerSessionManagerTest, AnswerWithoutOurOfferIsDropped) {
    transport->deliver(OfferMessage{"player-300", LOCAL, {"offer", "remote-offer"}, "Cy"});
    poll();
    auto responder = factory.latest("player-300");
    ASSERT_EQ(responder->remote_descriptions.size(), 1u);

    transport->deliver(AnswerMessage{"player-300", LOCAL, {"answer", "stray"}});
    EXPECT_EQ(responder->remote_descriptions.size(), 1u);
    EXPECT_EQ(manager->session_state("player-300"), SessionState::CONNECTING);

    auto pc = connect_to("player-100");
    ASSERT_EQ(pc->remote_descriptions.size(), 1u);
    transport->deliver(AnswerMessage{"player-100", LOCAL, {"answer", "duplicate"}});
    EXPECT_EQ(pc->remote_descriptions.size(), 1u);
    EXPECT_EQ(manager->session_state("player-100"), SessionState::CONNECTED);
    EXPECT_EQ(factory.count("player-100"), 1u);
}

TEST_F(PeerSessionManagerTest, NewSnapshotReconcilesRoster) {
    transport->deliver(PlayersList{{player("player-100"), player("player-300")}});
    poll();
    ASSERT_TRUE(manager->has_session("player-100"));

    // Roster resent after a signaling reconnect: player-100 is gone, player-400 is new
    transport->deliver(PlayersList{{player("player-300"), player(LOCAL), player("player-400")}});

    EXPECT_THAT(observer.left, ElementsAre("player-100"));
    EXPECT_THAT(observer.joined, ElementsAre("player-100", "player-300", "player-400"));
    EXPECT_FALSE(manager->has_session("player-100"));
    EXPECT_TRUE(factory.latest("player-100")->closed);
    EXPECT_EQ(manager->players().size(), 2u);
}

TEST_F(PeerSessionManagerTest, ShutdownClosesEverything) {
    auto pc = connect_to("player-100");
    transport->deliver(IceCandidateMessage{"player-300", LOCAL, candidate("orphan")});

    manager->shutdown();
    EXPECT_FALSE(manager->has_session("player-100"));
    EXPECT_TRUE(pc->closed);
    EXPECT_EQ(manager->pending_candidate_count("player-300"), 0u);
    EXPECT_FALSE(channel->is_connected());
}
