#pragma once

#include "lobbylink/core/error.hpp"
#include "lobbylink/rtc/data_channel.hpp"
#include "lobbylink/rtc/media.hpp"
#include "lobbylink/rtc/rtc_types.hpp"
#include <functional>
#include <memory>
#include <string>

namespace lobbylink::rtc {

class PeerConnection {
public:
    using DescriptionHandler = std::function<void(const core::Result&, const SessionDescription&)>;
    using CandidateHandler = std::function<void(const IceCandidate&)>;
    using StateHandler = std::function<void(PeerConnectionState)>;
    using DataChannelHandler = std::function<void(std::shared_ptr<DataChannel>)>;
    using TrackHandler = std::function<void(std::shared_ptr<AudioTrack>)>;

    virtual ~PeerConnection() = default;

    // Both generate the description and apply it locally before the handler runs.
    virtual void create_offer(bool ice_restart, DescriptionHandler handler) = 0;
    virtual void create_answer(DescriptionHandler handler) = 0;

    virtual core::Result set_remote_description(const SessionDescription& description) = 0;
    virtual core::Result add_remote_candidate(const IceCandidate& candidate) = 0;

    virtual std::shared_ptr<DataChannel> create_data_channel(const std::string& label,
                                                             const DataChannelInit& init) = 0;

    // Negotiates an audio sender without a source so the track can be swapped in later.
    virtual void add_audio_sender() = 0;
    virtual core::Result replace_audio_track(std::shared_ptr<AudioTrack> track) = 0;

    virtual PeerConnectionState state() const = 0;
    virtual void close() = 0;

    void on_local_candidate(CandidateHandler handler) { candidate_handler_ = std::move(handler); }
    void on_state_change(StateHandler handler) { state_handler_ = std::move(handler); }
    void on_data_channel(DataChannelHandler handler) { data_channel_handler_ = std::move(handler); }
    void on_remote_track(TrackHandler handler) { track_handler_ = std::move(handler); }

protected:
    CandidateHandler candidate_handler_;
    StateHandler state_handler_;
    DataChannelHandler data_channel_handler_;
    TrackHandler track_handler_;
};

class PeerConnectionFactory {
public:
    virtual ~PeerConnectionFactory() = default;

    virtual std::shared_ptr<PeerConnection> create(const std::string& peer_id) = 0;
};

}
