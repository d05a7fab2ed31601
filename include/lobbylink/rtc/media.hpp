#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace lobbylink::rtc {

// Encoded audio frames flow from a track into whatever sender it is attached to.
using AudioPacketSink = std::function<void(const std::vector<std::uint8_t>& packet)>;

class AudioTrack {
public:
    virtual ~AudioTrack() = default;

    virtual std::string id() const = 0;
    virtual void stop() = 0;
    virtual bool is_stopped() const = 0;
    virtual void set_packet_sink(AudioPacketSink sink) = 0;
};

// Capture device abstraction. Returns nullptr when no device can be opened.
class MediaSource {
public:
    virtual ~MediaSource() = default;

    virtual std::shared_ptr<AudioTrack> capture_audio() = 0;
};

}
