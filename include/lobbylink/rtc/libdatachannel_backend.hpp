#pragma once

#include "lobbylink/rtc/peer_connection.hpp"
#include "lobbylink/rtc/rtc_types.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <memory>
#include <string>

namespace lobbylink::rtc {

// Peer connections backed by libdatachannel. Its callbacks arrive on
// library threads and are re-posted onto the io_context.
class LibDataChannelFactory : public PeerConnectionFactory {
public:
    LibDataChannelFactory(boost::asio::io_context& io_context, RtcConfiguration configuration);

    std::shared_ptr<PeerConnection> create(const std::string& peer_id) override;

    // Routes libdatachannel's own log output through spdlog.
    static void init_logging();

private:
    boost::asio::io_context& io_context_;
    RtcConfiguration configuration_;
};

} // namespace lobbylink::rtc
