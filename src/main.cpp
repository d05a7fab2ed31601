#include "lobbylink/core/cli.hpp"
#include "lobbylink/core/command_registry.hpp"
#include "lobbylink/core/config.hpp"
#include "lobbylink/core/logger.hpp"
#include "lobbylink/core/utils.hpp"
#include "lobbylink/lobby/console_commands.hpp"
#include "lobbylink/lobby/lobby_client.hpp"
#include "lobbylink/rtc/libdatachannel_backend.hpp"
#include "lobbylink/signaling/websocket_transport.hpp"
#include <algorithm>
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace lobbylink;

namespace {

class ConsoleObserver : public lobby::LobbyObserver {
public:
    explicit ConsoleObserver(std::atomic<bool>& running) : running_(running) {}

    void on_registered(const core::Result& result) override {
        if (result) {
            std::cout << "Joined the lobby\n";
        } else {
            std::cout << "Registration failed: " << result.describe() << "\n";
        }
    }

    void on_player_joined(const signaling::PlayerInfo& player) override {
        std::cout << player.player_name << " joined\n";
    }

    void on_player_left(const std::string& player_id) override {
        std::cout << player_id << " left\n";
    }

    void on_player_status(const std::string& player_id, bool mic_enabled) override {
        std::cout << player_id << " mic " << (mic_enabled ? "on" : "off") << "\n";
    }

    void on_chat(const signaling::ChatMessage& message) override {
        std::cout << "[" << core::utils::TimeUtils::format_timestamp(message.timestamp) << "] "
                  << message.player_name << ": " << message.content << "\n";
    }

    void on_share_changed(const signaling::ShareInfo& share, bool removed) override {
        std::cout << share.owner_id << (removed ? " removed share " : " shared ") << share.name << "\n";
    }

    void on_transfer_progress(const transfer::TransferProgress& progress) override {
        if (transfer::is_terminal(progress.status)) {
            std::cout << progress.file_name << ": " << transfer::to_string(progress.status);
            if (progress.error) {
                std::cout << " (" << *progress.error << ")";
            }
            std::cout << "\n";
        }
    }

    void on_fatal_error(const core::Result& error) override {
        std::cout << "Fatal: " << error.describe() << "\n";
        running_ = false;
    }

private:
    std::atomic<bool>& running_;
};

session::LocalIdentity identity_from(const core::Config& config) {
    session::LocalIdentity identity;
    identity.client_id = config.get_string("player.id", "player-" + core::utils::StringUtils::random_base36(9));
    identity.player_name = config.get_string("player.name", "player");
    identity.virtual_ip = config.get_string("player.virtual_ip");
    identity.virtual_domain = config.get_string("player.virtual_domain");
    identity.use_domain = config.get_bool("player.use_domain");
    identity.lobby_name = config.get_string("lobby.name");
    identity.lobby_password = config.get_string("lobby.password");
    return identity;
}

}

int main(int argc, char* argv[]) {
    core::CommandLineParser parser("lobbylink");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = core::Config::instance();
    config.set_defaults();

    auto config_file = core::utils::FileUtils::expand_home(parser.get_option("config", "~/.lobbylink.conf"));
    if (core::utils::FileUtils::exists(config_file)) {
        config.load_from_file(config_file.string());
    }
    parser.apply_overrides(config);

    auto log_level = parser.has_option("verbose") ? core::LogLevel::Debug
                                                  : core::parse_log_level(config.get_string("log.level", "info"));
    core::Logger::initialize(config.get_string("log.file", "lobbylink.log"), log_level);
    rtc::LibDataChannelFactory::init_logging();

    auto identity = identity_from(config);
    if (identity.lobby_name.empty()) {
        std::cerr << "Error: no lobby given (--lobby or lobby.name)\n";
        return 1;
    }

    auto options = lobby::LobbyOptions::from_config(config);
    const auto& url = options.signaling.url;

    LOG_INFO("lobbylink starting as {} ({})", identity.player_name, identity.client_id);

    boost::asio::io_context io_context;
    auto work = boost::asio::make_work_guard(io_context);

    rtc::RtcConfiguration rtc_config;
    rtc_config.ice_servers = options.session.ice_servers;
    rtc_config.max_message_size = options.session.transport.max_message_size;
    rtc::LibDataChannelFactory factory(io_context, rtc_config);
    storage::LocalFileStore file_store;

    // No capture device is wired in; "mic on" reports the missing source
    lobby::LobbyClient client(io_context, std::make_unique<signaling::WebSocketTransport>(io_context),
                              factory, nullptr, file_store, identity, options);

    std::atomic<bool> running{true};
    ConsoleObserver observer(running);
    client.set_observer(&observer);

    std::thread io_thread([&io_context] { io_context.run(); });

    auto joined = lobby::run_on_loop(io_context, [&] {
        auto promise = std::make_shared<std::promise<core::Result>>();
        auto future = promise->get_future();
        client.join(url, [promise](const core::Result& result) { promise->set_value(result); });
        return future;
    }).get();

    if (!joined) {
        std::cerr << "Could not reach " << url << ": " << joined.describe() << "\n";
        work.reset();
        io_context.stop();
        io_thread.join();
        return 1;
    }

    core::CommandRegistry registry;
    lobby::register_console_commands(registry, io_context, client, running);

    std::cout << "Type 'help' for commands\n";
    std::string line;
    while (running && std::getline(std::cin, line)) {
        auto args = core::utils::StringUtils::split(core::utils::StringUtils::trim(line), ' ');
        args.erase(std::remove(args.begin(), args.end(), ""), args.end());
        if (args.empty()) {
            continue;
        }

        if (args[0] == "help") {
            registry.print_help();
            continue;
        }

        auto result = registry.execute_command(args[0], args);
        if (!result.message.empty()) {
            std::cout << (result.success ? "" : "Error: ") << result.message << "\n";
        }
    }

    if (running) {
        lobby::run_on_loop(io_context, [&client] { client.leave(); });
    }

    work.reset();
    io_context.stop();
    io_thread.join();

    LOG_INFO("lobbylink shut down");
    core::Logger::shutdown();
    return 0;
}
