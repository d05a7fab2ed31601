#pragma once

#include "lobbylink/core/command_registry.hpp"
#include "lobbylink/lobby/lobby_client.hpp"
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <future>
#include <type_traits>

namespace lobbylink::lobby {

// Runs fn on the io_context thread and waits for its result. The console
// thread never touches client state directly.
template<typename F>
auto run_on_loop(boost::asio::io_context& io_context, F&& fn) -> std::invoke_result_t<F> {
    using R = std::invoke_result_t<F>;
    if (io_context.get_executor().running_in_this_thread()) {
        return fn();
    }

    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    auto future = task->get_future();
    boost::asio::post(io_context, [task] { (*task)(); });
    return future.get();
}

class LobbyCommandHandler : public core::CommandHandler {
public:
    LobbyCommandHandler(boost::asio::io_context& io_context, LobbyClient& client)
        : io_context_(io_context), client_(client) {}

protected:
    boost::asio::io_context& io_context_;
    LobbyClient& client_;
};

class PlayersCommandHandler : public LobbyCommandHandler {
public:
    using LobbyCommandHandler::LobbyCommandHandler;

    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List lobby members and session states"; }
    std::string get_usage() const override { return "players"; }
};

class ChatCommandHandler : public LobbyCommandHandler {
public:
    using LobbyCommandHandler::LobbyCommandHandler;

    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send a chat message to the lobby"; }
    std::string get_usage() const override { return "chat <text>"; }
};

class MicCommandHandler : public LobbyCommandHandler {
public:
    using LobbyCommandHandler::LobbyCommandHandler;

    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Turn the microphone on or off"; }
    std::string get_usage() const override { return "mic on|off"; }
};

class ShareCommandHandler : public LobbyCommandHandler {
public:
    using LobbyCommandHandler::LobbyCommandHandler;

    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Share a local folder with the lobby"; }
    std::string get_usage() const override { return "share <id> <name> <folder>"; }
};

class UnshareCommandHandler : public LobbyCommandHandler {
public:
    using LobbyCommandHandler::LobbyCommandHandler;

    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Stop sharing a folder"; }
    std::string get_usage() const override { return "unshare <id>"; }
};

class SharesCommandHandler : public LobbyCommandHandler {
public:
    using LobbyCommandHandler::LobbyCommandHandler;

    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List local and remote shares"; }
    std::string get_usage() const override { return "shares"; }
};

class GetCommandHandler : public LobbyCommandHandler {
public:
    using LobbyCommandHandler::LobbyCommandHandler;

    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download a file from a remote share"; }
    std::string get_usage() const override { return "get <owner> <share> <path> <size> <save>"; }
};

class CancelCommandHandler : public LobbyCommandHandler {
public:
    using LobbyCommandHandler::LobbyCommandHandler;

    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Cancel a download"; }
    std::string get_usage() const override { return "cancel <request-id>"; }
};

class TransfersCommandHandler : public LobbyCommandHandler {
public:
    using LobbyCommandHandler::LobbyCommandHandler;

    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show download progress"; }
    std::string get_usage() const override { return "transfers"; }
};

class QuitCommandHandler : public LobbyCommandHandler {
public:
    QuitCommandHandler(boost::asio::io_context& io_context, LobbyClient& client, std::atomic<bool>& running)
        : LobbyCommandHandler(io_context, client), running_(running) {}

    core::CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Leave the lobby and exit"; }
    std::string get_usage() const override { return "quit"; }

private:
    std::atomic<bool>& running_;
};

void register_console_commands(core::CommandRegistry& registry, boost::asio::io_context& io_context,
                               LobbyClient& client, std::atomic<bool>& running);

} // namespace lobbylink::lobby
