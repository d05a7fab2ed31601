#include "lobbylink/lobby/console_commands.hpp"
#include "lobbylink/core/logger.hpp"
#include "lobbylink/core/utils.hpp"
#include <charconv>
#include <fmt/format.h>
#include <iostream>

namespace lobbylink::lobby {

using core::CommandResult;
using core::utils::StringUtils;

namespace {

CommandResult from_result(const core::Result& result, const std::string& success_message) {
    if (!result) {
        return CommandResult::error(result.describe());
    }
    return CommandResult::ok(success_message);
}

}

CommandResult PlayersCommandHandler::execute(const std::vector<std::string>&) {
    auto lines = run_on_loop(io_context_, [this] {
        std::vector<std::string> out;
        auto& sessions = client_.sessions();
        for (const auto& player : sessions.players()) {
            auto state = sessions.session_state(player.player_id);
            out.push_back(fmt::format("  {:<20} {:<24} {:<15} {}", player.player_name, player.player_id,
                                      player.use_domain ? player.virtual_domain : player.virtual_ip,
                                      state ? session::to_string(*state) : "no session"));
        }
        return out;
    });

    if (lines.empty()) {
        return CommandResult::ok("No other players in the lobby");
    }
    for (const auto& line : lines) {
        std::cout << line << "\n";
    }
    return CommandResult::ok();
}

CommandResult ChatCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto text = StringUtils::join(std::vector<std::string>(args.begin() + 1, args.end()), " ");
    auto result = run_on_loop(io_context_, [this, &text] { return client_.send_chat(text); });
    return from_result(result, "");
}

CommandResult MicCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 2 || (args[1] != "on" && args[1] != "off")) {
        return CommandResult::error("Usage: " + get_usage());
    }

    const bool enable = args[1] == "on";
    auto result = run_on_loop(io_context_, [this, enable] { return client_.set_mic_enabled(enable); });
    return from_result(result, enable ? "Microphone on" : "Microphone off");
}

CommandResult ShareCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 4) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto folder = core::utils::FileUtils::expand_home(args[3]);
    auto result = run_on_loop(io_context_, [this, &args, &folder] {
        return client_.share_folder(args[1], args[2], folder);
    });
    return from_result(result, "Sharing " + folder.string() + " as '" + args[2] + "'");
}

CommandResult UnshareCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto result = run_on_loop(io_context_, [this, &args] { return client_.unshare(args[1]); });
    return from_result(result, "Share " + args[1] + " removed");
}

CommandResult SharesCommandHandler::execute(const std::vector<std::string>&) {
    auto& catalog = client_.catalog();

    std::cout << "Local shares:\n";
    for (const auto& share : catalog.local_shares()) {
        std::cout << "  " << share.id << "  " << share.name << "  " << share.folder_path.string() << "\n";
    }

    std::cout << "Remote shares:\n";
    for (const auto& share : catalog.remote_shares()) {
        std::cout << "  " << share.id << "  " << share.name << "  owner " << share.owner_id;
        if (share.expire_time > 0) {
            std::cout << "  expires " << core::utils::TimeUtils::format_timestamp(share.expire_time * 1000);
        }
        std::cout << "\n";
    }
    return CommandResult::ok();
}

CommandResult GetCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 6) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::uint64_t size = 0;
    const auto& size_arg = args[4];
    auto [ptr, ec] = std::from_chars(size_arg.data(), size_arg.data() + size_arg.size(), size);
    if (ec != std::errc() || ptr != size_arg.data() + size_arg.size()) {
        return CommandResult::error("Invalid size: " + size_arg);
    }

    transfer::FileDescriptor file;
    file.owner_id = args[1];
    file.share_id = args[2];
    file.file_path = args[3];
    file.file_name = std::filesystem::path(args[3]).filename().string();
    file.file_size = size;

    auto save_path = core::utils::FileUtils::expand_home(args[5]);
    auto request_id = run_on_loop(io_context_, [this, &file, &save_path] {
        return client_.download(file, save_path);
    });
    return CommandResult::ok("Download started: " + request_id);
}

CommandResult CancelCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto result = run_on_loop(io_context_, [this, &args] { return client_.cancel_transfer(args[1]); });
    return from_result(result, "Cancelled " + args[1]);
}

CommandResult TransfersCommandHandler::execute(const std::vector<std::string>&) {
    // Progress snapshots are safe to read off the loop
    auto transfers = client_.transfers().list_transfers();
    if (transfers.empty()) {
        return CommandResult::ok("No transfers");
    }

    for (const auto& progress : transfers) {
        std::cout << fmt::format("  {}  {:<24} {:>6.1f}%  {:>10}/s  {}", progress.request_id, progress.file_name,
                                 progress.percent,
                                 StringUtils::format_bytes(static_cast<std::uint64_t>(progress.speed)),
                                 transfer::to_string(progress.status));
        if (progress.error) {
            std::cout << "  (" << *progress.error << ")";
        }
        std::cout << "\n";
    }
    return CommandResult::ok();
}

CommandResult QuitCommandHandler::execute(const std::vector<std::string>&) {
    run_on_loop(io_context_, [this] { client_.leave(); });
    running_ = false;
    return CommandResult::ok("Left the lobby");
}

void register_console_commands(core::CommandRegistry& registry, boost::asio::io_context& io_context,
                               LobbyClient& client, std::atomic<bool>& running) {
    registry.register_command("players", std::make_unique<PlayersCommandHandler>(io_context, client));
    registry.register_command("chat", std::make_unique<ChatCommandHandler>(io_context, client));
    registry.register_command("mic", std::make_unique<MicCommandHandler>(io_context, client));
    registry.register_command("share", std::make_unique<ShareCommandHandler>(io_context, client));
    registry.register_command("unshare", std::make_unique<UnshareCommandHandler>(io_context, client));
    registry.register_command("shares", std::make_unique<SharesCommandHandler>(io_context, client));
    registry.register_command("get", std::make_unique<GetCommandHandler>(io_context, client));
    registry.register_command("cancel", std::make_unique<CancelCommandHandler>(io_context, client));
    registry.register_command("transfers", std::make_unique<TransfersCommandHandler>(io_context, client));
    registry.register_command("quit", std::make_unique<QuitCommandHandler>(io_context, client, running));
}

} // namespace lobbylink::lobby
