#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lobbylink::core {

struct CommandResult {
    bool success = true;
    std::string message;
    int exit_code = 0;

    static CommandResult ok(std::string message = "") {
        return CommandResult{true, std::move(message), 0};
    }

    static CommandResult error(std::string message, int exit_code = 1) {
        return CommandResult{false, std::move(message), exit_code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class CommandRegistry {
public:
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    bool has_command(const std::string& command) const;
    std::vector<std::string> command_names() const;
    void print_help() const;

private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

}
