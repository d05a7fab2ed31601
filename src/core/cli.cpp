#include "lobbylink/core/cli.hpp"
#include "lobbylink/core/config.hpp"
#include <charconv>
#include <iomanip>
#include <iostream>

namespace lobbylink::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "~/.lobbylink.conf");
    add_option("", "verbose", "Enable verbose logging");
    add_option("s", "server", "Signaling server URL", true, "", "signaling.url");
    add_option("l", "lobby", "Lobby name", true, "", "lobby.name");
    add_option("p", "password", "Lobby password", true, "", "lobby.password");
    add_option("n", "name", "Player name", true, "", "player.name");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value, const std::string& config_key) {
    const std::string& key = long_name.empty() ? short_name : long_name;
    options_[key] = Option{short_name, description, has_value, default_value, config_key};

    if (!short_name.empty()) {
        short_to_long_[short_name] = key;
    }
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        bool ok = true;
        if (arg.starts_with("--")) {
            ok = parse_long(arg, argc, argv, i);
        } else if (arg.starts_with("-") && arg.length() > 1) {
            ok = parse_short_group(arg, argc, argv, i);
        } else {
            positional_args_.push_back(arg);
        }

        if (!ok) {
            return false;
        }
    }

    return true;
}

bool CommandLineParser::parse_long(const std::string& arg, int argc, char* argv[], int& index) {
    auto eq_pos = arg.find('=');
    std::string name = eq_pos == std::string::npos ? arg.substr(2) : arg.substr(2, eq_pos - 2);

    auto it = options_.find(name);
    if (it == options_.end()) {
        return fail("Unknown option: --" + name);
    }

    if (!it->second.has_value) {
        parsed_options_[name] = "true";
    } else if (eq_pos != std::string::npos) {
        parsed_options_[name] = arg.substr(eq_pos + 1);
    } else if (index + 1 < argc) {
        parsed_options_[name] = argv[++index];
    } else {
        return fail("Option --" + name + " requires a value");
    }
    return true;
}

// "-vc file" and "-pSecret" forms; a value option ends the group
bool CommandLineParser::parse_short_group(const std::string& arg, int argc, char* argv[], int& index) {
    for (std::size_t j = 1; j < arg.length(); ++j) {
        std::string flag(1, arg[j]);

        auto long_it = short_to_long_.find(flag);
        if (long_it == short_to_long_.end()) {
            return fail("Unknown option: -" + flag);
        }

        const std::string& name = long_it->second;
        if (!options_.at(name).has_value) {
            parsed_options_[name] = "true";
            continue;
        }

        if (j + 1 < arg.length()) {
            parsed_options_[name] = arg.substr(j + 1);
        } else if (index + 1 < argc) {
            parsed_options_[name] = argv[++index];
        } else {
            return fail("Option -" + flag + " requires a value");
        }
        break;
    }
    return true;
}

bool CommandLineParser::fail(std::string message) {
    error_ = std::move(message);
    return false;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.contains(normalize_option_name(name));
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    std::string normalized = normalize_option_name(name);
    if (auto it = parsed_options_.find(normalized); it != parsed_options_.end()) {
        return it->second;
    }

    auto opt_it = options_.find(normalized);
    if (opt_it != options_.end() && !opt_it->second.default_value.empty()) {
        return opt_it->second.default_value;
    }
    return default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    auto value = get_option(name);
    int result = default_value;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return default_value;
    }
    return result;
}

std::size_t CommandLineParser::apply_overrides(Config& config) const {
    std::size_t applied = 0;
    for (const auto& [name, value] : parsed_options_) {
        const auto& option = options_.at(name);
        if (!option.config_key.empty()) {
            config.set(option.config_key, value);
            ++applied;
        }
    }
    return applied;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options]\n\n";
    std::cout << "Options:\n";

    for (const auto& [name, option] : options_) {
        std::string flags = option.short_name.empty() ? "" : "-" + option.short_name + ", ";
        flags += "--" + name + (option.has_value ? " <value>" : "");

        std::cout << "  " << std::left << std::setw(24) << flags << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        if (!option.config_key.empty()) {
            std::cout << " [" << option.config_key << "]";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 1.2.0\n";
    std::cout << "Built with C++20\n";
}

std::string CommandLineParser::normalize_option_name(const std::string& name) const {
    auto it = short_to_long_.find(name);
    return it != short_to_long_.end() ? it->second : name;
}

}
