#pragma once

#include <map>
#include <string>
#include <vector>

namespace lobbylink::core {

class Config;

class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    // config_key, when set, lets apply_overrides copy a parsed value into Config
    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "", const std::string& config_key = "");

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    int get_int_option(const std::string& name, int default_value = 0) const;

    // Writes every parsed option that maps to a config key. Returns how many were applied.
    std::size_t apply_overrides(Config& config) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    struct Option {
        std::string short_name;
        std::string description;
        bool has_value = false;
        std::string default_value;
        std::string config_key;
    };

    bool parse_long(const std::string& arg, int argc, char* argv[], int& index);
    bool parse_short_group(const std::string& arg, int argc, char* argv[], int& index);
    bool fail(std::string message);

    std::string normalize_option_name(const std::string& name) const;

    std::string program_name_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
