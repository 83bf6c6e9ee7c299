#pragma once

#include <chrono>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace routeweave::core {

// Parses routeweave's global options. Typed options are validated while
// parsing, so a bad --timeout or --count fails parse() with get_error() set.
class CommandLineParser {
public:
    enum class ValueKind {
        None,
        Text,
        Duration,
        Count
    };

    explicit CommandLineParser(const std::string& program_name);

    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, ValueKind kind = ValueKind::None,
                    const std::string& default_value = "");

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    std::chrono::milliseconds get_duration_option(const std::string& name,
                                                  std::chrono::milliseconds default_value) const;
    int get_count_option(const std::string& name, int default_value) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help(const std::vector<std::string>& commands, std::ostream& os = std::cout) const;
    void print_version() const;

private:
    struct Option {
        std::string short_name;
        std::string description;
        ValueKind kind = ValueKind::None;
        std::string default_value;
    };

    bool assign(const std::string& long_name, const std::string& value);
    std::string normalize_option_name(const std::string& name) const;

    std::string program_name_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::map<std::string, std::string> parsed_options_;
    std::map<std::string, std::chrono::milliseconds> durations_;
    std::map<std::string, int> counts_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
