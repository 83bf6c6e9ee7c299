#include "routeweave/core/cli.hpp"
#include "routeweave/core/utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <stdexcept>

namespace routeweave::core {

namespace {
    bool parse_count(const std::string& text, int& out) {
        if (text.empty() || text.size() > 9) {
            return false;
        }
        if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        out = std::stoi(text);
        return true;
    }
}

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Router configuration file", ValueKind::Text, "~/.routeweave.conf");
    add_option("t", "timeout", "Overall request timeout (e.g. 500ms, 10s)", ValueKind::Duration);
    add_option("n", "count", "Provider limit for 'providers', 0 lists all", ValueKind::Count);
    add_option("", "verbose", "Log routing decisions at debug level");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                  const std::string& description, ValueKind kind,
                                  const std::string& default_value) {
    options_[long_name] = Option{short_name, description, kind, default_value};
    if (!short_name.empty()) {
        short_to_long_[short_name] = long_name;
    }
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    durations_.clear();
    counts_.clear();
    error_.clear();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Everything after the command name belongs to the command.
        if (!positional_args_.empty() || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
            continue;
        }

        std::string name;
        std::string inline_value;
        bool has_inline = false;

        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
            if (eq_pos != std::string::npos) {
                inline_value = arg.substr(eq_pos + 1);
                has_inline = true;
            }
            if (options_.find(name) == options_.end()) {
                error_ = "Unknown option: --" + name;
                return false;
            }
        } else {
            auto it = short_to_long_.find(arg.substr(1, 1));
            if (it == short_to_long_.end()) {
                error_ = "Unknown option: " + arg.substr(0, 2);
                return false;
            }
            name = it->second;
            if (arg.size() > 2) {
                inline_value = arg.substr(2);
                has_inline = true;
            }
        }

        const auto& option = options_.at(name);
        if (option.kind == ValueKind::None) {
            if (has_inline) {
                error_ = "Option --" + name + " takes no value";
                return false;
            }
            parsed_options_[name] = "true";
            continue;
        }

        if (!has_inline) {
            if (i + 1 >= argc) {
                error_ = "Option --" + name + " requires a value";
                return false;
            }
            inline_value = argv[++i];
        }
        if (!assign(name, inline_value)) {
            return false;
        }
    }

    return true;
}

bool CommandLineParser::assign(const std::string& long_name, const std::string& value) {
    switch (options_.at(long_name).kind) {
        case ValueKind::Duration:
            try {
                durations_[long_name] = utils::StringUtils::parse_duration(value);
            } catch (const std::logic_error& e) {
                error_ = "Invalid value for --" + long_name + ": " + e.what();
                return false;
            }
            break;
        case ValueKind::Count: {
            int count = 0;
            if (!parse_count(value, count)) {
                error_ = "Invalid value for --" + long_name + ": expected a non-negative integer, got '" + value + "'";
                return false;
            }
            counts_[long_name] = count;
            break;
        }
        default:
            break;
    }
    parsed_options_[long_name] = value;
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.count(normalize_option_name(name)) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    std::string normalized = normalize_option_name(name);
    auto it = parsed_options_.find(normalized);
    if (it != parsed_options_.end()) {
        return it->second;
    }

    auto opt_it = options_.find(normalized);
    if (opt_it != options_.end() && !opt_it->second.default_value.empty()) {
        return opt_it->second.default_value;
    }
    return default_value;
}

std::chrono::milliseconds CommandLineParser::get_duration_option(const std::string& name,
                                                                std::chrono::milliseconds default_value) const {
    auto it = durations_.find(normalize_option_name(name));
    return it != durations_.end() ? it->second : default_value;
}

int CommandLineParser::get_count_option(const std::string& name, int default_value) const {
    auto it = counts_.find(normalize_option_name(name));
    return it != counts_.end() ? it->second : default_value;
}

void CommandLineParser::print_help(const std::vector<std::string>& commands, std::ostream& os) const {
    os << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    if (!commands.empty()) {
        os << "Commands: " << utils::StringUtils::join(commands, ", ") << "\n\n";
    }
    os << "Options:\n";

    for (const auto& [name, option] : options_) {
        std::string flag = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        flag += "--" + name;
        if (option.kind == ValueKind::Duration) {
            flag += " <duration>";
        } else if (option.kind != ValueKind::None) {
            flag += " <value>";
        }

        os << "  " << std::left << std::setw(26) << flag << option.description;
        if (!option.default_value.empty()) {
            os << " (default: " << option.default_value << ")";
        }
        os << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 0.3.0\n";
    std::cout << "Composable content routing, built with C++20\n";
}

std::string CommandLineParser::normalize_option_name(const std::string& name) const {
    auto it = short_to_long_.find(name);
    return it != short_to_long_.end() ? it->second : name;
}

}
