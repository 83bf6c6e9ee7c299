#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "routeweave/core/logger.hpp"
#include "routeweave/core/config.hpp"
#include "routeweave/core/cli.hpp"
#include "routeweave/core/utils.hpp"
#include "routeweave/core/command_registry.hpp"
#include "routeweave/crypto/content_hash.hpp"
#include "routeweave/routing/router_config.hpp"

int main(int argc, char* argv[]) {
    using namespace routeweave;

    auto session = std::make_shared<core::RoutingSession>();
    core::CommandRegistry command_registry(session);
    core::CommandLineParser parser("routeweave");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help(command_registry.command_names(), std::cerr);
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help(command_registry.command_names());
        command_registry.print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = core::Config::instance();
    config.set_defaults();
    
    auto config_file = core::utils::FileUtils::expand_home(parser.get_option("config", "~/.routeweave.conf"));
    if (core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Error: cannot read " << config_file.string() << "\n";
            return 1;
        }
    }
    
    auto log_level = parser.has_option("verbose") ?
        core::LogLevel::Debug : core::Logger::parse_level(config.get_string("log.level", "info"));
    core::Logger::initialize(config.get_string("log.file", "routeweave.log"), log_level);
    
    if (!crypto::initialize()) {
        std::cerr << "Error: crypto library failed to initialize\n";
        return 1;
    }
    
    try {
        session->request_timeout = parser.get_duration_option("timeout", config.get_duration("request.timeout"));
        session->count = parser.get_count_option("count", config.get_int("request.count", 0));
        session->router = routing::build_router(config);
    } catch (const std::exception& e) {
        LOG_ERROR("Startup failed: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        core::Logger::shutdown();
        return 1;
    }
    
    LOG_INFO("RouteWeave starting up");
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help(command_registry.command_names());
        command_registry.print_help();
        core::Logger::shutdown();
        return 0;
    }

    std::string command = args[0];
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    } else if (!result.message.empty()) {
        LOG_INFO("{}", result.message);
    }
    
    core::Logger::shutdown();
    return result.exit_code;
}
