#pragma once

#include "routeweave/routing/routing.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace routeweave::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

// State shared by all handlers of one invocation.
struct RoutingSession {
    std::shared_ptr<routing::Routing> router;
    // Zero leaves requests unbounded.
    std::chrono::milliseconds request_timeout{0};
    int count = 0;
    std::ostream* out = &std::cout;
    
    routing::ContextPtr request_context() const;
};

class CommandHandler {
public:
    explicit CommandHandler(std::shared_ptr<RoutingSession> session) : session_(std::move(session)) {}
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;

protected:
    routing::Routing& router() const { return *session_->router; }
    std::ostream& out() const { return *session_->out; }
    
    std::shared_ptr<RoutingSession> session_;
};

class ProvideCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Announce content (raw data or a content id)"; }
    std::string get_usage() const override { return "provide <data|cid>"; }
};

class ProvidersCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List peers providing a content id"; }
    std::string get_usage() const override { return "providers <cid>"; }
};

class PeerCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Resolve the addresses of a peer"; }
    std::string get_usage() const override { return "peer <peer-id>"; }
};

class PutCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Store a value record"; }
    std::string get_usage() const override { return "put <key> <value>"; }
};

class GetCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Fetch the first value found for a key"; }
    std::string get_usage() const override { return "get <key>"; }
};

class SearchCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Stream every value found for a key"; }
    std::string get_usage() const override { return "search <key>"; }
};

class BootstrapCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Bootstrap every configured router"; }
    std::string get_usage() const override { return "bootstrap"; }
};

class RoutersCommandHandler : public CommandHandler {
public:
    using CommandHandler::CommandHandler;
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show the configured router composition"; }
    std::string get_usage() const override { return "routers"; }

private:
    void describe(const routing::Routing& router, int depth) const;
};

}
