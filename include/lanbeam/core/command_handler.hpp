#pragma once

#include "lanbeam/core/ipc_client.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lanbeam::core {

struct CommandResult {
    bool success = true;
    std::string message;
    int exit_code = 0;

    static CommandResult ok(const std::string& message = "") {
        return {true, message, 0};
    }
    static CommandResult error(const std::string& message, int exit_code = 1) {
        return {false, message, exit_code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

// Base for commands answered by a running daemon over the control socket.
class DaemonCommandHandler : public CommandHandler {
protected:
    // On failure returns nullopt and fills `failure`.
    std::optional<IPCResponse> request(const std::string& command,
                                       const std::map<std::string, std::string>& parameters,
                                       CommandResult& failure) const;

    static std::string socket_path();
};

class StartCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run the LanBeam daemon in the foreground"; }
    std::string get_usage() const override { return "lanbeam daemon"; }
};

class StopCommandHandler : public DaemonCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Stop the running daemon"; }
    std::string get_usage() const override { return "lanbeam stop"; }
};

class StatusCommandHandler : public DaemonCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show daemon status"; }
    std::string get_usage() const override { return "lanbeam status"; }
};

class UsersCommandHandler : public DaemonCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List peers discovered on the LAN"; }
    std::string get_usage() const override { return "lanbeam users"; }
};

class WhoamiCommandHandler : public DaemonCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show this node's address and name"; }
    std::string get_usage() const override { return "lanbeam whoami"; }
};

class InterfacesCommandHandler : public DaemonCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List network interfaces and broadcast addresses"; }
    std::string get_usage() const override { return "lanbeam interfaces"; }
};

class SettingsCommandHandler : public DaemonCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show or change user settings"; }
    std::string get_usage() const override {
        return "lanbeam settings [username=<name>] [broadcasting=<true|false>] [broadcast_address=<ip>]";
    }
};

class SendCommandHandler : public DaemonCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Offer files to a peer"; }
    std::string get_usage() const override { return "lanbeam send <ip[:port]> <file> [file...]"; }
};

class AcceptCommandHandler : public DaemonCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Accept a pending file offer"; }
    std::string get_usage() const override { return "lanbeam accept <offer_id>"; }
};

class RejectCommandHandler : public DaemonCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Reject a pending file offer"; }
    std::string get_usage() const override { return "lanbeam reject <offer_id>"; }
};

class OffersCommandHandler : public DaemonCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List pending and running offers"; }
    std::string get_usage() const override { return "lanbeam offers"; }
};

class RefreshCommandHandler : public DaemonCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Announce now and ask peers to reply"; }
    std::string get_usage() const override { return "lanbeam refresh"; }
};

class WatchCommandHandler : public DaemonCommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Print daemon events as they happen"; }
    std::string get_usage() const override { return "lanbeam watch"; }
};

}
