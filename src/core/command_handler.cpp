#include "lanbeam/core/command_handler.hpp"
#include "lanbeam/core/config.hpp"
#include "lanbeam/core/engine.hpp"
#include "lanbeam/core/ipc_server.hpp"
#include "lanbeam/core/logger.hpp"
#include "lanbeam/core/utils.hpp"
#include <boost/asio.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>

namespace lanbeam::core {

namespace {

std::string field(const std::map<std::string, std::string>& data, const std::string& key,
                  const std::string& fallback = "") {
    auto it = data.find(key);
    return it != data.end() ? it->second : fallback;
}

std::size_t count_field(const std::map<std::string, std::string>& data, const std::string& key) {
    try {
        return std::stoul(field(data, key, "0"));
    } catch (const std::exception&) {
        return 0;
    }
}

std::string size_field(const std::map<std::string, std::string>& data, const std::string& key) {
    try {
        return utils::StringUtils::format_bytes(std::stoull(field(data, key, "0")));
    } catch (const std::exception&) {
        return field(data, key);
    }
}

CommandResult failed(const IPCResponse& response) {
    auto code = field(response.data, "error");
    return CommandResult::error(code.empty() ? response.message : code + ": " + response.message);
}

// One line per daemon event for the log; progress is DEBUG only.
void log_event(const Event& event) {
    std::vector<std::string> parts;
    for (const auto& [key, value] : event_fields(event)) {
        if (key.starts_with("peer.") && key != "peer.count") {
            continue;
        }
        parts.push_back(key + "=" + value);
    }

    auto line = utils::StringUtils::join(parts, " ");
    if (std::holds_alternative<TransferProgressEvent>(event)) {
        LOG_DEBUG("{}: {}", event_name(event), line);
    } else {
        LOG_INFO("{}: {}", event_name(event), line);
    }
}

void print_event(const IPCEvent& event) {
    const auto& f = event.fields;

    if (event.name == "peers_updated") {
        std::cout << "[peers] " << field(f, "change") << " " << field(f, "username")
                  << " (" << field(f, "address") << "), "
                  << field(f, "peer.count", "0") << " online\n";
    } else if (event.name == "file-offer") {
        auto id = field(f, "id");
        auto count = count_field(f, "file.count");
        std::cout << "[offer] " << field(f, "sender_name") << " (" << field(f, "from") << ") offers "
                  << count << " file(s), " << size_field(f, "total_size") << "\n";
        for (std::size_t i = 0; i < count; ++i) {
            auto prefix = "file." + std::to_string(i) + ".";
            std::cout << "    " << field(f, prefix + "name") << " (" << size_field(f, prefix + "size") << ")\n";
        }
        std::cout << "    lanbeam accept " << id << "\n";
        std::cout << "    lanbeam reject " << id << "\n";
    } else if (event.name == "offer-resolved") {
        std::cout << "[offer] " << field(f, "id") << " " << field(f, "outcome");
        auto reason = field(f, "reason");
        if (!reason.empty()) {
            std::cout << " (" << reason << ")";
        }
        std::cout << "\n";
    } else if (event.name == "transfer-progress") {
        auto name = field(f, "file_name", field(f, "file_path"));
        std::cout << "[transfer] " << name << " " << field(f, "progress") << "%\n";
    } else if (event.name == "transfer-complete") {
        auto saved = field(f, "saved_path");
        std::cout << "[transfer] " << field(f, "file_name", field(f, "file_path")) << " done";
        if (!saved.empty()) {
            std::cout << " -> " << saved;
        }
        std::cout << "\n";
    } else if (event.name == "session-complete") {
        std::cout << "[session] " << field(f, "offer_id") << " complete, "
                  << field(f, "file_count") << " file(s) " << field(f, "role") << "\n";
    } else if (event.name == "session-failed") {
        std::cout << "[session] " << field(f, "offer_id") << " failed: " << field(f, "error")
                  << " " << field(f, "message") << "\n";
    } else {
        std::cout << "[" << event.name << "]";
        for (const auto& [key, value] : f) {
            std::cout << " " << key << "=" << value;
        }
        std::cout << "\n";
    }
    std::cout.flush();
}

}

std::string DaemonCommandHandler::socket_path() {
    return Config::instance().get_string("ipc.socket", DEFAULT_IPC_SOCKET);
}

std::optional<IPCResponse> DaemonCommandHandler::request(const std::string& command,
                                                         const std::map<std::string, std::string>& parameters,
                                                         CommandResult& failure) const {
    IPCClient client(socket_path());

    IPCRequest request;
    request.command = command;
    request.parameters = parameters;

    auto response = client.send_request(request);
    if (!response) {
        failure = CommandResult::error("LanBeam daemon is not running (socket " + socket_path() +
                                       "). Start it with 'lanbeam daemon'.");
        return std::nullopt;
    }
    if (!response->success) {
        failure = failed(*response);
        return std::nullopt;
    }
    return response;
}

// StartCommandHandler Implementation
CommandResult StartCommandHandler::execute(const std::vector<std::string>&) {
    auto& config = Config::instance();
    auto options = EngineOptions::from_config(config);
    auto ipc_socket = config.get_string("ipc.socket", DEFAULT_IPC_SOCKET);

    LOG_INFO("Starting LanBeam daemon on TCP:{}, UDP:{}", options.transfer_port, options.discovery.listen_port);

    Engine engine(options);
    engine.events().subscribe(log_event);

    auto started = engine.start();
    if (!started) {
        LOG_ERROR("Failed to start network services: {}", started.describe());
        return CommandResult::error("Failed to start network services: " + started.describe());
    }

    IPCServer ipc_server(engine, ipc_socket);
    auto ipc_started = ipc_server.start();
    if (!ipc_started) {
        engine.stop();
        return CommandResult::error("Failed to start IPC server: " + ipc_started.describe());
    }

    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            LOG_INFO("Received signal {}", signal_number);
        }
    });

    ipc_server.set_shutdown_handler([&]() {
        LOG_INFO("Shutdown requested over IPC");
        boost::asio::post(signal_context, [&]() { signals.cancel(); });
    });

    std::cout << "LanBeam daemon running\n";
    std::cout << "  Address:   " << engine.get_own_address() << "\n";
    std::cout << "  Username:  " << engine.get_settings().username << "\n";
    std::cout << "  Discovery: UDP " << engine.discovery_port() << "\n";
    std::cout << "  Downloads: " << options.download_directory.string() << "\n";
    std::cout << "  Control:   " << ipc_socket << "\n";
    std::cout << "Press Ctrl+C to stop\n";

    signal_context.run();

    std::cout << "Stopping LanBeam daemon...\n";
    ipc_server.stop();
    engine.stop();

    return CommandResult::ok("Daemon stopped");
}

CommandResult StopCommandHandler::execute(const std::vector<std::string>&) {
    CommandResult failure;
    auto response = request("shutdown", {}, failure);
    if (!response) {
        return failure;
    }

    std::cout << response->message << "\n";
    return CommandResult::ok();
}

CommandResult StatusCommandHandler::execute(const std::vector<std::string>&) {
    CommandResult failure;
    auto response = request("status", {}, failure);
    if (!response) {
        return failure;
    }

    const auto& data = response->data;
    std::cout << "LanBeam Status (Live from Daemon):\n";
    std::cout << "  Offer port:      " << field(data, "offer_port") << "\n";
    std::cout << "  Discovery port:  " << field(data, "discovery_port") << "\n";
    std::cout << "  Peers online:    " << field(data, "peer_count", "0") << "\n";
    std::cout << "  Active offers:   " << field(data, "offer_count", "0") << "\n";
    std::cout << "  Download folder: " << field(data, "download_dir") << "\n";
    return CommandResult::ok();
}

CommandResult UsersCommandHandler::execute(const std::vector<std::string>&) {
    CommandResult failure;
    auto response = request("users", {}, failure);
    if (!response) {
        return failure;
    }

    auto count = count_field(response->data, "peer.count");
    if (count == 0) {
        std::cout << "No peers found.\n";
        return CommandResult::ok();
    }

    std::cout << "Peers on the network (" << count << "):\n";
    for (std::size_t i = 0; i < count; ++i) {
        auto prefix = "peer." + std::to_string(i) + ".";
        std::cout << "  " << field(response->data, prefix + "username")
                  << "  " << field(response->data, prefix + "address") << "\n";
    }
    return CommandResult::ok();
}

CommandResult WhoamiCommandHandler::execute(const std::vector<std::string>&) {
    CommandResult failure;
    auto response = request("whoami", {}, failure);
    if (!response) {
        return failure;
    }

    std::cout << field(response->data, "username") << "  " << field(response->data, "address") << "\n";
    return CommandResult::ok();
}

CommandResult InterfacesCommandHandler::execute(const std::vector<std::string>&) {
    CommandResult failure;
    auto response = request("interfaces", {}, failure);
    if (!response) {
        return failure;
    }

    auto count = count_field(response->data, "interface.count");
    std::cout << "Network interfaces:\n";
    for (std::size_t i = 0; i < count; ++i) {
        auto prefix = "interface." + std::to_string(i) + ".";
        std::cout << "  " << field(response->data, prefix + "name")
                  << "  ip " << field(response->data, prefix + "ip")
                  << "  broadcast " << field(response->data, prefix + "broadcast") << "\n";
    }
    return CommandResult::ok();
}

CommandResult SettingsCommandHandler::execute(const std::vector<std::string>& args) {
    std::map<std::string, std::string> parameters;

    for (std::size_t i = 1; i < args.size(); ++i) {
        auto eq_pos = args[i].find('=');
        if (eq_pos == std::string::npos) {
            return CommandResult::error("Usage: " + get_usage());
        }

        auto key = args[i].substr(0, eq_pos);
        auto value = args[i].substr(eq_pos + 1);
        if (key == "username" || key == "broadcast_address") {
            parameters[key] = value;
        } else if (key == "broadcasting" || key == "broadcasting_enabled") {
            parameters["broadcasting_enabled"] = value;
        } else {
            return CommandResult::error("Unknown setting: " + key);
        }
    }

    CommandResult failure;
    auto response = request("settings", parameters, failure);
    if (!response) {
        return failure;
    }

    std::cout << response->message << "\n";
    std::cout << "  username:          " << field(response->data, "username") << "\n";
    std::cout << "  broadcasting:      " << field(response->data, "broadcasting_enabled") << "\n";
    std::cout << "  broadcast_address: " << field(response->data, "broadcast_address") << "\n";
    return CommandResult::ok();
}

CommandResult SendCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    std::map<std::string, std::string> parameters;
    parameters["address"] = args[1];

    // The daemon resolves paths from its own working directory.
    std::size_t count = 0;
    for (std::size_t i = 2; i < args.size(); ++i) {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(args[i], ec);
        parameters["file." + std::to_string(count++)] = ec ? args[i] : absolute.string();
    }
    parameters["file.count"] = std::to_string(count);

    CommandResult failure;
    auto response = request("send", parameters, failure);
    if (!response) {
        return failure;
    }

    std::cout << "Offer " << field(response->data, "offer_id") << " sent to " << args[1] << "\n";
    std::cout << "Use 'lanbeam watch' to follow the answer and transfer progress.\n";
    return CommandResult::ok();
}

CommandResult AcceptCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    CommandResult failure;
    auto response = request("accept", {{"offer_id", args[1]}}, failure);
    if (!response) {
        return failure;
    }

    std::cout << response->message << "\n";
    return CommandResult::ok();
}

CommandResult RejectCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    CommandResult failure;
    auto response = request("reject", {{"offer_id", args[1]}}, failure);
    if (!response) {
        return failure;
    }

    std::cout << response->message << "\n";
    return CommandResult::ok();
}

CommandResult OffersCommandHandler::execute(const std::vector<std::string>&) {
    CommandResult failure;
    auto response = request("offers", {}, failure);
    if (!response) {
        return failure;
    }

    const auto& data = response->data;
    auto count = count_field(data, "offer.count");
    if (count == 0) {
        std::cout << "No active offers.\n";
        return CommandResult::ok();
    }

    for (std::size_t i = 0; i < count; ++i) {
        auto prefix = "offer." + std::to_string(i) + ".";
        std::cout << field(data, prefix + "id") << "  " << field(data, prefix + "direction")
                  << "  " << field(data, prefix + "status") << "  " << field(data, prefix + "peer")
                  << "  " << size_field(data, prefix + "total_size") << "\n";

        auto files = count_field(data, prefix + "file.count");
        for (std::size_t j = 0; j < files; ++j) {
            auto file_prefix = prefix + "file." + std::to_string(j) + ".";
            std::cout << "    " << field(data, file_prefix + "name")
                      << " (" << size_field(data, file_prefix + "size") << ")\n";
        }
    }
    return CommandResult::ok();
}

CommandResult RefreshCommandHandler::execute(const std::vector<std::string>&) {
    CommandResult failure;
    auto response = request("refresh", {}, failure);
    if (!response) {
        return failure;
    }

    std::cout << response->message << "\n";
    return CommandResult::ok();
}

CommandResult WatchCommandHandler::execute(const std::vector<std::string>&) {
    IPCClient client(socket_path());

    std::cout << "Watching daemon events, press Ctrl+C to stop\n";
    auto response = client.watch([](const IPCEvent& event) {
        print_event(event);
        return true;
    });

    if (!response) {
        return CommandResult::error("LanBeam daemon is not running (socket " + socket_path() + ")");
    }
    if (!response->success) {
        return failed(*response);
    }
    return CommandResult::ok("Daemon closed the event stream");
}

}
