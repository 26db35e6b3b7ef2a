#include <iostream>
#include <string>
#include <vector>
#include "lanbeam/core/logger.hpp"
#include "lanbeam/core/config.hpp"
#include "lanbeam/core/cli.hpp"
#include "lanbeam/core/utils.hpp"
#include "lanbeam/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    lanbeam::core::CommandLineParser parser("lanbeam");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        lanbeam::core::CommandRegistry().print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = lanbeam::core::Config::instance();
    config.set_defaults();

    auto config_file = lanbeam::core::utils::FileUtils::expand_user(parser.get_option("config", "~/.lanbeam.conf"));
    if (lanbeam::core::utils::FileUtils::exists(config_file)) {
        config.load_from_file(config_file.string());
    }

    if (parser.has_option("socket")) {
        config.set("ipc.socket", parser.get_option("socket"));
    }

    auto log_level = parser.has_option("verbose") ?
        lanbeam::core::LogLevel::Debug :
        lanbeam::core::Logger::parse_level(config.get_string("log.level", "info"));
    lanbeam::core::Logger::initialize(config.get_string("log.file", "lanbeam.log"), log_level);

    lanbeam::core::CommandRegistry command_registry;

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    std::string command = args[0];
    LOG_DEBUG("Running command: {}", command);

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }

    lanbeam::core::Logger::shutdown();
    return result.exit_code;
}
