#include <iostream>
#include <string>
#include <vector>
#include "splatlink/core/logger.hpp"
#include "splatlink/core/config.hpp"
#include "splatlink/core/cli.hpp"
#include "splatlink/core/utils.hpp"
#include "splatlink/core/command_registry.hpp"
#include "splatlink/crypto/random.hpp"
#include "splatlink/transfer/pipeline_config.hpp"

int main(int argc, char* argv[]) {
    splatlink::core::CommandLineParser parser("splatlink");

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help();
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }

    auto& config = splatlink::core::Config::instance();
    config.set_defaults();

    auto config_file = splatlink::core::utils::FileUtils::expand_home(parser.get_option("config", "~/.splatlink.conf"));
    if (splatlink::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Error: cannot read config file " << config_file.string() << "\n";
            return 1;
        }
    }

    if (parser.has_option("server")) {
        config.set("server.url", parser.get_option("server"));
    }

    auto log_level = parser.has_option("verbose") ?
        splatlink::core::LogLevel::Debug :
        splatlink::core::Logger::parse_level(config.get_string("log.level", "info"));
    splatlink::core::Logger::initialize(config.get_string("log.file", "splatlink.log"), log_level);

    LOG_INFO("splatlink starting up (server {})", config.get_string("server.url"));

    if (!splatlink::crypto::SecureRandom::initialize()) {
        std::cerr << "Error: failed to initialize libsodium\n";
        return 1;
    }

    auto pipeline_config = splatlink::transfer::PipelineConfig::from_config(config);
    splatlink::core::CommandRegistry command_registry(parser, pipeline_config);

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        return 0;
    }

    std::string command = args[0];

    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        LOG_ERROR("Command '{}' failed: {}", command, result.message);
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }

    splatlink::core::Logger::shutdown();
    return result.exit_code;
}
