#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <CLI/CLI.hpp>

#include "wamlink/core/errors.hpp"
#include "wamlink/server/app.hpp"
#include "wamlink/util/config_loader.hpp"
#include "wamlink/util/logging.hpp"

int main(int argc, char** argv) {
    CLI::App app{"WAM speaker session server"};

    std::string config_path;
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    std::optional<std::string> log_level;

    app.add_option("-c,--config", config_path, "YAML configuration file")->check(CLI::ExistingFile);
    app.add_option("--host", host, "Viewer WebSocket bind address");
    app.add_option("--port", port, "Viewer WebSocket port")->check(CLI::Range(1, 65535));
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error or off");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    wamlink::util::ServerConfig config;
    try {
        if (!config_path.empty()) {
            config = wamlink::util::load_config(config_path);
        }
        if (host) {
            config.server.host = *host;
        }
        if (port) {
            config.server.port = *port;
        }
        if (log_level) {
            config.log.level = *log_level;
        }
        wamlink::util::log::configure(config.log.level, config.log.pattern);
    } catch (const wamlink::ConfigError& ex) {
        std::cerr << ex.what() << "\n";
        return 2;
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Invalid log level: " << ex.what() << "\n";
        return 2;
    }

    wamlink::util::log::info("Starting wamlink-server with " + std::to_string(config.devices.size()) +
                             " configured speaker(s)");
    return wamlink::server::run(config);
}
