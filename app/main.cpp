#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <respkv/core/store.hpp>
#include <respkv/net/server.hpp>
#include <respkv/util/config.hpp>
#include <respkv/util/log.hpp>

using namespace respkv;

static void usage() {
    std::cout << "Usage: respkv-server [--port N] [--bind ADDR] [--loglevel error|warn|info|debug] [--config PATH]\n";
}

int main(int argc, char** argv) {
    std::signal(SIGPIPE, SIG_IGN);

    // config file first, explicit flags override it
    std::string config_path;
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") config_path = argv[i + 1];
    }

    ServerConfig cfg;
    try {
        cfg = load_config(config_path);
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if ((a == "--port" || a == "-p") && i + 1 < argc) {
                apply_directive(cfg, "port", argv[++i]);
            }
            else if (a == "--bind" && i + 1 < argc) {
                apply_directive(cfg, "bind", argv[++i]);
            }
            else if (a == "--loglevel" && i + 1 < argc) {
                apply_directive(cfg, "loglevel", argv[++i]);
            }
            else if (a == "--config" && i + 1 < argc) {
                ++i;
            }
            else if (a == "--help" || a == "-?") {
                usage();
                return 0;
            }
            else if (i == 1 && a.find_first_not_of("0123456789") == std::string::npos) {
                // backward-compat: first arg as port (e.g., "6379")
                apply_directive(cfg, "port", a);
            }
            else {
                std::cerr << "unknown argument '" << a << "'\n";
                usage();
                return 1;
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "config error: " << e.what() << "\n";
        return 1;
    }

    set_log_level(parse_log_level(cfg.log_level));

    try {
        asio::io_context io;
        auto store = std::make_shared<Store>();
        Server server(make_listener(io, cfg.bind, cfg.port), store);

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io](const std::error_code& ec, int sig) {
            if (ec) return;
            log(LogLevel::Info, "signal " + std::to_string(sig) + ", shutting down");
            io.stop();
            });

        log(LogLevel::Info, "respkv listening on " + cfg.bind + ":" + std::to_string(server.port()));
        io.run();
    }
    catch (const std::exception& e) {
        log(LogLevel::Error, std::string("fatal: ") + e.what());
        return 1;
    }
    return 0;
}
