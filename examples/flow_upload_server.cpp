/**
 * @file flow_upload_server.cpp
 * @brief Resumable chunked-upload server for flow.js clients
 *
 * Run with:
 *   ./build/chunkyard_server -c server.json
 *   ./build/chunkyard_server -p 9000 -r /var/lib/uploads
 *
 * Test with:
 *   curl "http://localhost:8080/upload?flowChunkNumber=1&flowTotalChunks=1&flowChunkSize=5&flowTotalSize=5&flowIdentifier=abc&flowFilename=a.txt&flowRelativePath=a.txt"
 *   curl -F flowChunkNumber=1 -F flowTotalChunks=1 -F flowChunkSize=5 -F flowTotalSize=5 \
 *        -F flowIdentifier=abc -F flowFilename=a.txt -F flowRelativePath=a.txt \
 *        -F file=@a.txt http://localhost:8080/upload
 *   curl http://localhost:8080/api/stats
 */

#include "chunkyard/core/config.hpp"
#include "chunkyard/events/components.hpp"
#include "chunkyard/events/event_bus.hpp"
#include "chunkyard/events/events.hpp"
#include "chunkyard/network/http_router.hpp"
#include "chunkyard/network/http_server_asio.hpp"
#include "chunkyard/server/routes.hpp"
#include "chunkyard/upload/service.hpp"

#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace chunkyard;
using namespace chunkyard::network;

namespace {

struct CommandLine {
    std::optional<std::string> config_path;
    std::optional<std::uint16_t> port;
    std::optional<std::string> root;
    unsigned threads = std::max(1u, std::thread::hardware_concurrency());
};

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <file>   JSON configuration file\n";
    std::cout << "  -p, --port <port>     Listening port (overrides config)\n";
    std::cout << "  -r, --root <dir>      Storage root (overrides config)\n";
    std::cout << "  -t, --threads <n>     Event loop threads (default: hardware concurrency)\n";
    std::cout << "  -h, --help            Show this help\n";
}

/**
 * @return false when the program should exit; exit_code says how
 */
bool parse_command_line(int argc, char* argv[], CommandLine& cli, int& exit_code) {
    exit_code = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto next_value = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                spdlog::error("{} requires a value", flag);
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return false;
        } else if (arg == "-c" || arg == "--config") {
            const char* value = next_value("--config");
            if (!value) { exit_code = 1; return false; }
            cli.config_path = value;
        } else if (arg == "-p" || arg == "--port") {
            const char* value = next_value("--port");
            if (!value) { exit_code = 1; return false; }
            try {
                const int port = std::stoi(value);
                if (port < 0 || port > 65535) {
                    throw std::out_of_range("port");
                }
                cli.port = static_cast<std::uint16_t>(port);
            } catch (const std::exception&) {
                spdlog::error("Invalid port: {}", value);
                exit_code = 1;
                return false;
            }
        } else if (arg == "-r" || arg == "--root") {
            const char* value = next_value("--root");
            if (!value) { exit_code = 1; return false; }
            cli.root = value;
        } else if (arg == "-t" || arg == "--threads") {
            const char* value = next_value("--threads");
            if (!value) { exit_code = 1; return false; }
            try {
                cli.threads = static_cast<unsigned>(std::max(1, std::stoi(value)));
            } catch (const std::exception&) {
                spdlog::error("Invalid thread count: {}", value);
                exit_code = 1;
                return false;
            }
        } else {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            exit_code = 1;
            return false;
        }
    }
    return true;
}

/**
 * @brief Re-arms itself every sweep_interval and runs a retention sweep
 */
class SweepScheduler {
public:
    SweepScheduler(boost::asio::io_context& io_context,
                   upload::ChunkUploadService& service,
                   std::chrono::seconds interval,
                   std::chrono::seconds retention)
        : timer_(io_context), service_(service), interval_(interval), retention_(retention) {}

    void start() {
        if (interval_.count() <= 0) {
            spdlog::info("Periodic sweep disabled");
            return;
        }
        spdlog::info("Sweeping uploads older than {}s every {}s", retention_.count(), interval_.count());
        schedule();
    }

    void stop() {
        timer_.cancel();
    }

private:
    void schedule() {
        timer_.expires_after(interval_);
        timer_.async_wait([this](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            // Errors are already reported through SweepCompletedEvent
            auto swept = service_.cleanup(retention_);
            if (swept.is_error()) {
                spdlog::debug("Sweep will be retried in {}s", interval_.count());
            }
            schedule();
        });
    }

    boost::asio::steady_timer timer_;
    upload::ChunkUploadService& service_;
    std::chrono::seconds interval_;
    std::chrono::seconds retention_;
};

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    CommandLine cli;
    int exit_code = 0;
    if (!parse_command_line(argc, argv, cli, exit_code)) {
        return exit_code;
    }

    core::ServerConfig config;
    if (cli.config_path) {
        auto loaded = core::load_config(*cli.config_path);
        if (loaded.is_error()) {
            spdlog::error("Failed to load {}: {}", *cli.config_path, loaded.error().message);
            return 1;
        }
        config = loaded.value();
    }
    if (cli.port) {
        config.port = *cli.port;
    }
    if (cli.root) {
        config.storage.root = *cli.root;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));

    // ────────────────────────────────────────────────────────
    // Event bus and observers
    // ────────────────────────────────────────────────────────

    events::EventBus event_bus;
    events::LoggerComponent logger(event_bus);
    events::MetricsComponent metrics(event_bus);

    upload::ChunkUploadService service(config.storage, event_bus);

    // Fail at startup rather than on the first upload
    if (auto valid = service.validate_root(); valid.is_error()) {
        spdlog::error("Storage root {} is unusable: {}", config.storage.root.string(), valid.error().message);
        return 1;
    }

    // ────────────────────────────────────────────────────────
    // Routes
    // ────────────────────────────────────────────────────────

    HttpRouter router;
    router.use([](const HttpContext& ctx, HttpResponse&) {
        spdlog::debug("{} {} from {}",
            HttpMethodUtils::to_string(ctx.request.method),
            ctx.request.path(),
            ctx.request.get_header("User-Agent"));
        return true;
    });
    server::register_upload_routes(router, service, metrics, config.upload_path);

    spdlog::info("Registered routes:");
    for (const auto& route : router.list_routes()) {
        spdlog::info("  {}", route);
    }

    // ────────────────────────────────────────────────────────
    // Event loop
    // ────────────────────────────────────────────────────────

    try {
        boost::asio::io_context io_context;

        HttpServerAsio http_server(io_context, config.port);
        http_server.set_handler([&router](const HttpRequest& request) {
            return router.handle_request(request);
        });

        SweepScheduler sweeps(io_context, service, config.sweep_interval, config.retention);
        sweeps.start();

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            event_bus.emit(events::ServerShuttingDownEvent(signal_number == SIGINT ? "SIGINT" : "SIGTERM"));
            sweeps.stop();
            http_server.stop();
            io_context.stop();
        });

        event_bus.emit(events::ServerStartedEvent(http_server.get_port(),
                                                  std::filesystem::absolute(config.storage.root).string()));
        spdlog::info("Running {} event loop thread(s); press Ctrl+C to stop", cli.threads);

        std::vector<std::thread> workers;
        for (unsigned i = 1; i < cli.threads; ++i) {
            workers.emplace_back([&io_context]() { io_context.run(); });
        }
        io_context.run();
        for (auto& worker : workers) {
            worker.join();
        }
    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }

    metrics.print_stats();
    spdlog::info("Server shut down cleanly");
    return 0;
}
