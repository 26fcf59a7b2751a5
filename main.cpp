#include "cli/Args.hpp"
#include "config/Config.hpp"
#include "fs/Service.hpp"
#include "log/Registry.hpp"
#include "protocols/TcpAcceptor.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"

#include <boost/asio/io_context.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <thread>
#include <vector>

using namespace dp;
using namespace dp::protocols;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) { shouldExit = true; }

unsigned int workerCount(const unsigned int configured) {
    if (configured > 0) return configured;
    return std::max(1u, std::thread::hardware_concurrency());
}

void runWorker(boost::asio::io_context& ioc) {
    for (;;) {
        try {
            ioc.run();
            return;
        } catch (const std::exception& e) {
            log::Registry::http()->error("[Worker] Unhandled exception in io_context: {}", e.what());
        }
    }
}
}

int main(int argc, char** argv) {
    cli::Options opts;
    try {
        opts = cli::parseArgs(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "dendrite: {}\n\n{}", e.what(), cli::usage());
        return EXIT_FAILURE;
    }

    if (opts.help) {
        fmt::print("{}", cli::usage());
        return EXIT_SUCCESS;
    }

    if (opts.command != "run") {
        fmt::print(stderr, "{}", cli::usage());
        return EXIT_FAILURE;
    }

    try {
        const auto cfg = cli::resolveConfig(opts, [](const char* name) { return std::getenv(name); });

        if (opts.configCheck) {
            fmt::print("Config OK: {} (file roots: {})\n", opts.configPath, cfg.file_roots.size());
            return EXIT_SUCCESS;
        }

        log::Registry::init(cfg.log);
        log::Registry::dendrite()->info("[*] dendrite server starting on port {}", cfg.main.port);

        std::vector<fs::model::Root> roots;
        roots.reserve(cfg.file_roots.size());
        for (const auto& r : cfg.file_roots) roots.push_back({r.virtual_root, r.source});
        const fs::Service service(roots);

        auto interruptFlag = std::make_shared<std::atomic<bool>>(false);
        const http::Router router(service, {
            .interruptFlag = interruptFlag,
            .requestTimeout = std::chrono::milliseconds(cfg.main.request_timeout_ms)
        });

        boost::asio::io_context ioc;
        const auto endpoint = makeEndpoint(cfg.main.listen, static_cast<unsigned short>(cfg.main.port));
        const auto server = std::make_shared<http::Server>(ioc, endpoint, router);
        server->run();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        const auto n = workerCount(cfg.main.worker_threads);
        std::vector<std::thread> workers;
        workers.reserve(n);
        for (unsigned int i = 0; i < n; ++i) workers.emplace_back([&ioc] { runWorker(ioc); });

        log::Registry::dendrite()->info("[✓] dendrite started with {} worker thread(s)", n);

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::milliseconds(200));

        log::Registry::dendrite()->info("[*] Shutting down dendrite...");

        interruptFlag->store(true);
        server->stop();
        ioc.stop();
        for (auto& t : workers) t.join();

        log::Registry::dendrite()->info("[✓] dendrite shut down cleanly.");
        log::Registry::shutdown();
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized())
            log::Registry::dendrite()->error("[-] Failed to start dendrite: {}", e.what());
        fmt::print(stderr, "dendrite: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
