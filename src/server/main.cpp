#include "scansync/config/config.hpp"
#include "scansync/core/cancellation.hpp"
#include "scansync/events/components.hpp"
#include "scansync/events/event_bus.hpp"
#include "scansync/remote/directory_store.hpp"
#include "scansync/service/uploader.hpp"
#include "scansync/watch/inotify_source.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

bool wants_help(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return true;
        }
    }
    return false;
}

bool apply_log_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return false;
    }
    spdlog::set_level(level);
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (wants_help(argc, argv)) {
        std::cout << scansync::config::usage(argv[0]);
        return 0;
    }

    auto parsed = scansync::config::parse_args(argc, argv);
    if (parsed.is_error()) {
        spdlog::error("{}", parsed.error().describe());
        std::cerr << scansync::config::usage(argv[0]);
        return 2;
    }
    const scansync::config::Config config = parsed.value();

    if (auto valid = scansync::config::validate(config); valid.is_error()) {
        spdlog::error("{}", valid.error().describe());
        return 2;
    }
    if (!apply_log_level(config.log_level)) {
        spdlog::error("unknown log level: {}", config.log_level);
        return 2;
    }

    scansync::events::EventBus bus;
    scansync::events::LoggerComponent logger(bus);
    scansync::events::MetricsComponent metrics(bus);

    auto store = std::make_shared<scansync::remote::DirectoryStore>(config.store_root);

    auto source = scansync::watch::InotifyEventSource::create();
    if (source.is_error()) {
        spdlog::error("failed to create directory watcher: {}", source.error().describe());
        return 1;
    }

    auto uploader = scansync::service::Uploader::create(config, store, std::move(source.value()), bus);
    if (uploader.is_error()) {
        spdlog::error("{}", uploader.error().describe());
        return 1;
    }

    scansync::CancellationSource cancel;

    boost::asio::io_context io_context;
    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&cancel](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, shutting down...", signal_number);
        cancel.cancel();
    });
    std::thread signal_thread([&io_context] { io_context.run(); });

    spdlog::info("Press Ctrl+C to stop");
    auto result = uploader.value()->run_until_done(cancel);
    uploader.value().reset();

    io_context.stop();
    signal_thread.join();

    metrics.print_stats();

    if (result.is_error() && !result.error().is_cancelled()) {
        spdlog::error("{}", result.error().describe());
        return 1;
    }
    return 0;
}
