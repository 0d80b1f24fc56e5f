#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <core/network/server/http_server.h>
#include <core/transfer/transfer_tracker.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace rangeserve::core;
namespace net = boost::asio;
namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    po::options_description desc("rangeserve options");
    desc.add_options()("help,h", "show this help")(
        "config,c", po::value<std::string>(), "TOML config file")(
        "port,p", po::value<std::uint16_t>(), "listening port (default 7777)")(
        "root,r", po::value<std::string>(), "directory /getfile paths resolve under (default /)")(
        "threads,t", po::value<unsigned int>(), "io threads")(
        "log-level,l", po::value<std::string>(), "trace, debug, info, warn, error, critical, off");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "error: " << e.what() << "\n" << desc << "\n";
        return 1;
    }
    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }

    if (vm.count("config")) {
        InitConfig(vm["config"].as<std::string>());
    }
    if (vm.count("port")) {
        settings.port = vm["port"].as<std::uint16_t>();
    }
    if (vm.count("root")) {
        settings.root_dir = vm["root"].as<std::string>();
    }
    if (vm.count("threads") && vm["threads"].as<unsigned int>() > 0) {
        settings.threads = vm["threads"].as<unsigned int>();
    }
    if (vm.count("log-level")) {
        settings.log_level = ParseLogLevel(vm["log-level"].as<std::string>(), settings.log_level);
    }

    Logger logger(
#ifdef RANGESERVE_DEBUG
        Logger::Level::debug,
#else
        settings.log_level,
#endif
        settings.log_dir);

    try {
        net::io_context ioc(static_cast<int>(settings.threads));
        TransferTracker tracker;
        HttpServer server(ioc, tracker, settings);

        server.Start(settings.port);
        if (!server.is_running()) {
            return 1;
        }
        spdlog::info("Serving files under {} with {} io threads",
                     settings.root_dir.string(),
                     settings.threads);

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            spdlog::info("Received signal {}, shutting down", signal_number);
            server.Stop();
            ioc.stop();
        });

        std::vector<std::thread> threads;
        for (unsigned int i = 1; i < settings.threads; ++i) {
            threads.emplace_back([&ioc]() {
                try {
                    ioc.run();
                } catch (const std::exception& e) {
                    spdlog::error("io thread error: {}", e.what());
                }
            });
        }

        ioc.run();

        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    } catch (const std::exception& e) {
        spdlog::critical("Server error: {}", e.what());
        return 1;
    }

    spdlog::info("rangeserve exited");
    return 0;
}
