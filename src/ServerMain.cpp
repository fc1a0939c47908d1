#include "Config.hpp"
#include "Errors.hpp"
#include "I2pInterface.hpp"
#include "Identity.hpp"
#include "Logger.hpp"
#include "RouterBootstrap.hpp"
#include "Server.hpp"
#include "Utils.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

namespace garlic_shell {

namespace {
    std::atomic<bool> shutdownRequested{false};

    void signalHandler(int) {
        shutdownRequested = true;
    }

    constexpr auto ROUTER_READY_TIMEOUT = std::chrono::seconds(60);
    constexpr auto SHUTDOWN_POLL_INTERVAL = std::chrono::milliseconds(200);

    void printUsage(const char* program) {
        std::cerr << "Usage: " << program
                  << " [--sam host:port] [--identity path] [--max-sessions N]"
                     " [--timeout S] [--allow HEX]... [--log-file path] [--verbose]\n";
    }

    uint64_t parseNumber(const std::string& flag, const std::string& value) {
        try {
            size_t used = 0;
            unsigned long long number = std::stoull(value, &used);
            if (used != value.size()) {
                throw std::invalid_argument(value);
            }
            return number;
        }
        catch (const std::logic_error&) {
            throw ConfigError(flag + " expects a number, got '" + value + "'");
        }
    }

    Identity loadOrCreateIdentity(const std::string& path) {
        if (std::filesystem::exists(path)) {
            return Identity::loadFromFile(path);
        }
        Identity identity = Identity::generate();
        identity.saveToFile(path);
        return identity;
    }

    ServerConfig parseArguments(int argc, char* argv[], std::string& logFile, bool& verbose) {
        ServerConfig config;
        config.enable_i2p = true;
        if (const char* sam = std::getenv("GARLICSHELL_SAM_ADDRESS")) {
            config.sam_address = sam;
        }

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw ConfigError(arg + " requires a value");
                }
                return argv[++i];
            };

            if (arg == "--sam") {
                config.sam_address = value();
            } else if (arg == "--identity") {
                config.identity_path = value();
            } else if (arg == "--max-sessions") {
                config.max_sessions = parseNumber(arg, value());
            } else if (arg == "--timeout") {
                config.command_timeout = parseNumber(arg, value());
            } else if (arg == "--allow") {
                config.allowed_clients.push_back(value());
            } else if (arg == "--log-file") {
                logFile = value();
            } else if (arg == "--verbose") {
                verbose = true;
            } else {
                throw ConfigError("Unknown option " + arg);
            }
        }

        config.identity = loadOrCreateIdentity(config.identity_path);
        config.validate();
        return config;
    }
}

} // namespace garlic_shell

int main(int argc, char* argv[]) {
    using namespace garlic_shell;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    Logger::setLogLevel(LogLevel::Info);
    Logger::enableConsoleOutput(true);

    ServerConfig config;
    try {
        std::string logFile;
        bool verbose = false;
        config = parseArguments(argc, argv, logFile, verbose);
        if (verbose) {
            Logger::setLogLevel(LogLevel::Debug);
        }
        if (!logFile.empty()) {
            Logger::setLogFile(logFile);
        }
    }
    catch (const GarlicError& e) {
        std::cerr << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    try {
        Logger::logEvent(LogLevel::Info, "GarlicShell server starting");

        ExternalRouter router(config.sam_address);
        router.waitReady(ROUTER_READY_TIMEOUT);
        auto samAddress = router.samAddress();
        if (!samAddress) {
            throw NetworkError("Router exposes no SAM bridge");
        }

        auto iface = std::make_shared<I2pInterface>(*samAddress);
        Logger::logEvent(LogLevel::Info, "Server address " + Utils::toHex(iface->localAddress()));
        std::cout << "I2P destination: " << iface->localDestination() << std::endl;

        Server server(std::move(config));

        std::thread watcher([&server] {
            while (!shutdownRequested) {
                std::this_thread::sleep_for(SHUTDOWN_POLL_INTERVAL);
            }
            server.stop();
        });

        server.run(iface);
        shutdownRequested = true;
        watcher.join();

        router.shutdown();
        Logger::flush();
        return 0;
    }
    catch (const GarlicError& e) {
        Logger::logError(e.code(), std::string("Fatal: ") + e.what());
        Logger::flush();
        return 1;
    }
    catch (const std::exception& e) {
        Logger::logError(ErrorCode::ProcessingError, std::string("Fatal: ") + e.what());
        Logger::flush();
        return 1;
    }
}
