#include "Client.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "I2pInterface.hpp"
#include "Identity.hpp"
#include "Logger.hpp"
#include "RouterBootstrap.hpp"
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace garlic_shell {

namespace {
    constexpr auto ROUTER_READY_TIMEOUT = std::chrono::seconds(60);

    struct ClientOptions {
        ClientConfig config;
        std::string command_line;
        bool verbose = false;
    };

    void printUsage(const char* program) {
        std::cerr << "Usage: " << program
                  << " --server-dest <destination> [--sam host:port] [--identity path]"
                     " [--timeout S] [--verbose] -e \"<command> args...\"\n";
    }

    ClientOptions parseArguments(int argc, char* argv[]) {
        ClientOptions options;
        ClientConfig& config = options.config;
        config.enable_i2p = true;
        if (const char* sam = std::getenv("GARLICSHELL_SAM_ADDRESS")) {
            config.sam_address = sam;
        }

        bool haveIdentityPath = false;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw ConfigError(arg + " requires a value");
                }
                return argv[++i];
            };

            if (arg == "--server-dest") {
                config.server_i2p_destination = value();
            } else if (arg == "--sam") {
                config.sam_address = value();
            } else if (arg == "--identity") {
                config.identity_path = value();
                haveIdentityPath = true;
            } else if (arg == "--timeout") {
                try {
                    config.command_timeout = std::stoull(value());
                }
                catch (const std::logic_error&) {
                    throw ConfigError("--timeout expects a number of seconds");
                }
            } else if (arg == "-e") {
                options.command_line = value();
            } else if (arg == "--verbose") {
                options.verbose = true;
            } else {
                throw ConfigError("Unknown option " + arg);
            }
        }

        if (options.command_line.empty()) {
            throw ConfigError("-e <command> is required");
        }

        // Without --identity every run uses a fresh throwaway identity
        if (haveIdentityPath) {
            if (std::filesystem::exists(config.identity_path)) {
                config.identity = Identity::loadFromFile(config.identity_path);
            } else {
                config.ensureIdentity().saveToFile(config.identity_path);
            }
        }

        config.validate();
        return options;
    }

    std::vector<std::string> splitWords(const std::string& line) {
        std::istringstream stream(line);
        std::vector<std::string> words;
        std::string word;
        while (stream >> word) {
            words.push_back(word);
        }
        return words;
    }

    int exitStatusFor(const CommandResponse& response) {
        if (response.exit_code < 0) {
            return 1;
        }
        return response.exit_code & 0xFF;
    }
}

} // namespace garlic_shell

int main(int argc, char* argv[]) {
    using namespace garlic_shell;

    std::signal(SIGPIPE, SIG_IGN);
    Logger::setLogLevel(LogLevel::Warning);
    Logger::enableConsoleOutput(true);

    ClientOptions options;
    try {
        options = parseArguments(argc, argv);
    }
    catch (const GarlicError& e) {
        std::cerr << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    if (options.verbose) {
        Logger::setLogLevel(LogLevel::Debug);
    }

    try {
        ExternalRouter router(options.config.sam_address);
        router.waitReady(ROUTER_READY_TIMEOUT);
        auto samAddress = router.samAddress();
        if (!samAddress) {
            throw NetworkError("Router exposes no SAM bridge");
        }

        auto iface = std::make_shared<I2pInterface>(*samAddress);
        const Address serverAddress =
            iface->registerDestination(*options.config.server_i2p_destination);

        Client client(options.config, iface, serverAddress);
        client.connect();

        auto words = splitWords(options.command_line);
        const std::string command = words.front();
        words.erase(words.begin());

        CommandResponse response = client.executeCommand(command, words);
        client.disconnect();

        std::cout.write(reinterpret_cast<const char*>(response.stdout_data.data()),
                        static_cast<std::streamsize>(response.stdout_data.size()));
        std::cerr.write(reinterpret_cast<const char*>(response.stderr_data.data()),
                        static_cast<std::streamsize>(response.stderr_data.size()));
        std::cout.flush();

        if (response.status == CommandStatus::Timeout) {
            std::cerr << "Command timed out on the server\n";
        }

        iface->close();
        router.shutdown();
        return exitStatusFor(response);
    }
    catch (const RejectedError& e) {
        Logger::logError(e.code(),
            e.reason() + " (code " + std::to_string(e.rejectCode()) + ")");
        return 1;
    }
    catch (const GarlicError& e) {
        Logger::logError(e.code(), e.what());
        return 1;
    }
    catch (const std::exception& e) {
        Logger::logError(ErrorCode::ProcessingError, std::string("Fatal: ") + e.what());
        return 1;
    }
}
