#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cctype>
#include <csignal>
#include <curl/curl.h>

#include "command.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "pipeline.hpp"
#include "preflight.hpp"
#include "report.hpp"
#include "run_log.hpp"
#include "utils.hpp"

namespace {

const char* const kDefaultConfigPath = "/etc/lempctl/lempctl.yaml";

constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

void printHelp()
{
    std::cout << "lempctl - LEMP stack provisioning for Ubuntu\n"
              << "Usage: lempctl [options]\n\n"
              << "Installs nginx, MariaDB and PHP-FPM, secures the database, and\n"
              << "verifies the stack end to end with real HTTP and database traffic.\n\n"
              << "Options:\n"
              << "  --php<ver>                Runtime version, e.g. --php8.1 (default 7.4)\n"
              << "  --php-version=<ver>       Same as --php<ver>\n"
              << "  --php-modules=<a,b,...>   Optional PHP modules to install\n"
              << "  --php-no-socket           Reach PHP-FPM over TCP 127.0.0.1:9000\n"
              << "  --no-mariadb-secure       Skip MariaDB hardening\n"
              << "  --config=<path>           Settings file (default " << kDefaultConfigPath << ")\n"
              << "  --debug=<step>            Run a single step in isolation\n"
              << "  --help                    Show this help\n\n"
              << "Steps:\n";
    for (Lempctl::Step step : Lempctl::allSteps()) {
        std::cout << "  " << Lempctl::stepName(step) << "\n";
    }
}

// Command-line settings; applied on top of the settings file.
struct Options
{
    std::string configPath = kDefaultConfigPath;
    std::optional<std::string> phpVersion;
    std::optional<std::string> phpModules;
    bool noSecure = false;
    bool noSocket = false;
    std::optional<Lempctl::Step> debugStep;
    std::vector<std::string> ignored;
};

bool startsWith(const std::string& s, const std::string& prefix)
{
    return s.rfind(prefix, 0) == 0;
}

} // namespace

int main(int argc, char* argv[])
{
    Options options;

    // -------------------------------------------------------------
    // Argument Parsing
    // -------------------------------------------------------------
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printHelp();
            return 0;
        }
        else if (arg == "--no-mariadb-secure") {
            options.noSecure = true;
        }
        else if (arg == "--php-no-socket") {
            options.noSocket = true;
        }
        else if (startsWith(arg, "--php-modules=")) {
            options.phpModules = arg.substr(std::string("--php-modules=").size());
        }
        else if (startsWith(arg, "--php-version=")) {
            options.phpVersion = arg.substr(std::string("--php-version=").size());
        }
        else if (startsWith(arg, "--config=")) {
            options.configPath = arg.substr(std::string("--config=").size());
        }
        else if (arg == "--debug" || startsWith(arg, "--debug=")) {
            std::string name;
            if (arg == "--debug") {
                if (i + 1 >= argc) {
                    std::cerr << "Error: --debug requires a step name.\n";
                    return kExitUsage;
                }
                name = argv[++i];
            } else {
                name = arg.substr(std::string("--debug=").size());
            }

            options.debugStep = Lempctl::parseStep(name);
            if (!options.debugStep) {
                std::cerr << "Error: Unknown step '" << name << "'. Valid steps are:\n";
                for (Lempctl::Step step : Lempctl::allSteps()) {
                    std::cerr << "  " << Lempctl::stepName(step) << "\n";
                }
                return kExitUsage;
            }
        }
        else if (startsWith(arg, "--php") && arg.size() > 5 && std::isdigit(static_cast<unsigned char>(arg[5]))) {
            options.phpVersion = arg.substr(5);
        }
        else {
            options.ignored.push_back(arg);
        }
    }

    // -------------------------------------------------------------
    // Settings
    // -------------------------------------------------------------
    Lempctl::Config config;
    try {
        config = Lempctl::Config::loadFromFile(options.configPath);
    } catch (const Lempctl::ConfigError& e) {
        Lempctl::log_error(e.what());
        return kExitFatal;
    }

    if (options.phpVersion)  config.phpVersion = *options.phpVersion;

    const std::string requested = config.phpVersion;
    config.phpVersion = Lempctl::normalizePhpVersion(requested);
    if (config.phpVersion != requested) {
        Lempctl::log_warning("PHP " + requested + " is not available. Using " + config.phpVersion + " instead.");
    }
    if (options.phpModules)  config.phpModules = *options.phpModules;
    if (options.noSecure)    config.secureDatabase = false;
    if (options.noSocket)    config.phpUseSocket = false;

    // -------------------------------------------------------------
    // Preflight (nothing on the host has been touched yet)
    // -------------------------------------------------------------
    if (auto failure = Lempctl::Preflight::check(config)) {
        Lempctl::log_error(*failure + " Exiting...");
        return kExitFatal;
    }

    std::unique_ptr<Lempctl::RunLog> log;
    try {
        log = std::make_unique<Lempctl::RunLog>(config.logFile);
    } catch (const std::exception& e) {
        Lempctl::log_error(std::string(e.what()) + " Exiting...");
        return kExitFatal;
    }

    // A child closing its stdin early must not kill us while we feed it
    std::signal(SIGPIPE, SIG_IGN);
    curl_global_init(CURL_GLOBAL_DEFAULT);

    Lempctl::Report report(log.get());
    for (const auto& arg : options.ignored) {
        report.error("No such option: " + arg + ". Ignored.");
    }

    Lempctl::SystemCommandRunner runner;
    Lempctl::CurlHttpClient http(config.httpTimeout);
    Lempctl::Pipeline pipeline(config, runner, http, report);

    try {
        if (options.debugStep) {
            config.print();
            report.info(std::string("Running step ") + Lempctl::stepName(*options.debugStep) + " only.");
            pipeline.runStep(*options.debugStep);
        } else {
            pipeline.run();
        }
    } catch (const std::exception& e) {
        // Only a broken building block (fork, pipe) ends up here
        report.error(std::string("Aborting run: ") + e.what());
    }

    log->finish();
    curl_global_cleanup();
    return 0;
}
