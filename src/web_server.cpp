#include "web_server.hpp"
#include "command.hpp"
#include "report.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace Lempctl {

WebServer::WebServer(CommandRunner& runner, Report& report, const std::string& confDir,
                     std::chrono::seconds timeout)
    : runner_(runner)
    , report_(report)
    , confDir_(confDir)
    , timeout_(timeout)
{
}

std::string WebServer::upstreamPath() const
{
    return (fs::path(confDir_) / "php-fpm.conf").string();
}

bool WebServer::validate()
{
    Command command;
    command.argv = {"nginx", "-t"};
    command.timeout = timeout_;
    return runner_.run(command).succeeded();
}

bool WebServer::reload()
{
    if (!validate()) {
        report_.error("nginx configuration test failed. Not reloading.");
        return false;
    }

    Command command;
    command.argv = {"nginx", "-s", "reload"};
    command.timeout = timeout_;

    CommandResult result = runner_.run(command);
    if (!result.succeeded()) {
        report_.error("nginx reload failed (" + result.describe() + ").");
        return false;
    }
    return true;
}

bool WebServer::installUpstream(const std::string& server)
{
    report_.info("Configuring php-fpm upstream...");

    const std::string path = upstreamPath();
    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        report_.error("Unable to write " + path + ".");
        return false;
    }

    file << "upstream php-fpm {\n"
         << "    server " << server << ";\n"
         << "}\n";
    file.close();

    if (!file) {
        report_.error("Unable to write " + path + ".");
        return false;
    }

    if (!reload()) {
        return false;
    }
    report_.ok("php-fpm upstream configured.");
    return true;
}

} // namespace Lempctl
