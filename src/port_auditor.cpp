#include "port_auditor.hpp"
#include "command.hpp"
#include "report.hpp"

#include <filesystem>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace Lempctl {

PortAuditor::PortAuditor(CommandRunner& runner, Report& report, std::chrono::seconds timeout)
    : runner_(runner)
    , report_(report)
    , timeout_(timeout)
{
}

std::set<int> PortAuditor::parseListeningPorts(const std::string& ssOutput)
{
    std::set<int> ports;
    std::istringstream iss(ssOutput);
    std::string line;

    while (std::getline(iss, line)) {
        // State Recv-Q Send-Q Local:Port Peer:Port
        std::istringstream fields(line);
        std::string state, recvQ, sendQ, local;
        if (!(fields >> state >> recvQ >> sendQ >> local)) {
            continue;
        }

        size_t colon = local.rfind(':');
        if (colon == std::string::npos || colon + 1 >= local.size()) {
            continue;
        }

        try {
            size_t consumed = 0;
            int port = std::stoi(local.substr(colon + 1), &consumed);
            if (consumed == local.size() - colon - 1) {
                ports.insert(port);
            }
        } catch (const std::exception&) {
            // "*:*" and similar carry no port
        }
    }
    return ports;
}

std::optional<std::set<int>> PortAuditor::listeningTcpPorts()
{
    Command command;
    command.argv = {"ss", "-tlnH"};
    command.timeout = timeout_;

    CommandResult result = runner_.run(command);
    if (!result.succeeded()) {
        report_.warn("Unable to read listening sockets with ss (" + result.describe() + ").");
        return std::nullopt;
    }
    return parseListeningPorts(result.output);
}

std::vector<PortAuditResult> PortAuditor::audit(const std::vector<PortExpectation>& expectations)
{
    report_.info("Checking ports...");

    std::set<int> listening;
    if (auto ports = listeningTcpPorts()) {
        listening = *ports;
    }

    std::vector<PortAuditResult> results;
    for (const auto& expectation : expectations) {
        PortAuditResult result;
        result.port = expectation.port;
        const std::string port = std::to_string(expectation.port);

        if (listening.count(expectation.port) > 0) {
            result.status = ListenerStatus::Listening;
            report_.ok("Port " + port + " is listening.");
        } else if (expectation.socketFallback.empty()) {
            report_.error("Port " + port + " is not listening.");
        } else {
            report_.info("Port " + port + " is not bound. Checking for unix socket "
                         + expectation.socketFallback + "...");
            std::error_code ec;
            if (fs::is_socket(expectation.socketFallback, ec)) {
                result.status = ListenerStatus::SocketFallback;
                report_.ok("Unix socket " + expectation.socketFallback + " is present.");
            } else {
                report_.error("Neither port " + port + " nor " + expectation.socketFallback
                              + " is available. Check configuration manually.");
            }
        }
        results.push_back(result);
    }
    return results;
}

} // namespace Lempctl
