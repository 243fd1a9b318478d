#include "firewall.hpp"
#include "command.hpp"
#include "report.hpp"

namespace Lempctl {

Firewall::Firewall(CommandRunner& runner, Report& report, std::chrono::seconds timeout)
    : runner_(runner)
    , report_(report)
    , timeout_(timeout)
{
}

FirewallState Firewall::configure()
{
    Command status;
    status.argv = {"ufw", "status"};
    status.timeout = timeout_;

    CommandResult result = requireOutput(runner_.run(status), "Status: active");

    switch (result.status) {
        case CommandStatus::NotFound:
            report_.info("No firewall detected. Either you are not using one or you need to configure it manually later...");
            report_.info("Please enable port: 80 (HTTP) and 443 (HTTPS)");
            return FirewallState::Absent;
        case CommandStatus::Succeeded:
            break;
        default:
            report_.info("Ufw is disabled..");
            return FirewallState::Inactive;
    }

    Command allow;
    allow.argv = {"ufw", "allow", "proto", "tcp", "from", "any", "to", "any", "port", "80,443"};
    allow.timeout = timeout_;

    CommandResult allowed = runner_.run(allow);
    if (!allowed.succeeded()) {
        report_.error("Failed to allow port 80, 443 in ufw (" + allowed.describe() + ").");
        return FirewallState::Failed;
    }

    report_.ok("Ufw enabled, port 80, 443 allowed");
    return FirewallState::Opened;
}

} // namespace Lempctl
