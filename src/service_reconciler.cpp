#include "service_reconciler.hpp"
#include "command.hpp"
#include "report.hpp"
#include "utils.hpp"

#include <sstream>

namespace Lempctl {

const char* toString(ServiceState state)
{
    switch (state) {
        case ServiceState::Unknown:  return "unknown";
        case ServiceState::Checked:  return "checked";
        case ServiceState::Active:   return "active";
        case ServiceState::Inactive: return "inactive";
        case ServiceState::Starting: return "starting";
        case ServiceState::Failed:   return "failed";
    }
    return "unknown";
}

ServiceReconciler::ServiceReconciler(CommandRunner& runner, Report& report, std::chrono::seconds timeout)
    : runner_(runner)
    , report_(report)
    , timeout_(timeout)
{
}

bool ServiceReconciler::isActive(const std::string& service)
{
    Command command;
    command.argv = {"systemctl", "is-active", service};
    command.timeout = timeout_;

    CommandResult result = runner_.run(command);
    if (!result.succeeded()) {
        return false;
    }

    // "active" must be the whole first line; "activating" does not count
    std::istringstream iss(result.output);
    std::string firstLine;
    std::getline(iss, firstLine);
    return trim(firstLine) == "active";
}

void ServiceReconciler::reconcileOne(ServiceSpec& spec)
{
    bool active = isActive(spec.name);
    spec.state = ServiceState::Checked;

    if (active) {
        spec.state = ServiceState::Active;
        return;
    }
    spec.state = ServiceState::Inactive;

    report_.info("Service " + spec.name + " is not started yet. Starting...");
    spec.state = ServiceState::Starting;
    spec.startIssued = true;

    Command command;
    command.argv = {"systemctl", "enable", "--now", spec.name};
    command.timeout = timeout_;

    CommandResult result = runner_.run(command);
    if (!result.succeeded()) {
        report_.warn("systemctl enable --now " + spec.name + " " + result.describe() + ".");
    }

    // The re-check is the source of truth, whatever systemctl returned
    if (isActive(spec.name)) {
        spec.state = ServiceState::Active;
        report_.ok("Service " + spec.name + " started.");
    } else {
        spec.state = ServiceState::Failed;
        report_.error("Please investigate " + spec.name + " service manually.");
    }
}

std::vector<ServiceSpec> ServiceReconciler::reconcile(const std::vector<std::string>& services)
{
    report_.info("Verifying services...");

    std::vector<ServiceSpec> specs;
    specs.reserve(services.size());

    for (const auto& name : services) {
        ServiceSpec spec;
        spec.name = name;
        reconcileOne(spec);
        specs.push_back(spec);
    }
    return specs;
}

} // namespace Lempctl
