#ifndef SERVICE_RECONCILER_HPP
#define SERVICE_RECONCILER_HPP

#include <chrono>
#include <string>
#include <vector>

namespace Lempctl {

class CommandRunner;
class Report;

/**
 * @brief Per-service lifecycle.
 *
 * Unknown -> Checked -> (Active | Inactive); an Inactive service moves to
 * Starting and then ends as Active or Failed.
 */
enum class ServiceState
{
    Unknown,
    Checked,
    Active,
    Inactive,
    Starting,
    Failed
};

const char* toString(ServiceState state);

struct ServiceSpec
{
    std::string name;
    ServiceState state = ServiceState::Unknown;
    bool startIssued = false;   // whether enable+start was sent
};

/**
 * @class ServiceReconciler
 * @brief Makes sure every listed systemd service ends up active, starting
 *        only the ones that are not already running.
 */
class ServiceReconciler
{
public:
    ServiceReconciler(CommandRunner& runner, Report& report,
                      std::chrono::seconds timeout = std::chrono::seconds(120));

    /**
     * @brief Reconciles the services in order.
     *
     * @param services Service unit names, e.g. {"nginx", "mariadb", "php8.1-fpm"}.
     * @return The final state of each service, in the same order.
     */
    std::vector<ServiceSpec> reconcile(const std::vector<std::string>& services);

    /**
     * @brief Asks systemd whether the unit is currently active.
     */
    bool isActive(const std::string& service);

private:
    void reconcileOne(ServiceSpec& spec);

    CommandRunner& runner_;
    Report& report_;
    std::chrono::seconds timeout_;
};

} // namespace Lempctl

#endif // SERVICE_RECONCILER_HPP
