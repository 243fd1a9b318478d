#ifndef FIREWALL_HPP
#define FIREWALL_HPP

#include <chrono>

namespace Lempctl {

class CommandRunner;
class Report;

enum class FirewallState
{
    Absent,     // ufw not installed
    Inactive,   // installed but disabled
    Opened,     // active, HTTP/HTTPS allowed
    Failed      // active, allow rule could not be added
};

/**
 * @class Firewall
 * @brief Opens HTTP and HTTPS in ufw when ufw is installed and enabled.
 */
class Firewall
{
public:
    Firewall(CommandRunner& runner, Report& report,
             std::chrono::seconds timeout = std::chrono::seconds(120));

    FirewallState configure();

private:
    CommandRunner& runner_;
    Report& report_;
    std::chrono::seconds timeout_;
};

} // namespace Lempctl

#endif // FIREWALL_HPP
