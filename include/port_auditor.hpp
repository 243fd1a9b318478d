#ifndef PORT_AUDITOR_HPP
#define PORT_AUDITOR_HPP

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Lempctl {

class CommandRunner;
class Report;

struct PortExpectation
{
    int port = 0;
    std::string protocol = "tcp";
    std::string socketFallback;   // checked only when the TCP port is not bound
};

enum class ListenerStatus
{
    Listening,        // bound on TCP
    SocketFallback,   // TCP absent, unix socket present
    Missing
};

struct PortAuditResult
{
    int port = 0;
    ListenerStatus status = ListenerStatus::Missing;
};

/**
 * @class PortAuditor
 * @brief Checks the host's listening-socket table against the ports the
 *        stack is expected to bind.
 */
class PortAuditor
{
public:
    PortAuditor(CommandRunner& runner, Report& report,
                std::chrono::seconds timeout = std::chrono::seconds(120));

    /**
     * @brief Audits every expectation independently.
     *
     * Plain expectations report "Port N is listening" or an error. An
     * expectation with a socketFallback that is not bound on TCP passes
     * if the fallback path exists and is a socket.
     */
    std::vector<PortAuditResult> audit(const std::vector<PortExpectation>& expectations);

    /**
     * @brief Reads the TCP listening ports via `ss -tlnH`.
     *
     * @return The bound ports, or std::nullopt if ss could not be run.
     */
    std::optional<std::set<int>> listeningTcpPorts();

    /**
     * @brief Extracts the ports from `ss -tlnH` output.
     *
     * The fourth column is "<addr>:<port>" ("0.0.0.0:80", "[::]:80",
     * "*:3306"); anything unparsable is skipped.
     */
    static std::set<int> parseListeningPorts(const std::string& ssOutput);

private:
    CommandRunner& runner_;
    Report& report_;
    std::chrono::seconds timeout_;
};

} // namespace Lempctl

#endif // PORT_AUDITOR_HPP
