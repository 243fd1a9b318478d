#ifndef SECURITY_HARDENER_HPP
#define SECURITY_HARDENER_HPP

#include <string>
#include <vector>

namespace Lempctl {

class DatabaseClient;
class Report;

/**
 * @brief One corrective step of the post-install database hardening.
 *
 * Statements inside a step are chained: each runs only if the previous one
 * succeeded. A failed step whose fatalIfFailed flag is set leaves the
 * database not secured, but later steps are still attempted.
 */
struct HardeningStep
{
    std::string description;
    std::vector<std::string> statements;
    bool fatalIfFailed = true;
};

struct HardeningOutcome
{
    std::string description;
    bool skipped = false;
    bool succeeded = false;
};

struct HardeningResult
{
    std::vector<HardeningOutcome> outcomes;   // one per step, in chain order
    std::string rootPassword;                 // empty when rotation was skipped
    bool secured = true;                      // false if any fatalIfFailed step failed
};

/**
 * @class SecurityHardener
 * @brief Applies the equivalent of mysql_secure_installation to a fresh
 *        MariaDB: rotates the root password (unless root authenticates via
 *        unix socket), drops anonymous accounts, restricts root to local
 *        hosts and removes the sample "test" database.
 */
class SecurityHardener
{
public:
    SecurityHardener(DatabaseClient& db, Report& report);

    /**
     * @brief Runs the whole chain. Every step is attempted; each failure is
     *        reported once as a non-fatal error.
     */
    HardeningResult harden();

    /**
     * @brief True if root's auth plugin is a socket-based (local-only) one.
     *
     * A failed plugin query is treated as "not socket", so rotation is
     * still attempted.
     */
    bool rootUsesSocketAuth();

    /**
     * @brief Builds the ordered chain.
     *
     * @param rootPassword   New root password; ignored when rotateRoot is false.
     * @param rotateRoot     Whether the credential-rotation step is included.
     */
    static std::vector<HardeningStep> buildChain(const std::string& rootPassword, bool rotateRoot);

private:
    bool runStep(const HardeningStep& step);

    DatabaseClient& db_;
    Report& report_;
};

} // namespace Lempctl

#endif // SECURITY_HARDENER_HPP
