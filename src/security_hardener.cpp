#include "security_hardener.hpp"
#include "database_client.hpp"
#include "report.hpp"
#include "utils.hpp"

namespace Lempctl {

namespace {

    const char* const kRotateDescription = "Changing mariadb root password";

} // namespace

SecurityHardener::SecurityHardener(DatabaseClient& db, Report& report)
    : db_(db)
    , report_(report)
{
}

std::vector<HardeningStep> SecurityHardener::buildChain(const std::string& rootPassword, bool rotateRoot)
{
    std::vector<HardeningStep> chain;

    if (rotateRoot) {
        chain.push_back({
            kRotateDescription,
            {
                "UPDATE mysql.user SET Password=PASSWORD('" + rootPassword + "') WHERE User='root'",
                "FLUSH PRIVILEGES"
            },
            true
        });
    }

    chain.push_back({
        "Deleting anonymous users",
        {"DELETE FROM mysql.user WHERE User=''"},
        true
    });

    chain.push_back({
        "Restricting root login to allow local only",
        {"DELETE FROM mysql.user WHERE User='root' AND Host NOT IN ('localhost', '127.0.0.1', '::1')"},
        true
    });

    chain.push_back({
        "Removing test database",
        {
            "DROP DATABASE IF EXISTS test",
            "DELETE FROM mysql.db WHERE Db='test' OR Db='test\\_%'"
        },
        true
    });

    chain.push_back({
        "Reloading privilege tables",
        {"FLUSH PRIVILEGES"},
        false
    });

    return chain;
}

bool SecurityHardener::rootUsesSocketAuth()
{
    CommandResult result = db_.query("SELECT plugin FROM mysql.user WHERE User='root'");
    if (!result.succeeded()) {
        report_.warn("Could not read root auth plugin (" + result.describe() + ").");
        return false;
    }
    // unix_socket on MariaDB, auth_socket on MySQL
    return containsIgnoreCase(result.output, "socket");
}

bool SecurityHardener::runStep(const HardeningStep& step)
{
    for (const auto& statement : step.statements) {
        CommandResult result = db_.query(statement);
        if (!result.succeeded()) {
            report_.error(step.description + " failed (" + result.describe() + ").");
            report_.info("Please secure mariadb installation manually.");
            return false;
        }
    }
    return true;
}

HardeningResult SecurityHardener::harden()
{
    report_.info("Securing mariadb installation...");

    HardeningResult result;

    bool rotateRoot = !rootUsesSocketAuth();
    if (rotateRoot) {
        result.rootPassword = generatePassword(12);
    } else {
        report_.info("Root uses socket authentication. Not changing its password.");
        result.outcomes.push_back({kRotateDescription, true, false});
    }

    for (const auto& step : buildChain(result.rootPassword, rotateRoot)) {
        if (step.description == kRotateDescription) {
            // Kept in cleartext on purpose: the run log is where the operator finds it
            report_.info("Changing mariadb root password to: " + result.rootPassword);
        } else {
            report_.info(step.description + ".");
        }

        HardeningOutcome outcome{step.description, false, runStep(step)};
        if (!outcome.succeeded && step.fatalIfFailed) {
            result.secured = false;
        }
        result.outcomes.push_back(outcome);
    }

    if (result.secured) {
        report_.ok("Done securing mariadb installation.");
    } else {
        report_.warn("Mariadb installation is only partially secured.");
    }
    return result;
}

} // namespace Lempctl
