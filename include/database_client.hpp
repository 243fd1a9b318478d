#ifndef DATABASE_CLIENT_HPP
#define DATABASE_CLIENT_HPP

#include <chrono>
#include <string>

#include "command.hpp"

namespace Lempctl {

/**
 * @class DatabaseClient
 * @brief Runs SQL through the `mariadb` command-line client as the local
 *        administrative user.
 */
class DatabaseClient
{
public:
    explicit DatabaseClient(CommandRunner& runner,
                            std::chrono::seconds timeout = std::chrono::seconds(120));

    /**
     * @brief Executes a single statement with `mariadb -e`.
     */
    CommandResult query(const std::string& sql);

    /**
     * @brief Feeds a multi-statement script to `mariadb` on stdin.
     */
    CommandResult script(const std::string& sql);

private:
    CommandRunner& runner_;
    std::chrono::seconds timeout_;
};

} // namespace Lempctl

#endif // DATABASE_CLIENT_HPP
