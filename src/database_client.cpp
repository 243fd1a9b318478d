#include "database_client.hpp"

namespace Lempctl {

DatabaseClient::DatabaseClient(CommandRunner& runner, std::chrono::seconds timeout)
    : runner_(runner)
    , timeout_(timeout)
{
}

CommandResult DatabaseClient::query(const std::string& sql)
{
    Command command;
    command.argv = {"mariadb", "-e", sql};
    command.timeout = timeout_;
    return runner_.run(command);
}

CommandResult DatabaseClient::script(const std::string& sql)
{
    Command command;
    command.argv = {"mariadb"};
    command.input = sql;
    command.timeout = timeout_;
    return runner_.run(command);
}

} // namespace Lempctl
