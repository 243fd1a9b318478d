#ifndef PACKAGE_RESOLVER_HPP
#define PACKAGE_RESOLVER_HPP

#include <chrono>
#include <string>
#include <vector>

namespace Lempctl {

class CommandRunner;
class Report;

/**
 * @brief A requested optional module after its repository lookup.
 */
struct PackageCandidate
{
    std::string name;
    bool validated = false;
};

/**
 * @brief The result of resolving a runtime version plus module list.
 */
struct PackageSet
{
    std::vector<std::string> packages;          // final install set, in order
    std::vector<std::string> invalidModules;    // versioned names not in the repo
    std::vector<PackageCandidate> candidates;   // every requested module, in order
};

/**
 * @class PackageResolver
 * @brief Builds the install set for the stack, validating optional runtime
 *        modules against the live package repository.
 */
class PackageResolver
{
public:
    PackageResolver(CommandRunner& runner, Report& report,
                    std::chrono::seconds timeout = std::chrono::seconds(120));

    /**
     * @brief Resolves the packages to install.
     *
     * Base runtime packages are php<ver>{,-fpm,-common,-cli,-mysql}. Each
     * module is looked up as php<ver>-<module>; only modules the repository
     * knows about are added. nginx, mariadb-server and mariadb-common are
     * always appended.
     *
     * @param phpVersion Runtime version, e.g. "8.1".
     * @param moduleList Comma-separated module names, e.g. "curl,gd".
     */
    PackageSet resolve(const std::string& phpVersion, const std::string& moduleList);

    /**
     * @brief Queries the repository for an exact package name.
     *
     * @return True only if the query ran successfully and returned a line
     *         whose first word equals packageName.
     */
    bool packageExists(const std::string& packageName);

    /**
     * @brief The mandatory runtime packages for a version.
     */
    static std::vector<std::string> basePackages(const std::string& phpVersion);

private:
    CommandRunner& runner_;
    Report& report_;
    std::chrono::seconds timeout_;
};

} // namespace Lempctl

#endif // PACKAGE_RESOLVER_HPP
