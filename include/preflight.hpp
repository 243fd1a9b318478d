#ifndef PREFLIGHT_HPP
#define PREFLIGHT_HPP

#include <optional>
#include <string>

namespace Lempctl {

class Config;

/**
 * @brief Fatal conditions checked before anything on the host is touched.
 */
namespace Preflight {

/**
 * @brief True if the effective user is root.
 */
bool isRoot();

/**
 * @brief True if the os-release file identifies the host as Ubuntu.
 */
bool isUbuntu(const std::string& osReleasePath = "/etc/os-release");

/**
 * @brief Runs every preflight check in order: privilege, platform, input.
 *
 * @param config        Effective settings (the runtime version is validated).
 * @param requireRoot   Whether to enforce root; false only in tests.
 * @param osReleasePath File inspected for the platform check.
 * @return The first failure message, or std::nullopt if the run may proceed.
 */
std::optional<std::string> check(const Config& config,
                                 bool requireRoot = true,
                                 const std::string& osReleasePath = "/etc/os-release");

} // namespace Preflight
} // namespace Lempctl

#endif // PREFLIGHT_HPP
