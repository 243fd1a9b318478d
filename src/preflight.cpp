#include "preflight.hpp"
#include "config.hpp"
#include "utils.hpp"

#include <fstream>
#include <sstream>
#include <unistd.h>

namespace Lempctl {
namespace Preflight {

bool isRoot()
{
    return geteuid() == 0;
}

bool isUbuntu(const std::string& osReleasePath)
{
    std::ifstream file(osReleasePath);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return containsIgnoreCase(buffer.str(), "ubuntu");
}

std::optional<std::string> check(const Config& config, bool requireRoot, const std::string& osReleasePath)
{
    if (requireRoot && !isRoot()) {
        return "Please run this as root.";
    }
    if (!isUbuntu(osReleasePath)) {
        return "OS not Ubuntu.";
    }
    if (!isValidPhpVersion(config.phpVersion)) {
        return "Invalid php version: " + config.phpVersion;
    }
    return std::nullopt;
}

} // namespace Preflight
} // namespace Lempctl
