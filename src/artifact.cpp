#include "artifact.hpp"
#include "report.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

#include <pwd.h>       // getpwnam
#include <unistd.h>    // chown

namespace fs = std::filesystem;

namespace Lempctl {

ArtifactSet::ArtifactSet(Report& report)
    : report_(report)
{
}

ArtifactSet::~ArtifactSet()
{
    if (pending_.empty()) {
        return;
    }
    try {
        removeAll();
    } catch (const std::exception& e) {
        // Reporting failed mid-way; still make sure nothing is left behind
        std::cerr << "Error reporting test file cleanup: " << e.what() << std::endl;
        for (const auto& path : pending_) {
            std::error_code ec;
            fs::remove(path, ec);
        }
    }
}

bool ArtifactSet::write(const TestArtifact& artifact)
{
    pending_.push_back(artifact.path);
    created_.push_back(artifact.path);

    std::ofstream file(artifact.path, std::ios::trunc);
    if (!file.is_open()) {
        report_.error("Unable to create test file " + artifact.path + ".");
        return false;
    }
    file << artifact.content;
    file.close();
    if (!file) {
        report_.error("Unable to write test file " + artifact.path + ".");
        return false;
    }

    applyOwner(artifact);
    return true;
}

void ArtifactSet::applyOwner(const TestArtifact& artifact)
{
    if (artifact.owner.empty()) {
        return;
    }

    struct passwd* pw = getpwnam(artifact.owner.c_str());
    if (!pw) {
        report_.warn("User " + artifact.owner + " not found. Leaving " + artifact.path + " owned by root.");
        return;
    }

    if (chown(artifact.path.c_str(), pw->pw_uid, pw->pw_gid) != 0) {
        report_.warn("Unable to chown " + artifact.path + " to " + artifact.owner + ": " + strerror(errno));
    }
}

bool ArtifactSet::removeAll()
{
    bool allRemoved = true;

    for (const auto& path : pending_) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            report_.error("Failed to remove test file " + path + ": " + ec.message());
            allRemoved = false;
        }
    }
    pending_.clear();
    return allRemoved;
}

} // namespace Lempctl
