#ifndef ARTIFACT_HPP
#define ARTIFACT_HPP

#include <string>
#include <vector>

namespace Lempctl {

class Report;

/**
 * @brief A file created only to exercise a code path.
 */
struct TestArtifact
{
    std::string path;
    std::string content;
    std::string owner;      // user (and group) to chown to; empty keeps the creator
    bool ephemeral = true;
};

/**
 * @class ArtifactSet
 * @brief Owns the ephemeral files of one smoke test.
 *
 * Every file written through the set is deleted by removeAll() or, at the
 * latest, by the destructor, whether the test passed, failed or threw.
 */
class ArtifactSet
{
public:
    explicit ArtifactSet(Report& report);
    ~ArtifactSet();

    ArtifactSet(const ArtifactSet&) = delete;
    ArtifactSet& operator=(const ArtifactSet&) = delete;

    /**
     * @brief Writes the artifact and takes ownership of it.
     *
     * The path is tracked before the first byte is written, so a partial
     * write is still cleaned up.
     *
     * @return False (after reporting an error) if the file could not be written.
     */
    bool write(const TestArtifact& artifact);

    /**
     * @brief Deletes every tracked file. Safe to call more than once.
     *
     * @return False if any file could not be removed.
     */
    bool removeAll();

    /**
     * @brief Every path this set has ever created, in creation order.
     */
    const std::vector<std::string>& created() const { return created_; }

    bool empty() const { return pending_.empty(); }

private:
    void applyOwner(const TestArtifact& artifact);

    Report& report_;
    std::vector<std::string> pending_;
    std::vector<std::string> created_;
};

} // namespace Lempctl

#endif // ARTIFACT_HPP
