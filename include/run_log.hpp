#ifndef RUN_LOG_HPP
#define RUN_LOG_HPP

#include <fstream>
#include <string>

namespace Lempctl {

/**
 * @class RunLog
 * @brief Append-only log file for a single provisioning run.
 *
 * Opening the log truncates any previous run and writes the header block.
 * Each appended line carries its own timestamp; finish() writes the
 * terminal marker. Lines are flushed as they are written so the file is
 * useful even if the process is killed mid-run.
 */
class RunLog
{
public:
    /**
     * @brief Opens (and truncates) the log file and writes the header.
     *
     * @param path Path of the log file, usually "lemp_install.log".
     * @throws std::runtime_error if the file cannot be opened for writing.
     */
    explicit RunLog(const std::string& path);
    ~RunLog();

    RunLog(const RunLog&) = delete;
    RunLog& operator=(const RunLog&) = delete;

    /**
     * @brief Appends one timestamped line.
     *
     * @param level   Severity label, e.g. "INFO" or "ERROR".
     * @param message The message text, without color codes.
     */
    void append(const std::string& level, const std::string& message);

    /**
     * @brief Writes the terminal marker line. Further appends are ignored.
     */
    void finish();

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream out_;
    bool finished_ = false;
};

} // namespace Lempctl

#endif // RUN_LOG_HPP
