#ifndef REPORT_HPP
#define REPORT_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace Lempctl {

class RunLog;

enum class Severity
{
    Info,
    Ok,
    Warning,
    Error
};

/**
 * @brief A single reported condition, in the order it was reported.
 */
struct ReportEvent
{
    Severity severity;
    std::string message;
};

/**
 * @class Report
 * @brief Accumulates the outcome of a run: every reported event plus the
 *        count of non-fatal errors.
 *
 * The pipeline owns one Report and hands it by reference to each step. Each
 * event is echoed to the console (colored) and to the RunLog, if one is
 * attached. The error count only grows; there is no way to reset it.
 */
class Report
{
public:
    /**
     * @param log     Optional run log that receives a copy of every event.
     * @param console Whether events are also written to standard error.
     */
    explicit Report(RunLog* log = nullptr, bool console = true);

    void info(const std::string& message);
    void ok(const std::string& message);

    /**
     * @brief Reports an advisory condition. Does not count as an error.
     */
    void warn(const std::string& message);

    /**
     * @brief Reports a non-fatal error and increments the error count.
     */
    void error(const std::string& message);

    std::size_t errorCount() const { return errorCount_; }
    bool clean() const { return errorCount_ == 0; }

    const std::vector<ReportEvent>& events() const { return events_; }

    /**
     * @brief Returns the messages of all events with the given severity.
     */
    std::vector<std::string> messages(Severity severity) const;

private:
    void record(Severity severity, const std::string& message);

    RunLog* log_;
    bool console_;
    std::size_t errorCount_ = 0;
    std::vector<ReportEvent> events_;
};

} // namespace Lempctl

#endif // REPORT_HPP
