#include "report.hpp"
#include "run_log.hpp"
#include "utils.hpp"

namespace Lempctl {

namespace {

    const char* levelName(Severity severity)
    {
        switch (severity) {
            case Severity::Info:    return "INFO";
            case Severity::Ok:      return "OK";
            case Severity::Warning: return "WARN";
            case Severity::Error:   return "ERROR";
        }
        return "INFO";
    }

} // namespace

Report::Report(RunLog* log, bool console)
    : log_(log)
    , console_(console)
{
}

void Report::info(const std::string& message)
{
    if (console_) {
        log_message(message);
    }
    record(Severity::Info, message);
}

void Report::ok(const std::string& message)
{
    if (console_) {
        log_ok(message);
    }
    record(Severity::Ok, message);
}

void Report::warn(const std::string& message)
{
    if (console_) {
        log_warning(message);
    }
    record(Severity::Warning, message);
}

void Report::error(const std::string& message)
{
    if (console_) {
        log_error(message);
    }
    ++errorCount_;
    record(Severity::Error, message);
}

std::vector<std::string> Report::messages(Severity severity) const
{
    std::vector<std::string> out;
    for (const auto& event : events_) {
        if (event.severity == severity) {
            out.push_back(event.message);
        }
    }
    return out;
}

void Report::record(Severity severity, const std::string& message)
{
    events_.push_back({severity, message});
    if (log_) {
        log_->append(levelName(severity), message);
    }
}

} // namespace Lempctl
