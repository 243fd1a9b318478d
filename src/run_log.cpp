#include "run_log.hpp"
#include "utils.hpp"

#include <stdexcept>

namespace Lempctl {

RunLog::RunLog(const std::string& path)
    : path_(path)
    , out_(path, std::ios::trunc)
{
    if (!out_.is_open()) {
        throw std::runtime_error("Unable to open run log for writing: " + path);
    }

    out_ << "=== LEMP STACK INSTALL LOG ============\n";
    out_ << currentTimestamp() << "\n";
    out_.flush();
}

RunLog::~RunLog()
{
    if (!finished_) {
        finish();
    }
}

void RunLog::append(const std::string& level, const std::string& message)
{
    if (finished_) {
        return;
    }
    out_ << "[" << currentTimestamp() << "] [" << level << "] " << message << "\n";
    out_.flush();
}

void RunLog::finish()
{
    if (finished_) {
        return;
    }
    out_ << "=== FINISHED ==========================\n";
    out_.flush();
    finished_ = true;
}

} // namespace Lempctl
