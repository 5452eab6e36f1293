#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace konduit {

// Append-only text log, one record per line. Shared by concurrent crawls.
class AuditLog {
public:
    // An empty logDir disables the log.
    explicit AuditLog(const std::string& logDir, const std::string& fileName = "robots_log.txt");
    ~AuditLog();

    void append(const std::string& tag, const std::string& subject);

    bool enabled() const { return !logPath_.empty(); }
    const std::string& path() const { return logPath_; }

private:
    std::string logPath_;
    std::ofstream stream_;
    std::mutex mutex_;

    void ensureOpen();
};

} // namespace konduit
