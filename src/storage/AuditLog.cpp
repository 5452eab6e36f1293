#include "konduit/AuditLog.hpp"

#include <filesystem>
#include <iostream>

namespace konduit {

AuditLog::AuditLog(const std::string& logDir, const std::string& fileName) {
    if (logDir.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(logDir, ec);
    if (ec) {
        std::cerr << "AuditLog: failed to create " << logDir << ": " << ec.message() << "\n";
    }
    logPath_ = (std::filesystem::path(logDir) / fileName).string();
}

AuditLog::~AuditLog() {
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }
}

void AuditLog::ensureOpen() {
    if (!stream_.is_open()) {
        stream_.open(logPath_, std::ios::app);
        if (!stream_) {
            std::cerr << "AuditLog: failed to open " << logPath_ << "\n";
        }
    }
}

void AuditLog::append(const std::string& tag, const std::string& subject) {
    if (logPath_.empty()) return;
    std::lock_guard<std::mutex> lk(mutex_);
    ensureOpen();
    if (!stream_) return;
    stream_ << "[" << tag << "] " << subject << "\n";
    stream_.flush();
}

} // namespace konduit
