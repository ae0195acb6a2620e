#include "log/Logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

Logger::Logger() = default;

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

void Logger::Open(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (out_.is_open()) {
        out_.close();
    }
    filename_ = filename;
    if (!filename_.empty()) {
        out_.open(filename_, std::ios::app);
    }
}

bool Logger::DebugEnabled() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return out_.is_open();
}

void Logger::Debug(const std::string& msg) {
    Write("debug", msg);
}

void Logger::Warn(const std::string& msg) {
    std::cerr << "fzd: " << msg << "\n";
    Write("warn", msg);
}

void Logger::Error(const std::string& msg) {
    std::cerr << "fzd: ERROR: " << msg << "\n";
    Write("error", msg);
}

void Logger::Write(const char* level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!out_.is_open()) {
        return;
    }

    using clock = std::chrono::system_clock;
    const std::time_t t = clock::to_time_t(clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);

    // Preview and list callbacks run as separate processes; the pid tells them apart.
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "  [" << getpid() << "] " << level << "  " << msg;
    out_ << oss.str() << '\n';
    out_.flush();
}

Logger& Log() {
    static Logger logger;
    return logger;
}
