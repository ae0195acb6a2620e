#ifndef LOG_LOGGER_HPP
#define LOG_LOGGER_HPP

#include <fstream>
#include <mutex>
#include <string>

// Appends timestamped lines to a debug log file. Warnings and errors are
// also echoed to stderr; stdout is reserved for the chosen directory.
class Logger {
public:
    Logger();
    ~Logger();

    // Enables the debug file sink. An empty path disables it.
    void Open(const std::string& filename);

    void Debug(const std::string& msg);
    void Warn(const std::string& msg);
    void Error(const std::string& msg);

    bool DebugEnabled() const;

private:
    void Write(const char* level, const std::string& msg);

    std::string filename_;
    std::ofstream out_;
    mutable std::mutex mtx_;
};

// Process-wide logger.
Logger& Log();

#endif // LOG_LOGGER_HPP
