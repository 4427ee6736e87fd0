#include "logger.hpp"
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <utility>

namespace logging {

Logger::Logger(LogOptions options, std::ostream& out, std::ostream& err)
    : options_(std::move(options)), out_(out), err_(err) {}

void Logger::info(const std::string& message, const char* file, int line) {
    if (options_.info) {
        write(out_, "info", message, file, line);
    }
}

void Logger::error(const std::string& message, const char* file, int line) {
    if (options_.error) {
        write(err_, "error", message, file, line);
    }
}

void Logger::debug(const std::string& message, const char* file, int line) {
    if (options_.debug) {
        write(out_, "debug", message, file, line);
    }
}

void Logger::verbose(const std::string& message, const char* file, int line) {
    if (options_.verbose) {
        write(out_, "verbose", message, file, line);
    }
}

void Logger::write(std::ostream& stream, const char* level, const std::string& message, const char* file, int line) {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    // Basename only
    const char* slash = std::strrchr(file, '/');
    const char* name = slash ? slash + 1 : file;

    std::lock_guard<std::mutex> lock(mutex_);
    stream << options_.prefix << ": " << std::put_time(&local, "%Y/%m/%d %H:%M:%S") << " "
           << level << " " << name << " " << line << ": " << message << "\n" << std::flush;
}

} // namespace logging
