#pragma once

#include <iostream>
#include <mutex>
#include <string>

namespace logging {

struct LogOptions {
    std::string prefix = "syncbox";
    bool info = true;
    bool error = true;
    bool debug = true;
    bool verbose = false;
};

// Levels are independent of each other. info/debug/verbose go to out,
// error goes to err. Each entry names the calling file and line; the
// defaulted arguments pick up the call site.
class Logger {
public:
    explicit Logger(LogOptions options = {}, std::ostream& out = std::cout, std::ostream& err = std::cerr);

    void info(const std::string& message, const char* file = __builtin_FILE(), int line = __builtin_LINE());
    void error(const std::string& message, const char* file = __builtin_FILE(), int line = __builtin_LINE());
    void debug(const std::string& message, const char* file = __builtin_FILE(), int line = __builtin_LINE());
    void verbose(const std::string& message, const char* file = __builtin_FILE(), int line = __builtin_LINE());

    const LogOptions& options() const { return options_; }

private:
    void write(std::ostream& stream, const char* level, const std::string& message, const char* file, int line);

    LogOptions options_;
    std::ostream& out_;
    std::ostream& err_;
    std::mutex mutex_;
};

} // namespace logging
