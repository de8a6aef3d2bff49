#include "log.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

#include "string_utils.h"

namespace sc {
namespace log {

namespace {

const char* const RESET = "\033[0m";

std::atomic<Level> g_minLevel{Level::Info};
std::mutex g_logMutex;
std::ofstream g_logFile;
Sink g_sink;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif

    std::ostringstream ss;
    ss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
       << ms.count();
    return ss.str();
}

const char* levelColor(Level level) {
    switch (level) {
    case Level::Debug:
        return "\033[36m";
    case Level::Info:
        return "\033[32m";
    case Level::Warning:
        return "\033[33m";
    case Level::Error:
        return "\033[31m";
    }
    return RESET;
}

// Plan output goes to stdout; log lines are only coloured when stderr is a terminal
bool stderrIsTerminal() {
#ifdef _WIN32
    static const bool terminal = _isatty(_fileno(stderr)) != 0;
#else
    static const bool terminal = isatty(fileno(stderr)) != 0;
#endif
    return terminal;
}

void writeConsole(const Record& record, const std::string& stamp) {
    if (stderrIsTerminal()) {
        std::cerr << levelColor(record.level) << "[" << stamp << "] [" << levelLabel(record.level)
                  << "] " << RESET;
    } else {
        std::cerr << "[" << stamp << "] [" << levelLabel(record.level) << "] ";
    }
    std::cerr << "[" << record.module << "] " << record.message << std::endl;
}

} // namespace

void setLevel(Level level) {
    g_minLevel.store(level);
}

Level getLevel() {
    return g_minLevel.load();
}

const char* levelLabel(Level level) {
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO ";
    case Level::Warning:
        return "WARN ";
    case Level::Error:
        return "ERROR";
    }
    return "?????";
}

bool parseLevel(std::string_view text, Level& out) {
    std::string value = str::toLower(str::trim(text));
    if (value == "debug" || value == "0") {
        out = Level::Debug;
    } else if (value == "info" || value == "1") {
        out = Level::Info;
    } else if (value == "warning" || value == "warn" || value == "2") {
        out = Level::Warning;
    } else if (value == "error" || value == "3") {
        out = Level::Error;
    } else {
        return false;
    }
    return true;
}

void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sink = std::move(sink);
}

bool setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile.close();
    }
    g_logFile.open(path, std::ios::app);
    return g_logFile.is_open();
}

void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile.close();
    }
}

void write(Level level, std::string_view module, std::string_view message) {
    if (level < g_minLevel.load()) {
        return;
    }

    Record record{level, std::string(module), std::string(message)};
    std::string stamp = timestamp();

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_sink) {
        g_sink(record);
    } else {
        writeConsole(record, stamp);
    }
    if (g_logFile.is_open()) {
        g_logFile << "[" << stamp << "] [" << levelLabel(level) << "] [" << record.module << "] "
                  << record.message << std::endl;
    }
}

} // namespace log
} // namespace sc
