#pragma once

#include <cstdio>
#include <functional>
#include <string>
#include <string_view>

namespace sc {
namespace log {

enum class Level { Debug, Info, Warning, Error };

// One emitted line, before console/file decoration
struct Record {
    Level level = Level::Info;
    std::string module;
    std::string message;
};

// Receives every record that passes the level filter. Called under the log lock.
using Sink = std::function<void(const Record&)>;

void setLevel(Level level);
Level getLevel();
const char* levelLabel(Level level);

// Parse "debug" / "info" / "warning" / "error" (case-insensitive) or 0..3
bool parseLevel(std::string_view text, Level& out);

// Replace the console writer (stderr). An empty sink restores it.
void setSink(Sink sink);

// Append to a file in addition to the sink. False if the file cannot be opened.
bool setLogFile(const std::string& path);
void closeLogFile();

void write(Level level, std::string_view module, std::string_view message);

namespace detail {

template <typename... Args>
std::string format(const char* format, Args... args) {
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
#pragma GCC diagnostic ignored "-Wformat-security"
    int size = std::snprintf(nullptr, 0, format, args...);
    if (size <= 0) {
        return std::string(size == 0 ? "" : format);
    }
    std::string out(static_cast<std::size_t>(size) + 1, '\0');
    std::snprintf(&out[0], out.size(), format, args...);
#pragma GCC diagnostic pop
    out.pop_back();
    return out;
}

} // namespace detail

// printf-style logging; arguments are only formatted when the level is enabled
template <typename... Args> void debugf(const char* module, const char* format, Args... args) {
    if (getLevel() <= Level::Debug) {
        write(Level::Debug, module, detail::format(format, args...));
    }
}

template <typename... Args> void infof(const char* module, const char* format, Args... args) {
    if (getLevel() <= Level::Info) {
        write(Level::Info, module, detail::format(format, args...));
    }
}

template <typename... Args> void warningf(const char* module, const char* format, Args... args) {
    if (getLevel() <= Level::Warning) {
        write(Level::Warning, module, detail::format(format, args...));
    }
}

template <typename... Args> void errorf(const char* module, const char* format, Args... args) {
    write(Level::Error, module, detail::format(format, args...));
}

} // namespace log
} // namespace sc
