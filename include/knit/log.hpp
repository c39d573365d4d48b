#pragma once

#include <knit/result.hpp>
#include <cstdarg>
#include <cstdio>
#include <string>

namespace knit::log {

enum Level { Debug, Verbose, Info, Warn, Error };

// Returns the name string for a level
const char* level_name(Level lvl);

// Accepts "debug", "verbose", "info", "warn"/"warning", "error"
Result<Level> parse_level(const std::string& name);

// Diagnostic sink handed to every component that reports progress.
// Messages use printf-style formatting.
class Logger {
public:
    virtual ~Logger() = default;

    void debug(const char* fmt, ...);
    void verbose(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

    virtual bool enabled(Level lvl) const = 0;

protected:
    virtual void write(Level lvl, const std::string& message) = 0;

private:
    void vlog(Level lvl, const char* fmt, va_list args);
};

// Discards everything. This is what components use when no sink is given.
class NullLogger : public Logger {
public:
    bool enabled(Level) const override { return false; }

protected:
    void write(Level, const std::string&) override {}
};

// Shared stateless NullLogger instance
Logger& null_logger();

// Writes "level: message" lines to a stdio stream (stderr by default),
// coloured when the stream is a terminal.
class ConsoleLogger : public Logger {
public:
    explicit ConsoleLogger(Level min_level = Info, std::FILE* out = stderr);

    void set_level(Level lvl) { level_ = lvl; }
    Level level() const { return level_; }

    void set_color_enabled(bool enabled);
    bool is_color_enabled() const;

    bool enabled(Level lvl) const override { return lvl >= level_; }

protected:
    void write(Level lvl, const std::string& message) override;

private:
    Level level_;
    std::FILE* out_;
    bool color_;
};

} // namespace knit::log
