#include <knit/log.hpp>
#include <cctype>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace knit::log {

const char* level_name(Level lvl) {
    switch (lvl) {
        case Debug:   return "debug";
        case Verbose: return "verbose";
        case Info:    return "info";
        case Warn:    return "warn";
        case Error:   return "error";
    }
    return "unknown";
}

Result<Level> parse_level(const std::string& name) {
    std::string s;
    for (char c : name) {
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (s == "debug")   return Result<Level>::ok(Debug);
    if (s == "verbose") return Result<Level>::ok(Verbose);
    if (s == "info")    return Result<Level>::ok(Info);
    if (s == "warn" || s == "warning") return Result<Level>::ok(Warn);
    if (s == "error")   return Result<Level>::ok(Error);

    return KnitError{KnitError::Config,
        "unknown log level: '" + name + "'",
        "expected one of: debug, verbose, info, warn, error"};
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Debug:   return "\033[90m";   // gray
        case Verbose: return "\033[36m";   // cyan
        case Info:    return "\033[32m";   // green
        case Warn:    return "\033[33m";   // yellow
        case Error:   return "\033[31m";   // red
    }
    return "";
}

static const char* reset_color() {
    return "\033[0m";
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------

void Logger::vlog(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;

    va_list probe;
    va_copy(probe, args);
    int len = std::vsnprintf(nullptr, 0, fmt, probe);
    va_end(probe);
    if (len < 0) return;

    std::vector<char> buf(static_cast<size_t>(len) + 1);
    std::vsnprintf(buf.data(), buf.size(), fmt, args);
    write(lvl, std::string(buf.data(), static_cast<size_t>(len)));
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Debug, fmt, args);
    va_end(args);
}

void Logger::verbose(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Verbose, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Info, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Warn, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(Error, fmt, args);
    va_end(args);
}

Logger& null_logger() {
    static NullLogger instance;
    return instance;
}

// ---------------------------------------------------------------------------
// ConsoleLogger
// ---------------------------------------------------------------------------

ConsoleLogger::ConsoleLogger(Level min_level, std::FILE* out)
    : level_(min_level), out_(out), color_(isatty(fileno(out)) != 0) {}

void ConsoleLogger::set_color_enabled(bool enabled) {
    color_ = enabled;
}

bool ConsoleLogger::is_color_enabled() const {
    return color_;
}

void ConsoleLogger::write(Level lvl, const std::string& message) {
    if (color_) {
        std::fprintf(out_, "%s%s%s: ", level_color(lvl), level_name(lvl), reset_color());
    } else {
        std::fprintf(out_, "%s: ", level_name(lvl));
    }
    std::fprintf(out_, "%s\n", message.c_str());
    std::fflush(out_);
}

} // namespace knit::log
