/**
 * @file Logger.h
 * @brief Minimal thread-safe logger writing to ./<command>.log and an optional in-process sink.
 */
#pragma once

#include <exception>
#include <functional>
#include <string>

class Logger {
public:
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, None = 4 };

    /** Receives every emitted line (already level-filtered, without timestamp). */
    using Sink = std::function<void(Level, const std::string&)>;

    // Initialize using argv[0] to derive <command>.log path.
    static void initFromArgv0(const char* argv0);
    // Initialize explicitly with a filename (relative or absolute). Returns false if the file cannot be opened.
    static bool init(const std::string& filename);
    // Flush and close the log file; safe to call multiple times.
    static void shutdown();

    // Install (or with an empty function, remove) the in-process sink.
    static void setSink(Sink sink);

    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void debug(const std::string& msg);

    // Convenience helpers for exception logging
    static void logException(const std::string& where, const std::exception& e);
    static void logUnknownException(const std::string& where);

    // Control log level (default: Info).
    static void setLevel(Level lvl);
    static Level level();
    // Parse debug|info|warn|warning|error|none|off (case-insensitive) into @p out.
    static bool parseLevel(const std::string& text, Level& out);
    static const char* levelName(Level lvl);

private:
    static void logImpl(Level lvl, const std::string& msg);
};
