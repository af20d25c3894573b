/**
 * @file Logger.h
 * @brief Minimal thread-safe file logger shared by the ledger core and the pixelwar tools.
 *
 * Nothing is written until init() or initFromArgv0() opens a file, so the core library can
 * log unconditionally and stay silent in unit tests.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <exception>
#include <string>

class Logger {
public:
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, None = 4 };

    // Initialize using argv[0] to derive ./<command>.log
    static void initFromArgv0(const char* argv0);
    // Initialize explicitly with a filename (relative or absolute).
    static void init(const std::string& filename);
    // Flush and close the log file; safe to call multiple times.
    static void shutdown();
    // Whether a log file is currently open.
    static bool isOpen();

    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void debug(const std::string& msg);

    // Convenience helpers for exception logging
    static void logException(const std::string& where, const std::exception& e);
    static void logUnknownException(const std::string& where);

    // Control log level (default: Info). Also honors LOG_LEVEL env (debug, info, warn, error, none)
    static void setLevel(Level lvl);
    static Level level();

    /** @brief Parse a level name (case-insensitive; "warning" and "off" accepted). Returns false if unknown. */
    static bool parseLevel(const std::string& text, Level& out);
    /** @brief Upper-case tag written in front of each line for @p lvl. */
    static const char* levelName(Level lvl);

private:
    static void logImpl(Level lvl, const std::string& msg);
};
