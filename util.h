/*
 * Copyright (C) 2025 James C. Owens
 * Portions Copyright (c) 2019 The Bitcoin Core developers
 * Portions Copyright (c) 2025 The Gridcoin developers
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef UTIL_H
#define UTIL_H

#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <tinyformat.h>
#include <variant>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

//!
//! \brief Log verbosity levels, in increasing order of severity. A message is emitted when its level is at or above
//! g_log_level.
//!
enum class LogLevel : int {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

extern std::atomic<LogLevel> g_log_level;
extern std::atomic<bool> g_log_timestamps;

//!
//! /brief Locale-independent version of std::to_string
//!
template <typename T>
std::string ToString(const T& t)
{
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << t;
    return oss.str();
}

//!
//! \brief Utility function to split string by the provided delimiter. Note that no trimming is done to remove white space.
//! \param s: the string to split
//! \param delim: the delimiter string
//! \return std::vector of string parts
//!
[[nodiscard]] std::vector<std::string> StringSplit(const std::string& s, const std::string& delim);

//!
//! \brief Utility function to trim whitespace from the beginning and end of a string.
//! \param str: the string to trim
//! \param pattern: the pattern to trim, defaulting to " \f\n\r\t\v"
//! \return trimmed string
//!
[[nodiscard]] std::string TrimString(const std::string& str, const std::string& pattern = " \f\n\r\t\v");

//!
//! \brief Utility function to remove enclosing single or double quotes from a string. This is especially useful when
//! dealing with quoted values in a config file.
//! \param str: the input string with potential quotes to remove
//! \return the string with any enclosing quotes removed
//!
[[nodiscard]] std::string StripQuotes(const std::string& str);

/**
 * Returns the lowercase equivalent of the given string.
 * This function is locale independent. It only converts uppercase
 * characters in the standard 7-bit ASCII range.
 * This is a feature, not a limitation.
 *
 * @param[in] str   the string to convert to lowercase.
 * @returns         lowercased equivalent of str
 */
std::string ToLower(const std::string& str);

/**
 * Returns the uppercase equivalent of the given string. Locale independent, 7-bit ASCII only.
 */
std::string ToUpper(const std::string& str);

//!
//! \brief Returns number of seconds since the beginning of the Unix Epoch.
//! \return int64_t seconds.
//!
int64_t GetUnixEpochTime();

//!
//! \brief Formats input unix epoch time in human readable format.
//! \param int64_t seconds.
//! \return ISO8601 conformant datetime string.
//!
std::string FormatISO8601DateTime(int64_t time);

//!
//! \brief Returns the string name of the log level (DEBUG, INFO, WARNING, ERROR).
//!
std::string LogLevelToString(const LogLevel& level);

//!
//! \brief Parses a log level name case-insensitively. WARN is accepted as an alias for WARNING.
//! \param str
//! \return the LogLevel, or std::nullopt if the string does not name a level.
//!
std::optional<LogLevel> ParseLogLevel(const std::string& str);

//!
//! \brief Returns true if a message at the provided level would be emitted at the current g_log_level.
//!
inline bool LogLevelEnabled(const LogLevel& level)
{
    return static_cast<int>(level) >= static_cast<int>(g_log_level.load(std::memory_order_relaxed));
}

template <typename... Args>
//!
//! \brief Creates a string with fmt specifier and variadic args.
//! \param fmt specifier
//! \param args... variadic
//! \return formatted std::string
//!
static inline std::string LogPrintStr(const char* fmt, const Args&... args)
{
    std::string log_msg;

    // Conditionally add timestamp prefix based on g_log_timestamps flag.
    if (g_log_timestamps.load(std::memory_order_relaxed)) {
        log_msg = FormatISO8601DateTime(GetUnixEpochTime()) + " ";
    }

    try {
        log_msg += tfm::format(fmt, args...);
    } catch (tinyformat::format_error& fmterr) {
        /* Original format string will have newline so don't add one here */
        log_msg += "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
    }

    log_msg += "\n";

    return log_msg;
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cout, conditioned on the log level being INFO or lower.
//! \param fmt
//! \param args
//!
void log(const char* fmt, const Args&... args)
{
    if (LogLevelEnabled(LogLevel::INFO)) {
        std::cout << LogPrintStr(fmt, args...) << std::flush;
    }
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cout, conditioned on the log level being DEBUG.
//! \param fmt
//! \param args
//!
void debug_log(const char* fmt, const Args&... args)
{
    if (LogLevelEnabled(LogLevel::DEBUG)) {
        std::cout << LogPrintStr(fmt, args...) << std::flush;
    }
}

template <typename... Args>
//!
//! \brief LogPrintStr with a WARNING: prefix directed to cout, conditioned on the log level being WARNING or lower.
//! \param fmt
//! \param args
//!
void warning_log(const char* fmt, const Args&... args)
{
    if (LogLevelEnabled(LogLevel::WARNING)) {
        std::string warning_fmt = "WARNING: ";
        warning_fmt += fmt;

        std::cout << LogPrintStr(warning_fmt.c_str(), args...) << std::flush;
    }
}

template <typename... Args>
//!
//! \brief LogPrintStr directed to cerr. Errors are always emitted.
//! \param fmt
//! \param args
//!
void error_log(const char* fmt, const Args&... args)
{
    std::string error_fmt = "ERROR: ";
    error_fmt += fmt;

    std::cerr << LogPrintStr(error_fmt.c_str(), args...);
}

[[nodiscard]] int ParseStringToInt(const std::string& str);

[[nodiscard]] double ParseStringToDouble(const std::string& str);

//!
//! \brief Parses a boolean config value. Accepts 1/0 and true/false (case-insensitive).
//! \param str
//! \return the boolean value, or std::nullopt if the string is not a recognized boolean.
//!
[[nodiscard]] std::optional<bool> ParseStringToBool(const std::string& str);

//!
//! \brief Finds directory entries in the provided path that match the provided wildcard string.
//! \param directory
//! \param wildcard
//! \return std::vector of fs::paths that match.
//!
std::vector<fs::path> FindDirEntriesWithWildcard(const fs::path& directory, const std::string& wildcard);

//!
//! \brief Safely get an enviroment variable value from the provided name
//! \param std::string of the name of the variable to retrieve
//! \return std::string of the value of the requested variable. std::nullopt if not found.
//!
std::optional<std::string> GetEnvVariable(const std::string& var_name);

//!
//! \brief The ScreenWatchException class is a customized exception handling class for the screenwatch application.
//!
class ScreenWatchException : public std::exception
{
public:
    ScreenWatchException(const std::string& message) : m_message(message) {}
    ScreenWatchException(const char* message) : m_message(message) {}

    const char* what() const noexcept override {
        return m_message.c_str();
    }

protected:
    std::string m_message;
};

//! File system related exceptions
class FileSystemException : public ScreenWatchException
{
public:
    FileSystemException(const std::string& message, const std::filesystem::path& path)
        : ScreenWatchException(message + " Path: " + path.string()), m_path(path) {}

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

//! Threading Related Exceptions
class ThreadException : public ScreenWatchException
{
public:
    ThreadException(const std::string& message) : ScreenWatchException(message) {}
};

//! Invalid or missing configuration. Fatal at startup.
class ConfigException : public ScreenWatchException
{
public:
    ConfigException(const std::string& message) : ScreenWatchException(message) {}
};

//! Device event bus subscription failure or connection loss. Fatal.
class EventBusException : public ScreenWatchException
{
public:
    EventBusException(const std::string& message) : ScreenWatchException(message) {}
};

typedef std::variant<bool, int, double, std::string, std::vector<std::string>, fs::path> config_variant;

//!
//! \brief The Config class stores program config read from the config file, with applied defaults if the
//! config file cannot be read, or a config parameter is not in the config file.
//!
class Config
{
public:
    //!
    //! \brief Constructor.
    //!
    Config();

    virtual ~Config() = default;

    //!
    //! \brief Reads and parses the config file provided by the argument and populates m_config_in, then calls private
    //! method ProcessArgs() to populate m_config. If the file cannot be read, ProcessArgs() is still called so that
    //! defaults are populated.
    //! \param config_file
    //!
    void ReadAndUpdateConfig(const fs::path& config_file);

    //!
    //! \brief Provides the config_variant type value of the config parameter (argument).
    //! \param arg (key) to look up value.
    //! \return config_variant type value of the value of the config parameter (argument). An empty string variant
    //! is returned if the parameter does not exist.
    //!
    config_variant GetArg(const std::string& arg) const;

    //!
    //! \brief Returns the messages recorded by ProcessArgs() for parameters that had invalid values in the config
    //! file. An empty vector means the config is valid.
    //!
    std::vector<std::string> GetInvalidArgs() const;

protected:
    //!
    //! \brief Private version of GetArg that operates on m_config_in and also selects the provided default value
    //! if the arg is not found. This is how default values for parameters are established.
    //! \param arg (key) to look up value as string.
    //! \param default_value if arg is not found.
    //! \return string value found in lookup, default value if not found.
    //!
    std::string GetArgString(const std::string& arg, const std::string& default_value) const;

    //!
    //! \brief Records an invalid parameter value and logs it.
    //! \param arg
    //! \param value
    //!
    void RecordInvalidArg(const std::string& arg, const std::string& value);

    //!
    //! \brief Holds the processed parameter-values, which are strongly typed and in a config_variant union, and where
    //! default values are populated if not found in the config file (m_config_in).
    //!
    std::multimap<std::string, config_variant> m_config;

private:
    //!
    //! \brief Private helper method used by ReadAndUpdateConfig. Note this is pure virtual. It must be implemented
    //! in a specialization of a derived class for use by a specific application.
    //!
    virtual void ProcessArgs() = 0;

    //!
    //! \brief This is the mutex member that provides lock control for the config object. This is used to ensure the
    //! config object is thread-safe.
    //!
    mutable std::mutex mtx_config;

    //!
    //! \brief Holds the raw parsed parameter-values from the config file.
    //!
    std::multimap<std::string, std::string> m_config_in;

    //!
    //! \brief Holds the invalid parameter messages from the last ProcessArgs() call.
    //!
    std::vector<std::string> m_invalid_args;
};

#endif // UTIL_H
