/*
 * Copyright (C) 2025 James C. Owens
 * Portions Copyright (c) 2019 The Bitcoin Core developers
 * Portions Copyright (c) 2025 The Gridcoin developers
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <util.h>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <regex>
#include <fstream>

//!
//! \brief The global log level. This defaults to INFO to support early use of the log utility functions before the
//! config is read to get the configured log level.
//!
std::atomic<LogLevel> g_log_level = LogLevel::INFO;

//!
//! \brief The flag controls the logging of timestamps by the log functions. This is used to suppress
//! timestamp output when run under systemd, where the journal appends a high resolution timestamp.
//!
std::atomic<bool> g_log_timestamps = true;

[[nodiscard]] std::vector<std::string> StringSplit(const std::string& s, const std::string& delim)
{
    size_t pos = 0;
    size_t end = 0;
    std::vector<std::string> elems;

    while((end = s.find(delim, pos)) != std::string::npos)
    {
        elems.push_back(s.substr(pos, end - pos));
        pos = end + delim.size();
    }

    // Append final value
    elems.push_back(s.substr(pos, end - pos));
    return elems;
}

[[nodiscard]] std::string TrimString(const std::string& str, const std::string& pattern)
{
    std::string::size_type front = str.find_first_not_of(pattern);
    if (front == std::string::npos) {
        return std::string();
    }
    std::string::size_type end = str.find_last_not_of(pattern);
    return str.substr(front, end - front + 1);
}

[[nodiscard]] std::string StripQuotes(const std::string& str)
{
    if (str.empty()) {
        return str;
    }

    std::string result = str;

    if (result.front() == '"' || result.front() == '\'') {
        result.erase(0, 1);
    }

    if (!result.empty() && (result.back() == '"' || result.back() == '\'')) {
        result.pop_back();
    }

    return result;
}

static constexpr char ToLowerChar(char c)
{
    return (c >= 'A' && c <= 'Z' ? (c - 'A') + 'a' : c);
}

static constexpr char ToUpperChar(char c)
{
    return (c >= 'a' && c <= 'z' ? (c - 'a') + 'A' : c);
}

std::string ToLower(const std::string& str)
{
    std::string r;
    for (auto ch : str) r += ToLowerChar(ch);
    return r;
}

std::string ToUpper(const std::string& str)
{
    std::string r;
    for (auto ch : str) r += ToUpperChar(ch);
    return r;
}

int64_t GetUnixEpochTime()
{
    auto now = std::chrono::system_clock::now();

    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string FormatISO8601DateTime(int64_t time)
{
    struct tm ts;
    time_t time_val = time;
    if (gmtime_r(&time_val, &ts) == nullptr) {
        return {};
    }

    return tfm::format("%04i-%02i-%02iT%02i:%02i:%02iZ",
                       ts.tm_year + 1900, ts.tm_mon + 1, ts.tm_mday, ts.tm_hour, ts.tm_min, ts.tm_sec);
}

std::string LogLevelToString(const LogLevel& level)
{
    std::string out;

    switch (level) {
    case LogLevel::DEBUG:
        out = "DEBUG";
        break;
    case LogLevel::INFO:
        out = "INFO";
        break;
    case LogLevel::WARNING:
        out = "WARNING";
        break;
    case LogLevel::ERROR:
        out = "ERROR";
        break;
    }

    return out;
}

std::optional<LogLevel> ParseLogLevel(const std::string& str)
{
    std::string level = ToUpper(TrimString(str));

    if (level == "DEBUG") {
        return LogLevel::DEBUG;
    } else if (level == "INFO") {
        return LogLevel::INFO;
    } else if (level == "WARNING" || level == "WARN") {
        return LogLevel::WARNING;
    } else if (level == "ERROR") {
        return LogLevel::ERROR;
    }

    return std::nullopt;
}

[[nodiscard]] int ParseStringToInt(const std::string& str)
{
    try {
        size_t pos = 0;
        int value = std::stoi(str, &pos);

        if (pos != str.size()) {
            throw std::invalid_argument("trailing characters in \"" + str + "\"");
        }

        return value;
    } catch (const std::invalid_argument& e){
        error_log("%s: Invalid argument: %s",
                  __func__,
                  e.what());
        throw;
    } catch (const std::out_of_range& e){
        error_log("%s: Out of range: %s",
                  __func__,
                  e.what());
        throw;
    }
}

[[nodiscard]] double ParseStringToDouble(const std::string& str)
{
    try {
        size_t pos = 0;
        double value = std::stod(str, &pos);

        if (pos != str.size()) {
            throw std::invalid_argument("trailing characters in \"" + str + "\"");
        }

        return value;
    } catch (const std::invalid_argument& e){
        error_log("%s: Invalid argument: %s",
                  __func__,
                  e.what());
        throw;
    } catch (const std::out_of_range& e){
        error_log("%s: Out of range: %s",
                  __func__,
                  e.what());
        throw;
    }
}

[[nodiscard]] std::optional<bool> ParseStringToBool(const std::string& str)
{
    std::string value = ToLower(TrimString(str));

    if (value == "1" || value == "true") {
        return true;
    } else if (value == "0" || value == "false") {
        return false;
    }

    return std::nullopt;
}

std::vector<fs::path> FindDirEntriesWithWildcard(const fs::path& directory, const std::string& wildcard)
{
    std::vector<fs::path> matching_entries;
    std::regex regex_wildcard(wildcard);

    std::error_code ec;

    if (!fs::exists(directory, ec) || !fs::is_directory(directory, ec)) {
        debug_log("WARNING: %s, directory %s to search for regex expression \"%s\" "
                  "does not exist or is not a directory.",
                  __func__,
                  directory,
                  wildcard);

        return matching_entries;
    }

    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (std::regex_match(entry.path().filename().string(), regex_wildcard)) {
            matching_entries.push_back(entry.path());
        }
    }

    return matching_entries;
}

std::optional<std::string> GetEnvVariable(const std::string& var_name)
{
    const char* value = std::getenv(var_name.c_str());

    if (value == nullptr) {
        return std::nullopt;
    }

    return std::string(value);
}

// Class Config

Config::Config()
{}

void Config::ReadAndUpdateConfig(const fs::path& config_file) {
    std::unique_lock<std::mutex> lock(mtx_config);

    std::multimap<std::string, std::string> config;

    try {
        std::ifstream file;

        if (!config_file.empty()) {
            file.open(config_file);
        }

        if (config_file.empty()) {
            debug_log("INFO: %s: No config file provided, so defaults will be used.",
                      __func__);
        } else if (!file.is_open()) {
            error_log("%s: Could not open the config file: %s",
                      __func__,
                      config_file);
        } else {
            std::string line;
            while (std::getline(file, line)) {
                std::string trimmed_line = TrimString(line);

                // Skip empty lines and lines starting with '#' or ';'
                if (trimmed_line.empty() || trimmed_line[0] == '#' || trimmed_line[0] == ';') {
                    continue;
                }

                // Split at the first '=' only, so values such as "--mode=1920x1080" are kept whole. Lines with
                // no '=' (including section headers such as [DEFAULT]) or with an empty key are skipped.
                std::string::size_type delim_pos = trimmed_line.find('=');

                if (delim_pos == std::string::npos) {
                    continue;
                }

                std::string key = StripQuotes(TrimString(trimmed_line.substr(0, delim_pos)));

                if (key.empty()) {
                    debug_log("WARNING: %s: skipping config line with an empty key: %s",
                              __func__,
                              trimmed_line);
                    continue;
                }

                config.insert(std::make_pair(key, StripQuotes(TrimString(trimmed_line.substr(delim_pos + 1)))));
            }

            file.close();
        }
    } catch (std::ios_base::failure& e) {
        error_log("%s: Reading config file failed, so defaults will be used: %s",
                  __func__,
                  e.what());

        config.clear();
    }

    // Do this all at once so the result of the config read is essentially "atomic".
    m_config_in.swap(config);

    m_config.clear();
    m_invalid_args.clear();

    // If the config file read failed, we will process args anyway, which will result in defaults being chosen.
    ProcessArgs();
}

config_variant Config::GetArg(const std::string& arg) const
{
    std::unique_lock<std::mutex> lock(mtx_config);

    auto iter = m_config.find(arg);

    if (iter != m_config.end()) {
        return iter->second;
    } else {
        return std::string {};
    }
}

std::vector<std::string> Config::GetInvalidArgs() const
{
    std::unique_lock<std::mutex> lock(mtx_config);

    return m_invalid_args;
}

std::string Config::GetArgString(const std::string& arg, const std::string& default_value) const
{
    auto iter = m_config_in.find(arg);

    if (iter != m_config_in.end()) {
        return iter->second;
    } else {
        return default_value;
    }
}

void Config::RecordInvalidArg(const std::string& arg, const std::string& value)
{
    error_log("%s: %s parameter in config file has invalid value: %s",
              __func__,
              arg,
              value);

    m_invalid_args.push_back(arg + "=" + value);
}
