/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <cstring>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <pthread.h>
#include <unistd.h>

#include <release.h>

#include <screenwatch.h>

const fs::path g_lockfile = "screenwatch.pid";

pthread_t g_main_thread_id = 0;
std::atomic<int> g_exit_code = 0;

using namespace ScreenWatch;

//!
//! \brief Records the exit code and sends SIGTERM to the main thread, initiating a shutdown via the sigwait loop in
//! main. This is how the event thread reports a fatal event bus failure.
//! \param exit_code
//!
void Shutdown(const int& exit_code = 0)
{
    g_exit_code = exit_code;

    pthread_kill(g_main_thread_id, SIGTERM);
}

//!
//! \brief Handles a signal received by sigwait in the main thread.
//! \param signum
//! \return true if the signal requests termination.
//!
bool HandleSignals(int signum)
{
    switch (signum) {
    case SIGINT:
        log("INFO: %s: SIGINT received, shutting down",
            __func__);
        return true;
    case SIGTERM:
        log("INFO: %s: SIGTERM received, shutting down",
            __func__);
        return true;
    case SIGHUP:
        log("INFO: %s: SIGHUP received. Settings are read once at startup; restart to apply config changes.",
            __func__);
        return false;
    default:
        warning_log("%s: Unknown signal %i received.",
                    __func__,
                    signum);
        return false;
    }
}

//!
//! \brief Determines the config file to use. An explicit argument must name a regular file. Otherwise the per-user
//! config and then the system config are tried.
//! \param argument
//! \return the config file path, or an empty path if none was found and defaults are to be used.
//!
fs::path FindConfigFile(const std::optional<std::string>& argument)
{
    if (argument) {
        fs::path config_file_path(*argument);
        std::error_code ec;

        if (!fs::is_regular_file(config_file_path, ec)) {
            throw ConfigException("Config file argument is not a regular file: " + *argument);
        }

        return config_file_path;
    }

    std::vector<fs::path> candidates;

    std::optional<std::string> xdg_config_home = GetEnvVariable("XDG_CONFIG_HOME");
    std::optional<std::string> home = GetEnvVariable("HOME");

    if (xdg_config_home && !xdg_config_home->empty()) {
        candidates.push_back(fs::path(*xdg_config_home) / "screenwatch" / "config.ini");
    } else if (home && !home->empty()) {
        candidates.push_back(fs::path(*home) / ".config" / "screenwatch" / "config.ini");
    }

    candidates.push_back(fs::path("/etc/screenwatch/config.ini"));

    for (const auto& candidate : candidates) {
        std::error_code ec;

        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }

    return fs::path {};
}

//!
//! \brief Checks for a running instance via the pid lockfile in XDG_RUNTIME_DIR and writes the current pid.
//! \return the lockfile path, empty if XDG_RUNTIME_DIR is not set. Throws ScreenWatchException if another
//! instance is running.
//!
fs::path AcquireLockfile()
{
    std::optional<std::string> xdg_runtime_dir = GetEnvVariable("XDG_RUNTIME_DIR");

    if (!xdg_runtime_dir || xdg_runtime_dir->empty()) {
        debug_log("INFO: %s: XDG_RUNTIME_DIR not set, not using a lockfile.",
                  __func__);
        return fs::path {};
    }

    fs::path lockfile_path = fs::path(*xdg_runtime_dir) / g_lockfile;
    std::error_code ec;

    if (fs::exists(lockfile_path, ec)) {
        std::ifstream lockfile(lockfile_path);
        pid_t old_pid = 0;
        lockfile >> old_pid;

        if (old_pid > 0 && old_pid != getpid() && kill(old_pid, 0) == 0) {
            throw ScreenWatchException(tfm::format("screenwatch is already running with PID: %i", old_pid));
        }
    }

    // Scope to close the lockfile after writing pid.
    {
        std::ofstream lockfile(lockfile_path);

        if (!lockfile.is_open()) {
            throw FileSystemException("Unable to write lockfile.", lockfile_path);
        }

        lockfile << getpid();
    }

    return lockfile_path;
}

void RemoveLockfile(const fs::path& lockfile_path)
{
    if (lockfile_path.empty()) {
        return;
    }

    std::error_code ec;

    if (!fs::remove(lockfile_path, ec) && ec) {
        warning_log("%s: lockfile could not be removed: %s",
                    __func__,
                    ec.message());
    }
}

//!
//! \brief This is the main function for screenwatch
//! \param argc
//! \param argv
//! \return exit code
//!
int main(int argc, char* argv[])
{
    const char* journal_stream = getenv("JOURNAL_STREAM");

    // If JOURNAL_STREAM is set, assume output is handled by journald, which adds its own timestamps.
    g_log_timestamps.store(journal_stream == nullptr || strlen(journal_stream) == 0);

    std::optional<std::string> config_argument;

    if (argc == 2) {
        std::string arg = argv[1];

        if (arg == "-v" || arg == "--version") {
            std::cout << "screenwatch " << g_version << std::endl;
            return 0;
        }

        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: screenwatch [config_file]" << std::endl;
            return 0;
        }

        config_argument = arg;
    } else if (argc > 2) {
        error_log("%s: At most one argument may be specified, the location of the config file.",
                  __func__);
        return 1;
    }

    ScreenWatchConfig config;
    Settings settings;

    try {
        fs::path config_file_path = FindConfigFile(config_argument);

        if (config_file_path.empty()) {
            log("INFO: %s: No config file found. Using defaults.",
                __func__);
        } else {
            log("INFO: %s: Using config from %s",
                __func__,
                config_file_path);
        }

        config.ReadAndUpdateConfig(config_file_path);

        settings = Settings::FromConfig(config);
    } catch (ConfigException& e) {
        error_log("%s: Configuration error: %s",
                  __func__,
                  e.what());
        return 1;
    }

    g_log_level = settings.m_log_level;

    // Need the main thread id to be able to send signal from the event thread back to main.
    g_main_thread_id = pthread_self();

    // Block the termination signals before the lockfile is written and before any other thread is created, so that
    // every thread inherits the mask and the signals are only received by sigtimedwait()/sigwait() below. A
    // termination request at any point after this therefore still removes the lockfile.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGHUP);

    if (pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        perror("pthread_sigmask");
        return 1;
    }

    fs::path lockfile_path;

    try {
        lockfile_path = AcquireLockfile();
    } catch (ScreenWatchException& e) {
        error_log("%s: %s",
                  __func__,
                  e.what());
        return 1;
    }

    if (settings.m_startup_delay > 0) {
        log("INFO: %s: Waiting for %i seconds to start.",
            __func__,
            settings.m_startup_delay);

        if (!WaitForStartupDelay(mask, std::chrono::seconds(settings.m_startup_delay), HandleSignals)) {
            RemoveLockfile(lockfile_path);

            log("INFO: %s: screenwatch exiting during startup delay",
                __func__);

            return 0;
        }
    }

    log("INFO: %s: screenwatch C++ program, %s, started, pid %i",
        __func__,
        g_version,
        getpid());

    std::optional<std::string> desktop = GetCurrentDesktop();

    log("INFO: %s: Current desktop environment: %s%s",
        __func__,
        desktop.value_or("none detected"),
        desktop && ShouldExclude(*desktop, settings.m_excluded_desktops) ? " (excluded)" : "");

    UdevEventSource event_source;
    CommandExecutor executor;

    MonitorLoop monitor_loop(settings,
                             event_source,
                             executor,
                             []() { return GetCurrentDesktop(); },
                             []() { return CountConnectedDisplays(); },
                             [](int exit_code) { Shutdown(exit_code); });

    if (!monitor_loop.Start()) {
        error_log("%s: Unable to start the screen monitor. Exiting.",
                  __func__);

        RemoveLockfile(lockfile_path);
        return 1;
    }

    int sig = 0;

    while (true) {
        // Wait for signal. This will also cause a shutdown at this point if Shutdown() was/is called.
        if (sigwait(&mask, &sig) == 0 && HandleSignals(sig)) {
            break;
        }
    }

    monitor_loop.Stop();

    RemoveLockfile(lockfile_path);

    log("INFO: %s: screenwatch exiting with code %i",
        __func__,
        g_exit_code.load());

    return g_exit_code;
}
