/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#ifndef SCREENWATCH_H
#define SCREENWATCH_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <filesystem>

#include <util.h>

// Forward declare libudev types
struct udev;
struct udev_monitor;

namespace ScreenWatch {

//!
//! \brief The Settings class holds the validated program settings. It is constructed once at startup from the config
//! and is passed by value into the MonitorLoop, which holds it as const for the process lifetime. There is no hot
//! reload.
//!
class Settings
{
public:
    //! Upper bound in seconds for debounce_delay, display_settle_delay and display_ready_timeout (one day).
    static constexpr double MAX_DELAY_SECONDS = 86400.0;

    //!
    //! \brief Constructs Settings populated with the built-in defaults.
    //!
    Settings();

    //!
    //! \brief Builds Settings from a processed config. Throws ConfigException if the config recorded any invalid
    //! parameter values or if the resulting settings are not usable (such as an empty command).
    //! \param config
    //! \return validated Settings
    //!
    static Settings FromConfig(const Config& config);

    //!
    //! \brief Returns the excluded desktops as a comma separated string for logging.
    //!
    std::string ExcludedDesktopsToString() const;

    //! The reconciler command, run through /bin/sh -c.
    std::string m_command;

    //! Lower-cased desktop names for which the command is suppressed.
    std::set<std::string> m_excluded_desktops;

    double m_debounce_seconds;

    LogLevel m_log_level;

    //! Whether to wait for at least one connected DRM connector before running the command.
    bool m_wait_for_displays;

    double m_display_settle_seconds;

    double m_display_ready_timeout_seconds;

    int m_display_poll_interval_ms;

    int m_startup_delay;
};

//!
//! \brief The DeviceEvent class is a small class that encapsulates a device event received from the device event bus.
//! Only events from the drm subsystem make it past the EventSource.
//!
class DeviceEvent
{
public:
    //!
    //! \brief The Action enum defines the kernel device actions of interest. Anything else is UNKNOWN. Note that if
    //! this enum is expanded, ActionToString and ActionFromString must also be updated.
    //!
    enum Action {
        UNKNOWN,
        ADD,
        REMOVE,
        CHANGE
    };

    //!
    //! \brief Constructs an "empty" DeviceEvent with an empty subsystem and action of UNKNOWN.
    //!
    DeviceEvent();

    //!
    //! \brief Constructs a DeviceEvent from the provided parameters.
    //! \param subsystem
    //! \param action
    //! \param device_node
    //! \param sys_name
    //!
    DeviceEvent(std::string subsystem,
                Action action,
                std::optional<std::string> device_node = std::nullopt,
                std::string sys_name = std::string {});

    //!
    //! \brief Converts the action string provided by udev ("add", "remove", "change") to the Action enum. Any other
    //! value, including an empty string, is UNKNOWN.
    //! \param action_str
    //! \return Action enum value
    //!
    static Action ActionFromString(const std::string& action_str);

    static std::string ActionToString(const Action& action);

    std::string ActionToString() const;

    //!
    //! \brief Returns true if the event is from the display (drm) subsystem.
    //!
    bool IsDisplayEvent() const;

    //!
    //! \brief Human readable form for logging.
    //! \return std::string in the format <subsystem>:<action>:<sys_name>:<device_node or "none">
    //!
    std::string ToString() const;

    std::string m_subsystem;
    Action m_action;
    std::optional<std::string> m_device_node;
    std::string m_sys_name;
};

//!
//! \brief The EventSource class is the abstract device event source. It provides a blocking, non-restartable iteration
//! over device events through NextEvent(). Filtering to the display (drm) subsystem is done by NextEvent() so that no
//! other subsystem's events are ever returned regardless of the concrete source.
//!
class EventSource
{
public:
    //! The only subsystem whose events are forwarded.
    static constexpr const char* DISPLAY_SUBSYSTEM = "drm";

    EventSource();

    virtual ~EventSource() = default;

    EventSource(const EventSource&) = delete;
    EventSource& operator=(const EventSource&) = delete;

    //!
    //! \brief Opens the subscription to the device event bus. Throws EventBusException on failure.
    //!
    virtual void Subscribe() = 0;

    //!
    //! \brief Releases the subscription. Idempotent.
    //!
    virtual void Unsubscribe() = 0;

    virtual bool IsSubscribed() const = 0;

    //!
    //! \brief Wakes up a NextEvent() call blocked in another thread. The default does nothing, in which case the
    //! blocked call returns at the end of its timeout.
    //!
    virtual void Interrupt();

    //!
    //! \brief Waits up to timeout for the next display subsystem event. Events from other subsystems are discarded.
    //! Throws EventBusException if the connection to the event bus is lost.
    //! \param timeout
    //! \return the event, or std::nullopt if no display event arrived within the timeout or the wait was interrupted.
    //!
    std::optional<DeviceEvent> NextEvent(const std::chrono::milliseconds& timeout);

    //!
    //! \brief Returns the number of events discarded because they were not from the display subsystem.
    //!
    int64_t GetDiscardedEventCount() const;

protected:
    //!
    //! \brief Reads the next raw event from the underlying bus, waiting up to timeout.
    //! \param timeout
    //! \return the raw event, or std::nullopt on timeout or interrupt.
    //!
    virtual std::optional<DeviceEvent> ReadEvent(const std::chrono::milliseconds& timeout) = 0;

private:
    std::atomic<int64_t> m_discarded_event_count;
};

//!
//! \brief The UdevEventSource class subscribes to the udev netlink monitor, filtered to the drm subsystem at
//! subscription time. A self-pipe is used to interrupt the poll() in ReadEvent() from another thread.
//!
class UdevEventSource : public EventSource
{
public:
    UdevEventSource();

    //!
    //! \brief Destructor releases the udev monitor and the interrupt pipe via Unsubscribe().
    //!
    ~UdevEventSource() override;

    UdevEventSource(const UdevEventSource&) = delete;
    UdevEventSource& operator=(const UdevEventSource&) = delete;
    UdevEventSource(UdevEventSource&&) = delete;
    UdevEventSource& operator=(UdevEventSource&&) = delete;

    void Subscribe() override;

    void Unsubscribe() override;

    bool IsSubscribed() const override;

    void Interrupt() override;

protected:
    std::optional<DeviceEvent> ReadEvent(const std::chrono::milliseconds& timeout) override;

private:
    //!
    //! \brief Releases the udev objects and closes the pipe fds. Caller must hold mtx_udev_event_source.
    //!
    void Cleanup();

    mutable std::mutex mtx_udev_event_source;

    struct udev* m_udev;
    struct udev_monitor* m_monitor;

    int m_interrupt_pipe_fd[2];

    std::atomic<bool> m_subscribed;
};

//!
//! \brief The DebounceTimer class collapses bursts of Arm() calls into a single delayed call of the on_fire callback.
//! It owns a worker thread. There is at most one pending countdown: Arm() replaces any countdown in flight.
//!
//! The on_fire callback runs on the timer thread with the timer lock released. An Arm() while on_fire is running
//! arms a fresh countdown. If that countdown elapses before on_fire returns, a single follow-up fire happens right
//! after on_fire returns. Fires therefore never overlap.
//!
class DebounceTimer
{
public:
    typedef std::chrono::steady_clock::time_point time_point;
    typedef std::chrono::steady_clock::duration duration;

    //!
    //! \brief Constructor.
    //! \param delay: the quiet period after the last Arm() before firing. Zero fires immediately.
    //! \param on_fire: the callback.
    //!
    DebounceTimer(duration delay, std::function<void()> on_fire);

    //!
    //! \brief Destructor stops and joins the timer thread.
    //!
    ~DebounceTimer();

    DebounceTimer(const DebounceTimer&) = delete;
    DebounceTimer& operator=(const DebounceTimer&) = delete;

    //!
    //! \brief Starts the timer thread. Throws ThreadException if the thread cannot be created.
    //!
    void Start();

    //!
    //! \brief (Re)starts the countdown so that the timer fires at now + delay, cancelling any pending countdown.
    //! \param now
    //!
    void Arm(const time_point& now);

    //!
    //! \brief Drops the pending countdown, if any, without firing.
    //!
    void Cancel();

    //!
    //! \brief Cancels the pending countdown and joins the timer thread. A fire in progress is allowed to complete.
    //! Idempotent.
    //!
    void Stop();

    bool IsPending() const;

    bool IsFiring() const;

    int64_t GetFireCount() const;

    duration GetDelay() const;

private:
    void DebounceTimerThread();

    mutable std::mutex mtx_debounce_timer;

    std::condition_variable cv_debounce_timer;

    std::thread m_debounce_timer_thread;

    //! The single pending countdown.
    std::optional<time_point> m_deadline;

    std::atomic<bool> m_interrupt_debounce_timer;

    std::atomic<bool> m_firing;

    std::atomic<int64_t> m_fire_count;

    const duration m_delay;

    std::function<void()> m_on_fire;
};

//!
//! \brief Looks up the desktop in the exclusion set. The desktop string may be a colon separated list as found in
//! XDG_CURRENT_DESKTOP (e.g. "ubuntu:GNOME"), in which case each component is checked. Comparison is case-insensitive.
//! \param current_desktop
//! \param excluded_desktops
//! \return the matched component as it appears in current_desktop, or std::nullopt if there is no match or the desktop
//! is empty.
//!
std::optional<std::string> FindExcludedDesktop(const std::string& current_desktop,
                                               const std::set<std::string>& excluded_desktops);

//!
//! \brief Pure predicate: should running the command be suppressed for this desktop? An empty desktop is never
//! excluded.
//!
bool ShouldExclude(const std::string& current_desktop, const std::set<std::string>& excluded_desktops);

//!
//! \brief Identifies the current desktop environment from XDG_CURRENT_DESKTOP, XDG_SESSION_DESKTOP and DESKTOP_SESSION,
//! in that order. The first non-empty value wins.
//! \return the desktop string or std::nullopt if no desktop is detected.
//!
std::optional<std::string> GetCurrentDesktop();

//!
//! \brief Counts the DRM connectors (cardN-<output> entries) whose status attribute reads "connected".
//! \param drm_class_path
//! \return number of connected displays
//!
int CountConnectedDisplays(const fs::path& drm_class_path = "/sys/class/drm");

//!
//! \brief Waits for the startup delay with the signals in mask blocked, receiving them through sigtimedwait() so that
//! a termination request during the delay is honored. The signals must already be blocked in the calling thread.
//! \param mask: the blocked signals to wait for.
//! \param delay
//! \param handle_signal: called for each signal received. Returns true if the signal requests termination.
//! \return true if the full delay elapsed, false if a signal requested termination.
//!
bool WaitForStartupDelay(const sigset_t& mask,
                         const std::chrono::seconds& delay,
                         const std::function<bool(int)>& handle_signal);

//!
//! \brief The ExecutionResult class holds the outcome of one command execution. It is used only for logging.
//!
class ExecutionResult
{
public:
    enum Status {
        EXITED,
        SIGNALED,
        LAUNCH_FAILED
    };

    ExecutionResult();

    static std::string StatusToString(const Status& status);

    //!
    //! \brief Returns true if the command ran and exited with code 0.
    //!
    bool IsSuccess() const;

    Status m_status;

    //! Exit code for EXITED, 128 + signal number for SIGNALED, -1 for launch failures before the shell ran.
    int m_exit_code;

    int64_t m_duration_ms;

    std::optional<std::string> m_stdout_snippet;

    std::optional<std::string> m_stderr_snippet;

    //! Reason for LAUNCH_FAILED.
    std::string m_error_message;
};

//!
//! \brief The CommandExecutor class runs a command string through /bin/sh -c with the inherited environment and
//! working directory, waiting for it to exit. Output is captured for logging. No timeout is imposed. Run() does not
//! throw for any command outcome.
//!
class CommandExecutor
{
public:
    //! Maximum number of bytes kept of each of stdout and stderr.
    static constexpr size_t MAX_CAPTURE_BYTES = 1024;

    CommandExecutor();

    virtual ~CommandExecutor() = default;

    virtual ExecutionResult Run(const std::string& command);
};

//!
//! \brief The MonitorLoop class is the orchestrator. It wires the EventSource to the DebounceTimer, and on each
//! timer fire evaluates the exclusion filter and runs the command. It owns the event thread, which drains the event
//! source; the timer thread performs fires and command execution so a slow command never blocks event draining.
//!
//! State transitions: STARTING -> RUNNING -> STOPPING -> STOPPED. A subscription failure goes from STARTING to
//! STOPPED and a fatal event bus error in RUNNING goes directly to STOPPED.
//!
class MonitorLoop
{
public:
    enum State {
        STARTING,
        RUNNING,
        STOPPING,
        STOPPED
    };

    typedef std::function<std::optional<std::string>()> DesktopIdentifier;
    typedef std::function<int()> DisplayCounter;
    typedef std::function<void(int)> FatalHandler;

    //!
    //! \brief Constructor. The event source and executor must outlive the MonitorLoop.
    //! \param settings
    //! \param event_source
    //! \param executor
    //! \param desktop_identifier: queried on every fire.
    //! \param display_counter: returns the count of connected displays.
    //! \param fatal_handler: called from the event thread with an exit code when the event bus fails.
    //!
    MonitorLoop(Settings settings,
                EventSource& event_source,
                CommandExecutor& executor,
                DesktopIdentifier desktop_identifier,
                DisplayCounter display_counter,
                FatalHandler fatal_handler);

    //!
    //! \brief Destructor calls Stop().
    //!
    ~MonitorLoop();

    MonitorLoop(const MonitorLoop&) = delete;
    MonitorLoop& operator=(const MonitorLoop&) = delete;

    //!
    //! \brief Subscribes the event source and starts the timer and event threads.
    //! \return true if the loop is RUNNING, false if it went to STOPPED.
    //!
    bool Start();

    //!
    //! \brief Graceful stop. Cancels any pending countdown, unsubscribes, and waits for an in-flight command to
    //! finish. Idempotent.
    //!
    void Stop();

    State GetState() const;

    static std::string StateToString(const State& state);

    std::string StateToString() const;

    const Settings& GetSettings() const;

    int64_t GetEventCount() const;

    int64_t GetFireCount() const;

    int64_t GetExecutionCount() const;

    std::optional<ExecutionResult> GetLastResult() const;

private:
    void EventThread();

    void OnDebounceFire();

    //!
    //! \brief Waits for at least one connected display, bounded by the configured timeout. Returns early if the loop
    //! is interrupted.
    //! \return true if a connected display was seen.
    //!
    bool WaitForDisplays();

    //!
    //! \brief Sleeps for the provided duration unless the loop is interrupted first.
    //! \return false if interrupted.
    //!
    bool InterruptibleSleep(const std::chrono::milliseconds& duration);

    void LogExecutionResult(const std::string& command, const ExecutionResult& result) const;

    const Settings m_settings;

    EventSource& m_event_source;

    CommandExecutor& m_executor;

    DesktopIdentifier m_desktop_identifier;

    DisplayCounter m_display_counter;

    FatalHandler m_fatal_handler;

    DebounceTimer m_debounce_timer;

    std::thread m_event_thread;

    std::atomic<State> m_state;

    std::atomic<bool> m_interrupt_monitor_loop;

    //!
    //! \brief Provides lock control for the interruptible waits and the stop sequence.
    //!
    mutable std::mutex mtx_monitor_loop;

    std::condition_variable cv_monitor_loop;

    mutable std::mutex mtx_last_result;

    std::optional<ExecutionResult> m_last_result;

    std::atomic<int64_t> m_event_count;

    std::atomic<int64_t> m_fire_count;

    std::atomic<int64_t> m_execution_count;
};

} // namespace ScreenWatch

//!
//! \brief The ScreenWatchConfig class. This specializes the Config class and implements the virtual method ProcessArgs()
//! for screenwatch.
//!
class ScreenWatchConfig : public Config
{
    void ProcessArgs() override;
};

#endif // SCREENWATCH_H
