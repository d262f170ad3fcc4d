/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <ctime>
#include <fstream>
#include <system_error>
#include <variant>

#include <screenwatch.h>

using namespace ScreenWatch;

namespace {
//!
//! \brief Clamps a delay in seconds to [0, Settings::MAX_DELAY_SECONDS]. NaN maps to zero.
//!
double ClampDelaySeconds(const double& seconds)
{
    if (!(seconds > 0.0)) {
        return 0.0;
    }

    return std::min(seconds, Settings::MAX_DELAY_SECONDS);
}

//!
//! \brief Converts fractional seconds from the settings to whole milliseconds, saturating at the maximum delay.
//!
std::chrono::milliseconds SecondsToMilliseconds(const double& seconds)
{
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(ClampDelaySeconds(seconds) * 1000.0)));
}

//!
//! \brief Returns true if the delay is finite and within [0, Settings::MAX_DELAY_SECONDS].
//!
bool IsValidDelaySeconds(const double& seconds)
{
    return std::isfinite(seconds) && seconds >= 0.0 && seconds <= Settings::MAX_DELAY_SECONDS;
}
} // anonymous namespace

// Class Settings

Settings::Settings()
    : m_command("autorandr -c")
    , m_excluded_desktops({"cosmic", "gnome", "kde", "plasma", "xfce", "x-cinnamon"})
    , m_debounce_seconds(2.0)
    , m_log_level(LogLevel::INFO)
    , m_wait_for_displays(true)
    , m_display_settle_seconds(1.0)
    , m_display_ready_timeout_seconds(5.0)
    , m_display_poll_interval_ms(200)
    , m_startup_delay(0)
{}

Settings Settings::FromConfig(const Config& config)
{
    std::vector<std::string> invalid_args = config.GetInvalidArgs();

    if (!invalid_args.empty()) {
        std::string message = "Invalid config parameter value(s): ";

        for (size_t i = 0; i < invalid_args.size(); ++i) {
            if (i > 0) {
                message += ", ";
            }

            message += invalid_args[i];
        }

        throw ConfigException(message);
    }

    Settings settings;

    try {
        settings.m_command = TrimString(std::get<std::string>(config.GetArg("command")));

        settings.m_excluded_desktops.clear();

        // GetArg() returns by value, so the variant must outlive the loop.
        config_variant excluded_desktops_arg = config.GetArg("excluded_desktops");

        for (const auto& desktop : std::get<std::vector<std::string>>(excluded_desktops_arg)) {
            settings.m_excluded_desktops.insert(ToLower(desktop));
        }

        settings.m_debounce_seconds = std::get<double>(config.GetArg("debounce_delay"));

        std::string log_level_arg = std::get<std::string>(config.GetArg("log_level"));
        std::optional<LogLevel> log_level = ParseLogLevel(log_level_arg);

        if (!log_level) {
            throw ConfigException("Invalid log_level: " + log_level_arg);
        }

        settings.m_log_level = *log_level;

        settings.m_wait_for_displays = std::get<bool>(config.GetArg("wait_for_displays"));
        settings.m_display_settle_seconds = std::get<double>(config.GetArg("display_settle_delay"));
        settings.m_display_ready_timeout_seconds = std::get<double>(config.GetArg("display_ready_timeout"));
        settings.m_display_poll_interval_ms = std::get<int>(config.GetArg("display_poll_interval_ms"));
        settings.m_startup_delay = std::get<int>(config.GetArg("startup_delay"));
    } catch (const std::bad_variant_access& e) {
        throw ConfigException(std::string("Config parameter missing or of unexpected type: ") + e.what());
    }

    if (settings.m_command.empty()) {
        throw ConfigException("The command parameter must not be empty.");
    }

    return settings;
}

std::string Settings::ExcludedDesktopsToString() const
{
    std::string out;

    for (const auto& desktop : m_excluded_desktops) {
        if (!out.empty()) {
            out += ",";
        }

        out += desktop;
    }

    return out;
}

// ScreenWatchConfig class

void ScreenWatchConfig::ProcessArgs()
{
    // command

    std::string command = GetArgString("command", "autorandr -c");

    if (TrimString(command).empty()) {
        RecordInvalidArg("command", command);
    }

    m_config.insert(std::make_pair("command", command));

    // excluded_desktops

    std::vector<std::string> excluded_desktops;

    for (const auto& desktop : StringSplit(GetArgString("excluded_desktops", "COSMIC,GNOME,KDE,Plasma,XFCE,X-Cinnamon"), ",")) {
        std::string trimmed_desktop = TrimString(desktop);

        if (!trimmed_desktop.empty()) {
            excluded_desktops.push_back(trimmed_desktop);
        }
    }

    m_config.insert(std::make_pair("excluded_desktops", excluded_desktops));

    // debounce_delay

    double debounce_delay = 2.0;
    std::string debounce_delay_arg = GetArgString("debounce_delay", "2.0");

    try {
        debounce_delay = ParseStringToDouble(debounce_delay_arg);

        if (!IsValidDelaySeconds(debounce_delay)) {
            RecordInvalidArg("debounce_delay", debounce_delay_arg);
            debounce_delay = 2.0;
        }
    } catch (std::exception& e) {
        RecordInvalidArg("debounce_delay", debounce_delay_arg);
    }

    m_config.insert(std::make_pair("debounce_delay", debounce_delay));

    // log_level

    std::string log_level_arg = GetArgString("log_level", "INFO");
    std::optional<LogLevel> log_level = ParseLogLevel(log_level_arg);

    if (!log_level) {
        RecordInvalidArg("log_level", log_level_arg);
        log_level = LogLevel::INFO;
    }

    m_config.insert(std::make_pair("log_level", LogLevelToString(*log_level)));

    // wait_for_displays

    std::string wait_for_displays_arg = GetArgString("wait_for_displays", "true");
    std::optional<bool> wait_for_displays = ParseStringToBool(wait_for_displays_arg);

    if (!wait_for_displays) {
        RecordInvalidArg("wait_for_displays", wait_for_displays_arg);
        wait_for_displays = true;
    }

    m_config.insert(std::make_pair("wait_for_displays", *wait_for_displays));

    // display_settle_delay

    double display_settle_delay = 1.0;
    std::string display_settle_delay_arg = GetArgString("display_settle_delay", "1.0");

    try {
        display_settle_delay = ParseStringToDouble(display_settle_delay_arg);

        if (!IsValidDelaySeconds(display_settle_delay)) {
            RecordInvalidArg("display_settle_delay", display_settle_delay_arg);
            display_settle_delay = 1.0;
        }
    } catch (std::exception& e) {
        RecordInvalidArg("display_settle_delay", display_settle_delay_arg);
    }

    m_config.insert(std::make_pair("display_settle_delay", display_settle_delay));

    // display_ready_timeout

    double display_ready_timeout = 5.0;
    std::string display_ready_timeout_arg = GetArgString("display_ready_timeout", "5.0");

    try {
        display_ready_timeout = ParseStringToDouble(display_ready_timeout_arg);

        if (!IsValidDelaySeconds(display_ready_timeout)) {
            RecordInvalidArg("display_ready_timeout", display_ready_timeout_arg);
            display_ready_timeout = 5.0;
        }
    } catch (std::exception& e) {
        RecordInvalidArg("display_ready_timeout", display_ready_timeout_arg);
    }

    m_config.insert(std::make_pair("display_ready_timeout", display_ready_timeout));

    // display_poll_interval_ms

    int display_poll_interval_ms = 200;
    std::string display_poll_interval_ms_arg = GetArgString("display_poll_interval_ms", "200");

    try {
        display_poll_interval_ms = ParseStringToInt(display_poll_interval_ms_arg);

        if (display_poll_interval_ms <= 0) {
            RecordInvalidArg("display_poll_interval_ms", display_poll_interval_ms_arg);
            display_poll_interval_ms = 200;
        }
    } catch (std::exception& e) {
        RecordInvalidArg("display_poll_interval_ms", display_poll_interval_ms_arg);
    }

    m_config.insert(std::make_pair("display_poll_interval_ms", display_poll_interval_ms));

    // startup_delay

    int startup_delay = 0;
    std::string startup_delay_arg = GetArgString("startup_delay", "0");

    try {
        startup_delay = ParseStringToInt(startup_delay_arg);

        if (startup_delay < 0) {
            RecordInvalidArg("startup_delay", startup_delay_arg);
            startup_delay = 0;
        }
    } catch (std::exception& e) {
        RecordInvalidArg("startup_delay", startup_delay_arg);
    }

    m_config.insert(std::make_pair("startup_delay", startup_delay));
}

// Class DeviceEvent

DeviceEvent::DeviceEvent()
    : m_subsystem()
    , m_action(UNKNOWN)
    , m_device_node()
    , m_sys_name()
{}

DeviceEvent::DeviceEvent(std::string subsystem,
                         Action action,
                         std::optional<std::string> device_node,
                         std::string sys_name)
    : m_subsystem(std::move(subsystem))
    , m_action(action)
    , m_device_node(std::move(device_node))
    , m_sys_name(std::move(sys_name))
{}

DeviceEvent::Action DeviceEvent::ActionFromString(const std::string& action_str)
{
    if (action_str == "add") {
        return ADD;
    } else if (action_str == "remove") {
        return REMOVE;
    } else if (action_str == "change") {
        return CHANGE;
    }

    return UNKNOWN;
}

std::string DeviceEvent::ActionToString(const Action& action)
{
    std::string out;

    switch (action) {
    case UNKNOWN:
        out = "unknown";
        break;
    case ADD:
        out = "add";
        break;
    case REMOVE:
        out = "remove";
        break;
    case CHANGE:
        out = "change";
        break;
    }

    return out;
}

std::string DeviceEvent::ActionToString() const
{
    return ActionToString(m_action);
}

bool DeviceEvent::IsDisplayEvent() const
{
    return m_subsystem == EventSource::DISPLAY_SUBSYSTEM;
}

std::string DeviceEvent::ToString() const
{
    return m_subsystem + ":" + ActionToString() + ":" + m_sys_name + ":" + m_device_node.value_or("none");
}

// Class EventSource

EventSource::EventSource()
    : m_discarded_event_count(0)
{}

void EventSource::Interrupt()
{}

std::optional<DeviceEvent> EventSource::NextEvent(const std::chrono::milliseconds& timeout)
{
    std::optional<DeviceEvent> event = ReadEvent(timeout);

    if (event && !event->IsDisplayEvent()) {
        ++m_discarded_event_count;

        debug_log("INFO: %s: discarding event from subsystem \"%s\"",
                  __func__,
                  event->m_subsystem);

        return std::nullopt;
    }

    return event;
}

int64_t EventSource::GetDiscardedEventCount() const
{
    return m_discarded_event_count.load();
}

// Class DebounceTimer

DebounceTimer::DebounceTimer(duration delay, std::function<void()> on_fire)
    : m_deadline()
    , m_interrupt_debounce_timer(false)
    , m_firing(false)
    , m_fire_count(0)
    , m_delay(delay < duration::zero() ? duration::zero() : delay)
    , m_on_fire(std::move(on_fire))
{}

DebounceTimer::~DebounceTimer()
{
    Stop();
}

void DebounceTimer::Start()
{
    std::unique_lock<std::mutex> lock(mtx_debounce_timer);

    if (m_debounce_timer_thread.joinable()) {
        debug_log("INFO: %s: debounce timer thread already started.",
                  __func__);
        return;
    }

    m_interrupt_debounce_timer = false;

    try {
        m_debounce_timer_thread = std::thread(&DebounceTimer::DebounceTimerThread, this);
    } catch (const std::system_error& e) {
        throw ThreadException(std::string("Failed to start debounce timer thread: ") + e.what());
    }
}

void DebounceTimer::Arm(const time_point& now)
{
    {
        std::unique_lock<std::mutex> lock(mtx_debounce_timer);

        m_deadline = now + m_delay;
    }

    cv_debounce_timer.notify_all();
}

void DebounceTimer::Cancel()
{
    bool cancelled = false;

    {
        std::unique_lock<std::mutex> lock(mtx_debounce_timer);

        cancelled = m_deadline.has_value();
        m_deadline.reset();
    }

    cv_debounce_timer.notify_all();

    if (cancelled) {
        debug_log("INFO: %s: pending countdown cancelled.",
                  __func__);
    }
}

void DebounceTimer::Stop()
{
    {
        std::unique_lock<std::mutex> lock(mtx_debounce_timer);

        m_deadline.reset();
        m_interrupt_debounce_timer = true;
    }

    cv_debounce_timer.notify_all();

    if (m_debounce_timer_thread.joinable() && m_debounce_timer_thread.get_id() != std::this_thread::get_id()) {
        m_debounce_timer_thread.join();
    }
}

bool DebounceTimer::IsPending() const
{
    std::unique_lock<std::mutex> lock(mtx_debounce_timer);

    return m_deadline.has_value();
}

bool DebounceTimer::IsFiring() const
{
    return m_firing.load();
}

int64_t DebounceTimer::GetFireCount() const
{
    return m_fire_count.load();
}

DebounceTimer::duration DebounceTimer::GetDelay() const
{
    return m_delay;
}

void DebounceTimer::DebounceTimerThread()
{
    debug_log("INFO: %s: started",
              __func__);

    std::unique_lock<std::mutex> lock(mtx_debounce_timer);

    while (!m_interrupt_debounce_timer.load()) {
        if (!m_deadline) {
            cv_debounce_timer.wait(lock, [this]{ return m_interrupt_debounce_timer.load() || m_deadline.has_value(); });
            continue;
        }

        time_point deadline = *m_deadline;

        if (std::chrono::steady_clock::now() < deadline) {
            // Wakes on timeout, or early on Arm(), Cancel() or Stop(). Either way the deadline is re-evaluated.
            cv_debounce_timer.wait_until(lock, deadline);
            continue;
        }

        m_deadline.reset();
        m_firing = true;
        ++m_fire_count;

        lock.unlock();

        try {
            if (m_on_fire) {
                m_on_fire();
            }
        } catch (std::exception& e) {
            error_log("%s: debounce fire callback failed: %s",
                      __func__,
                      e.what());
        }

        lock.lock();

        m_firing = false;
    }

    debug_log("INFO: %s: exiting",
              __func__);
}

// Exclusion filter and collaborators

std::optional<std::string> ScreenWatch::FindExcludedDesktop(const std::string& current_desktop,
                                                            const std::set<std::string>& excluded_desktops)
{
    std::string desktop = TrimString(current_desktop);

    if (desktop.empty() || excluded_desktops.empty()) {
        return std::nullopt;
    }

    std::set<std::string> excluded_lower;

    for (const auto& excluded_desktop : excluded_desktops) {
        excluded_lower.insert(ToLower(TrimString(excluded_desktop)));
    }

    for (const auto& component : StringSplit(desktop, ":")) {
        std::string name = TrimString(component);

        if (!name.empty() && excluded_lower.count(ToLower(name)) > 0) {
            return name;
        }
    }

    return std::nullopt;
}

bool ScreenWatch::ShouldExclude(const std::string& current_desktop, const std::set<std::string>& excluded_desktops)
{
    return FindExcludedDesktop(current_desktop, excluded_desktops).has_value();
}

std::optional<std::string> ScreenWatch::GetCurrentDesktop()
{
    for (const auto& var : {"XDG_CURRENT_DESKTOP", "XDG_SESSION_DESKTOP", "DESKTOP_SESSION"}) {
        std::optional<std::string> value = GetEnvVariable(var);

        if (value && !TrimString(*value).empty()) {
            debug_log("INFO: %s: Detected desktop environment from %s: %s",
                      __func__,
                      var,
                      TrimString(*value));

            return TrimString(*value);
        }
    }

    debug_log("INFO: %s: No desktop environment detected",
              __func__);

    return std::nullopt;
}

int ScreenWatch::CountConnectedDisplays(const fs::path& drm_class_path)
{
    int connected = 0;

    for (const auto& connector : FindDirEntriesWithWildcard(drm_class_path, "card[0-9]+-.+")) {
        std::ifstream status_file(connector / "status");

        if (!status_file.is_open()) {
            continue;
        }

        std::string status;
        std::getline(status_file, status);

        if (TrimString(status) == "connected") {
            ++connected;
        }
    }

    debug_log("INFO: %s: %i connected display(s) found under %s",
              __func__,
              connected,
              drm_class_path);

    return connected;
}

bool ScreenWatch::WaitForStartupDelay(const sigset_t& mask,
                                      const std::chrono::seconds& delay,
                                      const std::function<bool(int)>& handle_signal)
{
    auto deadline = std::chrono::steady_clock::now() + delay;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(deadline - std::chrono::steady_clock::now());

        if (remaining <= std::chrono::nanoseconds::zero()) {
            return true;
        }

        struct timespec timeout;
        timeout.tv_sec = static_cast<time_t>(remaining.count() / 1000000000);
        timeout.tv_nsec = static_cast<long>(remaining.count() % 1000000000);

        int sig = sigtimedwait(&mask, nullptr, &timeout);

        if (sig == -1) {
            if (errno == EAGAIN) {
                return true;
            }

            if (errno == EINTR) {
                continue;
            }

            error_log("%s: sigtimedwait() failed: %s",
                      __func__,
                      strerror(errno));
            return true;
        }

        if (handle_signal && handle_signal(sig)) {
            return false;
        }
    }
}

// Class MonitorLoop

MonitorLoop::MonitorLoop(Settings settings,
                         EventSource& event_source,
                         CommandExecutor& executor,
                         DesktopIdentifier desktop_identifier,
                         DisplayCounter display_counter,
                         FatalHandler fatal_handler)
    : m_settings(std::move(settings))
    , m_event_source(event_source)
    , m_executor(executor)
    , m_desktop_identifier(std::move(desktop_identifier))
    , m_display_counter(std::move(display_counter))
    , m_fatal_handler(std::move(fatal_handler))
    , m_debounce_timer(std::chrono::duration_cast<DebounceTimer::duration>(
                           std::chrono::duration<double>(ClampDelaySeconds(m_settings.m_debounce_seconds))),
                       [this]() { OnDebounceFire(); })
    , m_state(STARTING)
    , m_interrupt_monitor_loop(false)
    , m_last_result()
    , m_event_count(0)
    , m_fire_count(0)
    , m_execution_count(0)
{}

MonitorLoop::~MonitorLoop()
{
    Stop();
}

bool MonitorLoop::Start()
{
    if (m_state.load() != STARTING) {
        error_log("%s: Monitor loop cannot be started from state %s.",
                  __func__,
                  StateToString());
        return false;
    }

    log("INFO: %s: Starting screen monitor",
        __func__);

    log("INFO: %s: Command to execute: %s",
        __func__,
        m_settings.m_command);

    log("INFO: %s: Debounce delay: %.1f seconds, excluded desktops: %s",
        __func__,
        m_settings.m_debounce_seconds,
        m_settings.ExcludedDesktopsToString());

    try {
        m_event_source.Subscribe();
    } catch (EventBusException& e) {
        error_log("%s: Unable to subscribe to device events: %s",
                  __func__,
                  e.what());

        m_state = STOPPED;
        return false;
    }

    try {
        m_debounce_timer.Start();

        m_state = RUNNING;

        m_event_thread = std::thread(&MonitorLoop::EventThread, this);
    } catch (ThreadException& e) {
        error_log("%s: Error creating debounce timer thread: %s",
                  __func__,
                  e.what());

        m_state = STOPPED;
    } catch (std::system_error& e) {
        error_log("%s: Error creating event thread: %s",
                  __func__,
                  e.what());

        m_state = STOPPED;
    }

    if (m_state.load() == STOPPED) {
        m_debounce_timer.Stop();
        m_event_source.Unsubscribe();
        return false;
    }

    log("INFO: %s: Monitoring for screen connection/disconnection events...",
        __func__);

    return true;
}

void MonitorLoop::Stop()
{
    State expected = RUNNING;
    bool graceful = m_state.compare_exchange_strong(expected, STOPPING);

    if (graceful) {
        log("INFO: %s: Stopping screen monitor",
            __func__);
    }

    {
        std::unique_lock<std::mutex> lock(mtx_monitor_loop);

        m_interrupt_monitor_loop = true;
    }

    cv_monitor_loop.notify_all();

    m_debounce_timer.Cancel();
    m_event_source.Interrupt();

    if (m_event_thread.joinable() && m_event_thread.get_id() != std::this_thread::get_id()) {
        m_event_thread.join();
    }

    // The event thread may have re-armed between the first cancel and its exit.
    m_debounce_timer.Cancel();

    m_event_source.Unsubscribe();

    // Waits for a command in flight to run to completion.
    m_debounce_timer.Stop();

    m_state = STOPPED;

    if (graceful) {
        log("INFO: %s: Screen monitor stopped",
            __func__);
    }
}

MonitorLoop::State MonitorLoop::GetState() const
{
    return m_state.load();
}

std::string MonitorLoop::StateToString(const State& state)
{
    std::string out;

    switch (state) {
    case STARTING:
        out = "STARTING";
        break;
    case RUNNING:
        out = "RUNNING";
        break;
    case STOPPING:
        out = "STOPPING";
        break;
    case STOPPED:
        out = "STOPPED";
        break;
    }

    return out;
}

std::string MonitorLoop::StateToString() const
{
    return StateToString(m_state.load());
}

const Settings& MonitorLoop::GetSettings() const
{
    return m_settings;
}

int64_t MonitorLoop::GetEventCount() const
{
    return m_event_count.load();
}

int64_t MonitorLoop::GetFireCount() const
{
    return m_fire_count.load();
}

int64_t MonitorLoop::GetExecutionCount() const
{
    return m_execution_count.load();
}

std::optional<ExecutionResult> MonitorLoop::GetLastResult() const
{
    std::unique_lock<std::mutex> lock(mtx_last_result);

    return m_last_result;
}

void MonitorLoop::EventThread()
{
    debug_log("INFO: %s: started",
              __func__);

    while (!m_interrupt_monitor_loop.load()) {
        std::optional<DeviceEvent> event;

        try {
            event = m_event_source.NextEvent(std::chrono::seconds(1));
        } catch (EventBusException& e) {
            error_log("%s: Lost connection to the device event bus: %s",
                      __func__,
                      e.what());

            m_debounce_timer.Cancel();
            m_state = STOPPED;

            if (m_fatal_handler) {
                m_fatal_handler(1);
            }

            break;
        }

        if (!event || m_interrupt_monitor_loop.load()) {
            continue;
        }

        ++m_event_count;

        debug_log("INFO: %s: Device event: %s on %s (%s)",
                  __func__,
                  event->ActionToString(),
                  event->m_sys_name,
                  event->m_device_node.value_or("no device node"));

        m_debounce_timer.Arm(std::chrono::steady_clock::now());
    }

    debug_log("INFO: %s: exiting",
              __func__);
}

void MonitorLoop::OnDebounceFire()
{
    if (m_state.load() != RUNNING || m_interrupt_monitor_loop.load()) {
        debug_log("INFO: %s: monitor loop is %s, ignoring fire.",
                  __func__,
                  StateToString());
        return;
    }

    ++m_fire_count;

    log("INFO: %s: Display change settled after %.1f second debounce.",
        __func__,
        m_settings.m_debounce_seconds);

    if (m_settings.m_wait_for_displays && m_display_counter) {
        WaitForDisplays();
    }

    if (m_interrupt_monitor_loop.load()) {
        log("INFO: %s: Stop requested while waiting for displays, not running command.",
            __func__);
        return;
    }

    // Queried on every fire so that a desktop switch is honored without a restart.
    std::optional<std::string> desktop;

    if (m_desktop_identifier) {
        desktop = m_desktop_identifier();
    }

    if (desktop) {
        std::optional<std::string> matched = FindExcludedDesktop(*desktop, m_settings.m_excluded_desktops);

        if (matched) {
            log("INFO: %s: Desktop environment '%s' is excluded (matched '%s'), not running command.",
                __func__,
                *desktop,
                *matched);
            return;
        }

        debug_log("INFO: %s: Desktop environment '%s' is not excluded.",
                  __func__,
                  *desktop);
    } else {
        debug_log("INFO: %s: No desktop environment detected, not excluded.",
                  __func__);
    }

    log("INFO: %s: Executing command: %s",
        __func__,
        m_settings.m_command);

    ExecutionResult result = m_executor.Run(m_settings.m_command);

    ++m_execution_count;

    {
        std::unique_lock<std::mutex> lock(mtx_last_result);

        m_last_result = result;
    }

    LogExecutionResult(m_settings.m_command, result);
}

bool MonitorLoop::WaitForDisplays()
{
    debug_log("INFO: %s: Waiting for displays to be ready.",
              __func__);

    std::chrono::milliseconds waited = SecondsToMilliseconds(m_settings.m_display_settle_seconds);
    std::chrono::milliseconds timeout = SecondsToMilliseconds(m_settings.m_display_ready_timeout_seconds);
    std::chrono::milliseconds interval(m_settings.m_display_poll_interval_ms);

    // Give the kernel and the display server time to register the connectors.
    if (!InterruptibleSleep(waited)) {
        return false;
    }

    while (true) {
        int connected = m_display_counter();

        if (connected > 0) {
            debug_log("INFO: %s: Detected %i connected display(s) after %lld ms.",
                      __func__,
                      connected,
                      static_cast<long long>(waited.count()));
            return true;
        }

        if (waited >= timeout) {
            break;
        }

        if (!InterruptibleSleep(interval)) {
            return false;
        }

        waited += interval;
    }

    debug_log("INFO: %s: No connected display detected after %lld ms, continuing.",
              __func__,
              static_cast<long long>(waited.count()));

    return false;
}

bool MonitorLoop::InterruptibleSleep(const std::chrono::milliseconds& duration)
{
    std::unique_lock<std::mutex> lock(mtx_monitor_loop);

    return !cv_monitor_loop.wait_for(lock, duration, [this]{ return m_interrupt_monitor_loop.load(); });
}

void MonitorLoop::LogExecutionResult(const std::string& command, const ExecutionResult& result) const
{
    switch (result.m_status) {
    case ExecutionResult::EXITED:
        if (result.m_exit_code == 0) {
            log("INFO: %s: Command executed successfully in %lld ms",
                __func__,
                static_cast<long long>(result.m_duration_ms));
        } else {
            warning_log("%s: Command '%s' failed with return code %i after %lld ms",
                        __func__,
                        command,
                        result.m_exit_code,
                        static_cast<long long>(result.m_duration_ms));
        }
        break;
    case ExecutionResult::SIGNALED:
        warning_log("%s: Command '%s' was terminated by signal %i after %lld ms",
                    __func__,
                    command,
                    result.m_exit_code - 128,
                    static_cast<long long>(result.m_duration_ms));
        break;
    case ExecutionResult::LAUNCH_FAILED:
        error_log("%s: Command '%s' could not be launched: %s",
                  __func__,
                  command,
                  result.m_error_message);
        break;
    }

    if (result.m_stdout_snippet) {
        debug_log("INFO: %s: Output: %s",
                  __func__,
                  *result.m_stdout_snippet);
    }

    if (result.m_stderr_snippet) {
        if (result.IsSuccess()) {
            debug_log("INFO: %s: Error output: %s",
                      __func__,
                      *result.m_stderr_snippet);
        } else {
            warning_log("%s: Error output: %s",
                        __func__,
                        *result.m_stderr_snippet);
        }
    }
}
