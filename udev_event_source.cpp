/*
 * Copyright (C) 2025 James C. Owens
 *
 * This code is licensed under the MIT license. See LICENSE.md in the repository.
 */

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <libudev.h>

#include <screenwatch.h>

using namespace ScreenWatch;

// Class UdevEventSource

UdevEventSource::UdevEventSource()
    : m_udev(nullptr)
    , m_monitor(nullptr)
    , m_subscribed(false)
{
    m_interrupt_pipe_fd[0] = -1; // read end
    m_interrupt_pipe_fd[1] = -1; // write end
}

UdevEventSource::~UdevEventSource()
{
    Unsubscribe();
}

void UdevEventSource::Subscribe()
{
    std::unique_lock<std::mutex> lock(mtx_udev_event_source);

    if (m_subscribed.load()) {
        debug_log("INFO: %s: already subscribed.",
                  __func__);
        return;
    }

    if (pipe2(m_interrupt_pipe_fd, O_CLOEXEC | O_NONBLOCK) == -1) {
        throw EventBusException(std::string("Failed to create interrupt pipe: ") + strerror(errno));
    }

    m_udev = udev_new();

    if (m_udev == nullptr) {
        Cleanup();
        throw EventBusException("Failed to create udev context.");
    }

    m_monitor = udev_monitor_new_from_netlink(m_udev, "udev");

    if (m_monitor == nullptr) {
        Cleanup();
        throw EventBusException("Failed to create udev netlink monitor.");
    }

    int rc = udev_monitor_filter_add_match_subsystem_devtype(m_monitor, DISPLAY_SUBSYSTEM, nullptr);

    if (rc < 0) {
        Cleanup();
        throw EventBusException(std::string("Failed to add drm subsystem filter to udev monitor: ") + strerror(-rc));
    }

    rc = udev_monitor_enable_receiving(m_monitor);

    if (rc < 0) {
        Cleanup();
        throw EventBusException(std::string("Failed to enable receiving on udev monitor: ") + strerror(-rc));
    }

    m_subscribed = true;

    debug_log("INFO: %s: subscribed to udev events for subsystem %s, fd %i",
              __func__,
              DISPLAY_SUBSYSTEM,
              udev_monitor_get_fd(m_monitor));
}

void UdevEventSource::Unsubscribe()
{
    std::unique_lock<std::mutex> lock(mtx_udev_event_source);

    if (m_subscribed.load()) {
        debug_log("INFO: %s: unsubscribing from udev events.",
                  __func__);
    }

    Cleanup();
}

bool UdevEventSource::IsSubscribed() const
{
    return m_subscribed.load();
}

void UdevEventSource::Interrupt()
{
    std::unique_lock<std::mutex> lock(mtx_udev_event_source);

    if (m_interrupt_pipe_fd[1] == -1) {
        return;
    }

    char buf = 'X';
    ssize_t written = write(m_interrupt_pipe_fd[1], &buf, 1);

    if (written <= 0 && errno != EAGAIN) {
        error_log("%s: Failed to write to interrupt pipe: %s (%d)",
                  __func__,
                  strerror(errno),
                  errno);
    }
}

std::optional<DeviceEvent> UdevEventSource::ReadEvent(const std::chrono::milliseconds& timeout)
{
    if (!m_subscribed.load() || m_monitor == nullptr) {
        throw EventBusException("ReadEvent called without an active udev subscription.");
    }

    struct pollfd fds[2];
    fds[0].fd = udev_monitor_get_fd(m_monitor);
    fds[0].events = POLLIN;
    fds[1].fd = m_interrupt_pipe_fd[0];
    fds[1].events = POLLIN;

    int poll_ret = poll(fds, 2, static_cast<int>(timeout.count()));

    if (poll_ret < 0) {
        if (errno == EINTR) {
            return std::nullopt;
        }

        throw EventBusException(std::string("poll() on udev monitor failed: ") + strerror(errno));
    }

    if (poll_ret == 0) {
        return std::nullopt;
    }

    if (fds[1].revents & POLLIN) {
        char buf[8];
        [[maybe_unused]] ssize_t drain = read(m_interrupt_pipe_fd[0], buf, sizeof(buf));

        debug_log("INFO: %s: interrupted.",
                  __func__);

        return std::nullopt;
    }

    if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
        throw EventBusException("Error/hangup on udev monitor fd.");
    }

    if (!(fds[0].revents & POLLIN)) {
        return std::nullopt;
    }

    struct udev_device* device = udev_monitor_receive_device(m_monitor);

    if (device == nullptr) {
        // This can happen on a message from an unexpected sender or a dropped message, neither of which are fatal.
        debug_log("INFO: %s: udev_monitor_receive_device() returned no device: %s",
                  __func__,
                  strerror(errno));

        return std::nullopt;
    }

    const char* subsystem = udev_device_get_subsystem(device);
    const char* action = udev_device_get_action(device);
    const char* device_node = udev_device_get_devnode(device);
    const char* sys_name = udev_device_get_sysname(device);

    DeviceEvent event(subsystem != nullptr ? subsystem : "",
                      DeviceEvent::ActionFromString(action != nullptr ? action : ""),
                      device_node != nullptr ? std::optional<std::string>(device_node) : std::nullopt,
                      sys_name != nullptr ? sys_name : "");

    udev_device_unref(device);

    return event;
}

void UdevEventSource::Cleanup()
{
    if (m_monitor != nullptr) {
        udev_monitor_unref(m_monitor);
        m_monitor = nullptr;
    }

    if (m_udev != nullptr) {
        udev_unref(m_udev);
        m_udev = nullptr;
    }

    if (m_interrupt_pipe_fd[0] != -1) { close(m_interrupt_pipe_fd[0]); m_interrupt_pipe_fd[0] = -1; }
    if (m_interrupt_pipe_fd[1] != -1) { close(m_interrupt_pipe_fd[1]); m_interrupt_pipe_fd[1] = -1; }

    m_subscribed = false;
}
