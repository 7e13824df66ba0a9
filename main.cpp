#include <unistd.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <sys/reboot.h>
#include <poll.h>
#include <string.h>
#include <errno.h>
#include <stdlib.h>
#include <time.h>

#include <iostream>

#include "log.hpp"
#include "early_init.hpp"
#include "settings_handler.hpp"
#include "device_enumerator.hpp"
#include "battery_monitor.hpp"
#include "lid_sensor.hpp"
#include "usb_power.hpp"
#include "display_control.hpp"
#include "power_control.hpp"
#include "status_reporter.hpp"
#include "monitor.hpp"
#include "utils.hpp"

#ifndef GRUBPOWER_IMAGE_CONFIG
#define GRUBPOWER_IMAGE_CONFIG "/etc/grubpower.conf"
#endif

namespace {

// Seconds given to the host controllers to enumerate their ports.
constexpr int kUsbSettleSeconds = 3;

// PID 1 must never return; park here when nothing else is left to do.
[[noreturn]] void idle_forever() {
    for (;;) {
        pause();
    }
}

}

int main() {
    const bool is_init = (getpid() == 1);

    /* Enable breaking and signalling to loop */
    sigset_t sigset;
    sigemptyset(&sigset);
    sigaddset(&sigset, SIGINT);
    sigaddset(&sigset, SIGTERM);
    sigaddset(&sigset, SIGQUIT);
    sigaddset(&sigset, SIGHUP);
    sigprocmask(SIG_BLOCK, &sigset, NULL);

    const int signal_fd = signalfd(-1, &sigset, 0);

    setenv("PATH", "/sbin:/bin:/usr/sbin:/usr/bin", 0);

    logger_setup(log_type_t::PRINTF, log_level_t::INFO);
    LOG_INFO("GrubPower Advanced initializing...");

    LOG_INFO("Mounting essential filesystems...");
    if (!mount_pseudo_filesystems()) {
        LOG_WARNING("Some pseudo filesystems could not be mounted.");
    }

    const bool debug = kernel_cmdline_has("debug") || getenv("GRUBPOWER_DEBUG");
    const auto level = debug ? log_level_t::DEBUG : log_level_t::INFO;
    logger_set_level(level);

    SettingsHandler settings_handler;
    if (!settings_handler.loadFile(GRUBPOWER_IMAGE_CONFIG)) {
        LOG_WARNING("Configuration incomplete, defaults apply to the rest.");
    }
    const auto settings = settings_handler.getSettings();

    if (!setup_logging(settings, level)) {
        LOG_WARNING("Logging to console instead of %s", settings.log_file.c_str());
    }

    const int missing_modules = load_kernel_modules(settings);
    if (missing_modules > 0) {
        LOG_INFO("%d kernel module(s) not loaded (built in or unavailable).", missing_modules);
    }
    if (!wait_for_usb(kUsbSettleSeconds)) {
        LOG_WARNING("Continuing without a USB subsystem.");
    }
    setup_acpi(settings);

    UdevDeviceEnumerator enumerator;
    if (!enumerator.start()) {
        LOG_ERROR("Device enumeration unavailable, nothing to manage.");
    }

    BatteryMonitor bat_mon(enumerator);
    LidSensor lid_sensor(enumerator);
    UsbPowerEnabler usb_power(settings, enumerator);
    auto display = probe_display_control(enumerator);
    SystemPowerControl power(settings);
    StatusReporter status(settings, std::cout);

    Monitor monitor(settings, bat_mon, lid_sensor, usb_power, *display, power, status);
    auto loop_state = monitor.start(get_timestamp());

    status.printBanner();
    status.listUsbDevices(enumerator);

    LOG_INFO("Starting power and lid monitoring loop...");
    bool stop_application = false;
    do {
        struct pollfd fd = {.fd = signal_fd, .events = POLLIN, .revents = 0};
        int r = poll(&fd, signal_fd >= 0 ? 1 : 0, settings.poll_interval * 1000);

        // Got signal
        if (r > 0) {
            struct signalfd_siginfo fdsi;
            if (read(fd.fd, &fdsi, sizeof(struct signalfd_siginfo)) != sizeof(fdsi)) {
                continue;
            }

            switch(fdsi.ssi_signo) {
            case SIGINT:
            case SIGTERM:
            case SIGQUIT:
                stop_application = true;
                break;
            default:
                break;
            }
            continue;
        }

        if (r < 0) {
            if (errno != EINTR) {
                LOG_ERROR("Main loop poll failed: '%s' (%d).", strerror(errno), errno);
            }
            continue;
        }

        monitor.runCycle(loop_state, get_timestamp(), time(nullptr));

        if (loop_state.state == monitor_state_t::SHUTDOWN) {
            if (is_init) {
                idle_forever();
            }
            break;
        }
    } while (!stop_application);

    if (stop_application && is_init) {
        LOG_INFO("Interrupted, rebooting.");
        sync();
        if (reboot(RB_AUTOBOOT) != 0) {
            LOG_ERROR("reboot() failed: '%s' (%d)", strerror(errno), errno);
        }
        idle_forever();
    }

    LOG_INFO("Shutting down application.");

    return 0;
}
