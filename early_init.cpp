#include "early_init.hpp"

#include <chrono>
#include <sstream>
#include <thread>

#include <errno.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/stat.h>

#include "utils.hpp"
#include "log.hpp"

const std::vector<std::string> kEssentialModules = {
    "unix",
    "acpi",
    "thermal",
    "processor",
    "fan",
    "battery",
    "ac",
    "button",
    "backlight",
    "video",
    "usbcore",
    "usb_common",
    "hid",
    "hid_generic",
};

const std::vector<std::string> kHostControllerModules = {
    "uhci_hcd",
    "ohci_hcd",
    "ohci_pci",
    "ehci_hcd",
    "ehci_pci",
    "xhci_hcd",
    "xhci_pci",
};

namespace {

typedef struct {
    const char *source;
    const char *target;
    const char *fstype;
} pseudo_fs_t;

const pseudo_fs_t kPseudoFilesystems[] = {
    { "proc", "/proc", "proc" },
    { "sysfs", "/sys", "sysfs" },
    { "devtmpfs", "/dev", "devtmpfs" },
};

bool load_module(const std::string &module) {
    if (!run_command("modprobe -q " + module + " 2>/dev/null")) {
        LOG_DEBUG("Failed to load %s", module.c_str());
        return false;
    }
    return true;
}

}

bool mount_pseudo_filesystems() {
    bool ok = true;
    for (const auto &fs : kPseudoFilesystems) {
        if (mkdir(fs.target, 0755) != 0 && errno != EEXIST) {
            LOG_ERROR("Could not create %s: '%s' (%d)", fs.target, strerror(errno), errno);
            ok = false;
            continue;
        }
        if (mount(fs.source, fs.target, fs.fstype, 0, nullptr) != 0) {
            if (errno == EBUSY) {
                LOG_DEBUG("%s already mounted", fs.target);
                continue;
            }
            LOG_ERROR("Mounting %s on %s failed: '%s' (%d)",
                    fs.fstype, fs.target, strerror(errno), errno);
            ok = false;
        }
    }
    return ok;
}

int load_kernel_modules(const settings_t &settings) {
    int failed = 0;
    LOG_INFO("Loading essential kernel modules...");
    for (const auto &m : kEssentialModules) {
        if (!load_module(m)) {
            ++failed;
        }
    }

    LOG_INFO("Loading USB host controller modules...");
    for (const auto &m : kHostControllerModules) {
        if (!load_module(m)) {
            ++failed;
        }
    }

    std::stringstream extra(settings.extra_modules);
    std::string m;
    while (extra >> m) {
        LOG_INFO("Loading extra module %s", m.c_str());
        if (!load_module(m)) {
            LOG_WARNING("Failed to load %s", m.c_str());
            ++failed;
        }
    }
    return failed;
}

bool wait_for_usb(int settle_seconds) {
    LOG_INFO("Waiting for USB subsystem to initialize...");
    std::this_thread::sleep_for(std::chrono::seconds(settle_seconds));

    if (is_directory("/sys/bus/usb/devices")) {
        return true;
    }

    LOG_WARNING("USB subsystem not detected. Reloading host controller modules...");
    for (auto it = kHostControllerModules.rbegin(); it != kHostControllerModules.rend(); ++it) {
        (void)run_command("modprobe -q -r " + *it + " 2>/dev/null");
    }
    std::this_thread::sleep_for(std::chrono::seconds(1));
    for (const auto &m : kHostControllerModules) {
        (void)load_module(m);
    }
    std::this_thread::sleep_for(std::chrono::seconds(2));

    if (!is_directory("/sys/bus/usb/devices")) {
        LOG_ERROR("USB subsystem still missing, USB ports may not stay powered.");
        return false;
    }
    return true;
}

void setup_acpi(const settings_t &settings) {
    if (!settings.handle_acpi) {
        return;
    }
    (void)load_module("acpi_button");
    (void)load_module("button");

    const auto acpid = find_executable("acpid");
    if (acpid.empty()) {
        LOG_DEBUG("acpid not available");
        return;
    }
    if (run_command(acpid)) {
        LOG_INFO("ACPI daemon started");
    } else {
        LOG_WARNING("Could not start %s", acpid.c_str());
    }
}

bool setup_logging(const settings_t &settings, log_level_t level) {
    if (!settings.enable_logging) {
        return true;
    }
    const auto slash = settings.log_file.rfind('/');
    if (slash != std::string::npos && slash > 0) {
        (void)make_dirs(settings.log_file.substr(0, slash));
    }
    if (!logger_setup_file(settings.log_file.c_str(), level)) {
        return false;
    }
    LOG_INFO("GrubPower logging started");
    return true;
}

bool kernel_cmdline_has(const std::string &word, const std::string &cmdline_path) {
    std::stringstream ss(get_line_from_file(cmdline_path));
    std::string arg;
    while (ss >> arg) {
        if (arg == word) {
            return true;
        }
    }
    return false;
}
