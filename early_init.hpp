#pragma once

#include <string>
#include <vector>

#include "types.hpp"
#include "logger.hpp"

// Modules probed before anything else, in load order.
extern const std::vector<std::string> kEssentialModules;
// USB host controller drivers, oldest first.
extern const std::vector<std::string> kHostControllerModules;

bool mount_pseudo_filesystems();

// Returns the number of modules that failed to load.
int load_kernel_modules(const settings_t &settings);

bool wait_for_usb(int settle_seconds);

void setup_acpi(const settings_t &settings);

// Sets up the FILE log sink when logging is enabled.
bool setup_logging(const settings_t &settings, log_level_t level);

// True when word is a separate argument on the kernel command line.
bool kernel_cmdline_has(const std::string &word, const std::string &cmdline_path = "/proc/cmdline");
