#include "installer.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include <errno.h>
#include <string.h>
#include <stdlib.h>
#include <unistd.h>

#include "battery_monitor.hpp"
#include "early_init.hpp"
#include "grub_entry.hpp"
#include "initramfs_builder.hpp"
#include "kernel_locator.hpp"
#include "usb_power.hpp"
#include "utils.hpp"
#include "log.hpp"

#ifndef GRUBPOWER_VERSION
#define GRUBPOWER_VERSION "1.2.0"
#endif

#ifndef GRUBPOWER_INIT_BINARY
#define GRUBPOWER_INIT_BINARY "/usr/local/lib/grubpower/grubpower-init"
#endif

namespace {

bool remove_tree(const std::string &path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        LOG_ERROR("Could not remove %s: %s", path.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

bool remove_file(const std::string &path) {
    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        LOG_ERROR("Could not remove %s: '%s' (%d)", path.c_str(), strerror(errno), errno);
        return false;
    }
    return true;
}

// Undoes a failed installation step. Always returns false.
bool abort_install(RollbackStack &rollback) {
    if (!rollback.rollback()) {
        LOG_ERROR("Rollback incomplete, check the GRUB custom script and boot directory.");
    }
    return false;
}

// Timestamped backup name, suffixed when a backup of the same second exists.
std::string next_backup_path(const std::string &path) {
    const auto base = backup_path_for(path, time(nullptr));
    auto candidate = base;
    for (int n = 1; file_exists(candidate); ++n) {
        candidate = base + "." + std::to_string(n);
    }
    return candidate;
}

bool is_yes(const std::string &answer) {
    return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

}

installer_options_t default_installer_options() {
    return {
        .config_path = "/etc/grubpower.conf",
        .init_binary = GRUBPOWER_INIT_BINARY,
        .boot_dir = "/boot",
        .grub_d_dir = "/etc/grub.d",
        .modules_root = "/lib/modules",
        .assume_yes = false,
    };
}

std::string backup_path_for(const std::string &path, time_t when) {
    char stamp[32];
    struct tm tm_when;
    localtime_r(&when, &tm_when);
    strftime(stamp, sizeof(stamp), "%Y%m%d%H%M%S", &tm_when);
    return path + ".bak." + stamp;
}

Installer::Installer(installer_options_t options, DeviceEnumerator &enumerator,
                     std::istream &in, std::ostream &out)
    : mOptions(std::move(options))
    , mEnumerator(enumerator)
    , mIn(in)
    , mOut(out)
    , mSettings(mSettingsHandler.getSettings())
{
}

bool
Installer::loadConfig() {
    if (!file_exists(mOptions.config_path)) {
        LOG_INFO("Creating default configuration at %s...", mOptions.config_path.c_str());
        if (!mSettingsHandler.writeFile(mOptions.config_path)) {
            return false;
        }
        LOG_INFO("Configuration created. Edit %s to customize.", mOptions.config_path.c_str());
    }
    const bool ok = mSettingsHandler.loadFile(mOptions.config_path);
    mSettings = mSettingsHandler.getSettings();
    return ok;
}

bool
Installer::checkCompatibility() {
    LOG_INFO("Checking hardware compatibility...");

    auto usb = mEnumerator.usbDevices();
    if (usb.empty()) {
        LOG_WARNING("USB subsystem not detected in expected location.");
        if (askContinue("Load USB host controller modules?")) {
            for (const auto &m : kHostControllerModules) {
                if (run_command("modprobe -q " + m + " 2>/dev/null")) {
                    LOG_INFO("Loaded: %s", m.c_str());
                }
            }
            sleep(2);
            usb = mEnumerator.usbDevices();
        }
    }

    int control_files = 0;
    for (const auto &dev : usb) {
        if (file_exists(dev.syspath + "/power/control")) {
            ++control_files;
        }
    }
    if (control_files == 0) {
        LOG_WARNING("No USB power control interfaces found. This could be due to "
                "kernel configuration or hardware limitations.");
        if (!askContinue("Continue anyway?")) {
            return false;
        }
    } else {
        LOG_INFO("Found %d USB power control interface(s).", control_files);
    }

    if (!battery_present(mEnumerator.powerSupplies())) {
        LOG_WARNING("No battery detected. This tool is primarily designed for laptops.");
        if (!askContinue("Continue anyway?")) {
            return false;
        }
    }

    LOG_INFO("Compatibility check completed.");
    return true;
}

bool
Installer::testUsbPower() {
    LOG_INFO("Testing USB power management capabilities...");
    const int controlled = probe_usb_power_control(mEnumerator.usbDevices());
    if (controlled > 0) {
        LOG_INFO("SUCCESS: Successfully controlled power on %d USB device(s).", controlled);
        return true;
    }
    LOG_WARNING("USB power management test failed. GrubPower may not work correctly on this system.");
    return askContinue("Continue anyway?");
}

void
Installer::checkForUpdates() {
    mOut << "GrubPower version " << GRUBPOWER_VERSION << "\n";
    mOut << "No updates available (remote version check is not supported)\n";
}

void
Installer::interactiveSetup() {
    mOut << "GrubPower Interactive Setup\n"
         << "===========================\n";

    auto answer = prompt("Set battery threshold for auto-shutdown (default: " +
                         std::to_string(mSettings.min_battery) + "%): ");
    if (!answer.empty() && !updateSetting(settings_field::MIN_BATTERY, answer)) {
        mOut << "Invalid threshold, keeping " << mSettings.min_battery << "%\n";
    }

    mOut << "USB port selection options:\n"
         << "1) All USB ports\n"
         << "2) Charging ports only (if detectable)\n"
         << "3) Specific port numbers\n";
    answer = prompt("Select option (default: 1): ");
    if (answer == "2") {
        (void)updateSetting(settings_field::SELECT_PORTS, "charging");
    } else if (answer == "3") {
        const auto ports = prompt("Enter comma-separated port numbers (e.g., 1,2,4): ");
        if (!ports.empty()) {
            (void)updateSetting(settings_field::SELECT_PORTS, ports);
        }
    } else {
        (void)updateSetting(settings_field::SELECT_PORTS, "all");
    }

    answer = prompt("Enable logging? (y/n, default: n): ");
    (void)updateSetting(settings_field::ENABLE_LOGGING, is_yes(answer) ? "1" : "0");

    if (!saveConfig()) {
        LOG_WARNING("Interactive choices apply to this run only.");
    }
    mOut << "Configuration complete.\n";
}

bool
Installer::configure() {
    if (!loadConfig()) {
        LOG_WARNING("Configuration has invalid values, defaults were used for them.");
    }
    const char *editor = getenv("EDITOR");
    std::string tool = editor ? editor : "";
    for (const char *candidate : { "nano", "vi" }) {
        if (!tool.empty()) {
            break;
        }
        tool = find_executable(candidate);
    }
    if (tool.empty()) {
        LOG_WARNING("No text editor found. Please edit %s manually.", mOptions.config_path.c_str());
        return true;
    }
    return run_command(tool + " " + shell_quote(mOptions.config_path));
}

bool
Installer::detectSystem() {
    LOG_INFO("Detecting system configuration...");

    if (!file_exists(mSettings.kernel_path)) {
        LOG_INFO("Kernel not found at %s, searching for alternatives...", mSettings.kernel_path.c_str());
        auto kernel = find_kernel_image(mOptions.boot_dir, running_kernel_release());
        if (kernel.empty()) {
            LOG_ERROR("Could not detect kernel automatically.");
            const auto images = list_kernel_images(mOptions.boot_dir);
            for (size_t i = 0; i < images.size(); ++i) {
                mOut << "  " << (i + 1) << ". " << images[i] << "\n";
            }
            if (mOptions.assume_yes) {
                return false;
            }
            kernel = prompt("Please enter the full path to your kernel file: ");
            if (kernel.empty() || !file_exists(kernel)) {
                LOG_ERROR("Invalid kernel path. Set KERNEL_PATH in %s manually.",
                        mOptions.config_path.c_str());
                return false;
            }
        }
        LOG_INFO("Detected kernel: %s", kernel.c_str());
        (void)updateSetting(settings_field::KERNEL_PATH, kernel);
    }

    if (mSettings.grub_root == mSettingsHandler.getDefaultSettings().grub_root) {
        const auto root = grub_root_from_device(mount_source_for(mOptions.boot_dir));
        if (!root.empty() && root != mSettings.grub_root) {
            LOG_INFO("Detected GRUB root: %s", root.c_str());
            (void)updateSetting(settings_field::GRUB_ROOT, root);
        }
    }

    if (!file_exists(mSettings.grub_custom)) {
        auto custom = find_grub_custom_file(mOptions.grub_d_dir);
        if (custom.empty()) {
            LOG_WARNING("Could not locate GRUB custom file. Will create one.");
            custom = mOptions.grub_d_dir + "/40_custom";
            if (!create_grub_custom_file(custom)) {
                return false;
            }
        }
        (void)updateSetting(settings_field::GRUB_CUSTOM, custom);
    }

    return saveConfig();
}

bool
Installer::buildImage(RollbackStack &rollback) {
    const auto build_dir = mSettings.build_dir;
    rollback.push("remove " + build_dir, [build_dir]() { return remove_tree(build_dir); });

    InitramfsBuilder builder(mSettings, { .init_binary = mOptions.init_binary,
                                          .modules_root = mOptions.modules_root });
    const auto image = builder.imagePath();
    if (!file_exists(image)) {
        rollback.push("remove " + image, [image]() { return remove_file(image); });
    }

    auto release = kernel_release_from_image(mSettings.kernel_path);
    if (release.empty()) {
        release = running_kernel_release();
    }
    return builder.build(mSettingsHandler.serialize(), release);
}

bool
Installer::installEntries(RollbackStack &rollback) {
    if (!file_exists(mSettings.kernel_path)) {
        LOG_ERROR("Kernel not found at %s. Please correct the kernel path in %s",
                mSettings.kernel_path.c_str(), mOptions.config_path.c_str());
        return false;
    }
    const auto image = mSettings.output_dir + "/" + mSettings.initramfs_name;
    if (!file_exists(image)) {
        LOG_ERROR("Initramfs not found at %s", image.c_str());
        return false;
    }

    const auto custom = mSettings.grub_custom;
    std::string text;
    if (!read_text_file(custom, text)) {
        return false;
    }

    const auto backup = next_backup_path(custom);
    if (!copy_file(custom, backup)) {
        return false;
    }
    LOG_INFO("Backed up GRUB configuration to %s", backup.c_str());
    rollback.push("restore " + custom, [custom, backup]() { return copy_file(backup, custom); });

    if (!list_menu_entries(text).empty()) {
        LOG_INFO("Replacing existing GrubPower entries.");
        text = remove_all_menu_entries(text);
    }

    LOG_INFO("Using kernel: %s", mSettings.kernel_path.c_str());
    LOG_INFO("Using initramfs: %s", image.c_str());
    text += make_menu_entry(mSettings);
    text += make_recovery_entry();
    return write_text_file(custom, text);
}

bool
Installer::removeEntries(bool remove_all) {
    const auto custom = mSettings.grub_custom;
    if (!file_exists(custom)) {
        LOG_WARNING("GRUB custom configuration file not found at %s", custom.c_str());
        return false;
    }

    std::string text;
    if (!read_text_file(custom, text)) {
        return false;
    }
    const auto titles = list_menu_entries(text);
    if (titles.empty()) {
        LOG_INFO("No GrubPower GRUB entries found.");
        return false;
    }

    std::string result;
    if (remove_all) {
        result = remove_all_menu_entries(text);
    } else {
        mOut << "Found " << titles.size() << " GrubPower entries:\n";
        for (size_t i = 0; i < titles.size(); ++i) {
            mOut << (i + 1) << ". " << titles[i] << "\n";
        }
        mOut << "Enter the numbers of entries you want to remove (e.g., 1 2 3),\n"
             << "or 'all' to remove all entries, or 'none' to keep all entries.\n";
        const auto choice = prompt("Your choice: ");
        if (choice == "all") {
            result = remove_all_menu_entries(text);
        } else if (choice.empty() || choice == "none") {
            LOG_INFO("No entries removed.");
            return false;
        } else {
            std::vector<size_t> indexes;
            for (const auto &token : split(choice, ' ')) {
                const int n = atoi(token.c_str());
                if (n < 1 || static_cast<size_t>(n) > titles.size()) {
                    LOG_WARNING("Invalid entry number: %s - skipping", token.c_str());
                    continue;
                }
                indexes.push_back(n - 1);
            }
            if (indexes.empty()) {
                return false;
            }
            result = remove_menu_entries(text, indexes);
        }
    }

    const auto backup = next_backup_path(custom);
    if (!copy_file(custom, backup)) {
        return false;
    }
    LOG_INFO("Created backup of GRUB configuration at %s", backup.c_str());
    return write_text_file(custom, result);
}

bool
Installer::fullInstall(bool interactive) {
    LOG_INFO("Starting GrubPower Advanced installation...");
    checkForUpdates();

    if (!checkCompatibility() || !testUsbPower()) {
        LOG_ERROR("Installation aborted.");
        return false;
    }
    if (!loadConfig()) {
        LOG_WARNING("Configuration has invalid values, defaults were used for them.");
    }
    if (interactive) {
        interactiveSetup();
    }
    if (!detectSystem()) {
        LOG_ERROR("Installation aborted.");
        return false;
    }

    RollbackStack rollback;
    if (!buildImage(rollback) || !installEntries(rollback)) {
        LOG_ERROR("Installation failed. Rolling back changes...");
        return abort_install(rollback);
    }
    if (!regenerateGrubConfig()) {
        LOG_WARNING("Entries were added but grub.cfg was not regenerated.");
    }
    rollback.commit();
    cleanup();

    mOut << "\n====================================\n"
         << "GrubPower Advanced installation complete!\n\n"
         << "To use:\n"
         << "1. Reboot your computer\n"
         << "2. At the GRUB menu, select '" << kMenuEntryTitle << "'\n"
         << "3. Your USB ports should remain powered\n\n"
         << "Configuration file: " << mOptions.config_path << "\n"
         << "Kernel path: " << mSettings.kernel_path << "\n"
         << "Initramfs location: " << mSettings.output_dir << "/" << mSettings.initramfs_name << "\n\n"
         << "NOTE: Battery will drain while in this mode.\n";
    if (mSettings.min_battery > 0) {
        mOut << "      The system will shut down when battery reaches " << mSettings.min_battery << "%.\n";
    }
    mOut << "      '" << kRecoveryEntryTitle << "' boots the regular menu after 30 seconds.\n"
         << "====================================\n";
    return true;
}

bool
Installer::buildOnly() {
    if (!loadConfig()) {
        LOG_WARNING("Configuration has invalid values, defaults were used for them.");
    }
    if (!detectSystem()) {
        return false;
    }
    RollbackStack rollback;
    if (!buildImage(rollback)) {
        return abort_install(rollback);
    }
    rollback.commit();
    cleanup();
    return true;
}

bool
Installer::installOnly() {
    if (!loadConfig()) {
        LOG_WARNING("Configuration has invalid values, defaults were used for them.");
    }
    if (!detectSystem()) {
        return false;
    }
    RollbackStack rollback;
    if (!installEntries(rollback)) {
        return abort_install(rollback);
    }
    if (!regenerateGrubConfig()) {
        LOG_WARNING("Entries were added but grub.cfg was not regenerated.");
    }
    rollback.commit();
    return true;
}

bool
Installer::uninstall(bool remove_all) {
    LOG_INFO("Uninstalling GrubPower...");
    if (file_exists(mOptions.config_path) && !mSettingsHandler.loadFile(mOptions.config_path)) {
        LOG_WARNING("Configuration has invalid values, defaults were used for them.");
    }
    mSettings = mSettingsHandler.getSettings();

    bool ok = true;
    const auto image = mSettings.output_dir + "/" + mSettings.initramfs_name;
    if (file_exists(image)) {
        ok = remove_file(image) && ok;
        LOG_INFO("Removed initramfs from %s", image.c_str());
    }
    if (is_directory(mSettings.build_dir)) {
        ok = remove_tree(mSettings.build_dir) && ok;
        LOG_INFO("Removed build directory: %s", mSettings.build_dir.c_str());
    }

    if (removeEntries(remove_all) && !regenerateGrubConfig()) {
        LOG_WARNING("Please regenerate grub.cfg manually.");
    }

    if (file_exists(mOptions.config_path)) {
        if (askContinue("Do you want to remove the GrubPower configuration file?")) {
            ok = remove_file(mOptions.config_path) && ok;
            LOG_INFO("Removed configuration file %s", mOptions.config_path.c_str());
        } else {
            LOG_INFO("Configuration file kept at %s", mOptions.config_path.c_str());
        }
    }

    LOG_INFO("GrubPower uninstallation completed.");
    return ok;
}

bool
Installer::rebuildGrub() {
    LOG_INFO("Rebuilding GrubPower with freshly detected paths...");
    if (!loadConfig()) {
        LOG_WARNING("Configuration has invalid values, defaults were used for them.");
    }
    if (removeEntries(true)) {
        LOG_INFO("Removed previous GrubPower entries.");
    }
    if (!detectSystem()) {
        LOG_ERROR("Rebuild aborted.");
        return false;
    }

    RollbackStack rollback;
    if (!buildImage(rollback) || !installEntries(rollback)) {
        LOG_ERROR("Rebuild failed. Rolling back changes...");
        return abort_install(rollback);
    }
    if (!regenerateGrubConfig()) {
        LOG_WARNING("Entries were added but grub.cfg was not regenerated.");
    }
    rollback.commit();
    cleanup();

    mOut << "GrubPower rebuilt.\n"
         << "Kernel path: " << mSettings.kernel_path << "\n"
         << "GRUB root: " << mSettings.grub_root << "\n"
         << "Initramfs location: " << mSettings.output_dir << "/" << mSettings.initramfs_name << "\n";
    return true;
}

bool
Installer::regenerateGrubConfig() {
    return update_grub_config();
}

bool
Installer::askContinue(const std::string &question) {
    if (mOptions.assume_yes) {
        LOG_INFO("%s yes", question.c_str());
        return true;
    }
    return is_yes(prompt(question + " (y/n): "));
}

std::string
Installer::prompt(const std::string &question) {
    mOut << question;
    mOut.flush();
    std::string line;
    if (!std::getline(mIn, line)) {
        return "";
    }
    return trim(line);
}

bool
Installer::updateSetting(settings_field field, const std::string &value) {
    if (!mSettingsHandler.setValue(field, value)) {
        return false;
    }
    mSettings = mSettingsHandler.getSettings();
    return true;
}

bool
Installer::saveConfig() {
    if (!mSettingsHandler.writeFile(mOptions.config_path)) {
        LOG_ERROR("Could not update %s", mOptions.config_path.c_str());
        return false;
    }
    return true;
}

void
Installer::cleanup() {
    LOG_INFO("Cleaning up...");
    if (!remove_tree(mSettings.build_dir)) {
        LOG_WARNING("Build directory %s left behind", mSettings.build_dir.c_str());
    }
}
