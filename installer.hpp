#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <time.h>

#include "types.hpp"
#include "settings_handler.hpp"
#include "device_enumerator.hpp"
#include "rollback.hpp"

typedef struct {
    std::string config_path;
    std::string init_binary;
    std::string boot_dir;
    std::string grub_d_dir;
    std::string modules_root;
    // Answer every confirmation with yes.
    bool assume_yes;
} installer_options_t;

installer_options_t default_installer_options();

// "<path>.bak.<YYYYmmddHHMMSS>" for the given wall clock time.
std::string backup_path_for(const std::string &path, time_t when);

class Installer {
public:
    Installer(installer_options_t options, DeviceEnumerator &enumerator,
              std::istream &in, std::ostream &out);
    virtual ~Installer() = default;

    // Writes the default configuration when none exists, then loads it.
    bool loadConfig();
    const settings_t &settings() const { return mSettings; }

    bool checkCompatibility();
    bool testUsbPower();
    void checkForUpdates();
    void interactiveSetup();
    bool configure();

    // Fills in kernel, GRUB root and GRUB custom script where the
    // configured values do not point at anything usable.
    bool detectSystem();

    virtual bool buildImage(RollbackStack &rollback);
    bool installEntries(RollbackStack &rollback);
    // Removes GrubPower entries, asking which unless remove_all is set.
    // Returns true if the custom script changed.
    bool removeEntries(bool remove_all);

    bool fullInstall(bool interactive);
    bool buildOnly();
    bool installOnly();
    bool uninstall(bool remove_all);
    // Drops existing entries, re-detects kernel and boot paths, then
    // rebuilds the image and writes fresh entries.
    bool rebuildGrub();

protected:
    virtual bool regenerateGrubConfig();

private:
    bool askContinue(const std::string &question);
    std::string prompt(const std::string &question);
    bool updateSetting(settings_field field, const std::string &value);
    bool saveConfig();
    void cleanup();

    installer_options_t mOptions;
    DeviceEnumerator &mEnumerator;
    std::istream &mIn;
    std::ostream &mOut;
    SettingsHandler mSettingsHandler;
    settings_t mSettings;
};
