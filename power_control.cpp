#include "power_control.hpp"

#include <chrono>
#include <thread>
#include <utility>

#include <unistd.h>
#include <string.h>
#include <errno.h>
#include <sys/reboot.h>

#include "utils.hpp"
#include "log.hpp"

SystemPowerControl::SystemPowerControl(const settings_t &settings)
: SystemPowerControl(settings, "/proc/sysrq-trigger")
{
}

SystemPowerControl::SystemPowerControl(const settings_t &settings, std::string sysrq_trigger)
: mGraceSeconds(settings.shutdown_grace)
, mAction(settings.shutdown_action)
, mSysrqTrigger(std::move(sysrq_trigger))
{
}

bool
SystemPowerControl::shutdown() {
    const bool reboot_requested = (mAction == shutdown_action_t::REBOOT);
    LOG_NOTICE("%s in %d seconds.", reboot_requested ? "Rebooting" : "Powering off", mGraceSeconds);

    // Let in-flight writes land.
    std::this_thread::sleep_for(std::chrono::seconds(mGraceSeconds));
    sync();

    if (reboot(reboot_requested ? RB_AUTOBOOT : RB_POWER_OFF) == 0) {
        return true;
    }
    LOG_ERROR("reboot() failed: '%s' (%d), trying sysrq.", strerror(errno), errno);

    if (!write_value_to_file(mSysrqTrigger, 's')) {
        LOG_WARNING("Could not request emergency sync via %s", mSysrqTrigger.c_str());
    }
    if (!write_value_to_file(mSysrqTrigger, reboot_requested ? 'b' : 'o')) {
        LOG_ERROR("Could not write to %s: '%s' (%d)", mSysrqTrigger.c_str(), strerror(errno), errno);
        return false;
    }
    return true;
}
