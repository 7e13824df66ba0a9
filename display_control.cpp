#include "display_control.hpp"

#include <utility>

#include "utils.hpp"
#include "log.hpp"

namespace {

int get_current_brightness(const sysfs_device_t &bl) {
    int brightness = get_value_from_file(bl.syspath + "/actual_brightness", -1);
    if (brightness < 0) {
        brightness = get_value_from_file(bl.syspath + "/brightness", -1);
    }
    return brightness;
}

}

DpmsDisplayControl::DpmsDisplayControl(std::string tool)
: mTool(std::move(tool))
{
}

bool
DpmsDisplayControl::powerOff() {
    return run_command(mTool + " dpms off");
}

bool
DpmsDisplayControl::powerOn() {
    return run_command(mTool + " dpms on");
}

TerminalBlankDisplayControl::TerminalBlankDisplayControl(std::string tool)
: mTool(std::move(tool))
{
}

bool
TerminalBlankDisplayControl::powerOff() {
    return run_command(mTool + " --blank force");
}

bool
TerminalBlankDisplayControl::powerOn() {
    return run_command(mTool + " --blank poke");
}

BacklightDisplayControl::BacklightDisplayControl(DeviceEnumerator &enumerator)
: mEnumerator(enumerator)
{
}

bool
BacklightDisplayControl::powerOff() {
    bool ok = true;
    for (const auto &bl : mEnumerator.backlights()) {
        const int current = get_current_brightness(bl);
        // Keep the last visible level if the panel is already dark.
        if (current > 0) {
            mSavedBrightness[bl.syspath] = current;
        }
        if (!write_value_to_file(bl.syspath + "/brightness", 0)) {
            LOG_DEBUG("display: could not turn off backlight %s", bl.sysname.c_str());
            ok = false;
        }
    }
    return ok;
}

bool
BacklightDisplayControl::powerOn() {
    bool ok = true;
    for (const auto &bl : mEnumerator.backlights()) {
        int level = -1;
        const auto saved = mSavedBrightness.find(bl.syspath);
        if (saved != mSavedBrightness.end()) {
            level = saved->second;
        } else {
            const int max = get_value_from_file(bl.syspath + "/max_brightness", -1);
            if (max > 0) {
                level = max / 2;
            }
        }
        if (level < 0) {
            LOG_DEBUG("display: no brightness to restore for %s", bl.sysname.c_str());
            ok = false;
            continue;
        }
        if (!write_value_to_file(bl.syspath + "/brightness", level)) {
            LOG_DEBUG("display: could not restore backlight %s", bl.sysname.c_str());
            ok = false;
        }
    }
    return ok;
}

std::unique_ptr<DisplayControl> probe_display_control(DeviceEnumerator &enumerator) {
    std::unique_ptr<DisplayControl> control;

    const auto vbetool = find_executable("vbetool");
    const auto setterm = find_executable("setterm");
    if (!vbetool.empty()) {
        control = std::make_unique<DpmsDisplayControl>(vbetool);
    } else if (!setterm.empty()) {
        control = std::make_unique<TerminalBlankDisplayControl>(setterm);
    } else if (!enumerator.backlights().empty()) {
        control = std::make_unique<BacklightDisplayControl>(enumerator);
    } else {
        control = std::make_unique<NullDisplayControl>();
    }

    LOG_INFO("Display power control: %s", control->name());
    return control;
}
