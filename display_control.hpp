#pragma once

#include <map>
#include <memory>
#include <string>

#include "device_enumerator.hpp"

class DisplayControl {
public:
    virtual ~DisplayControl() = default;
    virtual const char *name() const = 0;
    virtual bool powerOff() = 0;
    virtual bool powerOn() = 0;
};

// vbetool dpms off/on
class DpmsDisplayControl : public DisplayControl {
public:
    explicit DpmsDisplayControl(std::string tool);
    const char *name() const override { return "dpms"; }
    bool powerOff() override;
    bool powerOn() override;

private:
    std::string mTool;
};

// setterm --blank force/poke
class TerminalBlankDisplayControl : public DisplayControl {
public:
    explicit TerminalBlankDisplayControl(std::string tool);
    const char *name() const override { return "setterm"; }
    bool powerOff() override;
    bool powerOn() override;

private:
    std::string mTool;
};

// Writes 0 to every backlight, remembering the previous brightness per
// device. Restores it on powerOn, or half of max_brightness if unknown.
class BacklightDisplayControl : public DisplayControl {
public:
    explicit BacklightDisplayControl(DeviceEnumerator &enumerator);
    const char *name() const override { return "backlight"; }
    bool powerOff() override;
    bool powerOn() override;

private:
    DeviceEnumerator &mEnumerator;
    std::map<std::string, int> mSavedBrightness;
};

class NullDisplayControl : public DisplayControl {
public:
    const char *name() const override { return "none"; }
    bool powerOff() override { return true; }
    bool powerOn() override { return true; }
};

// Picks the first available mechanism: DPMS tool, terminal blanking tool,
// sysfs backlight, none.
std::unique_ptr<DisplayControl> probe_display_control(DeviceEnumerator &enumerator);
