#pragma once

#include <string>

#include "types.hpp"

class PowerControl {
public:
    virtual ~PowerControl() = default;
    // Irreversible. Returns only if the request could not be issued.
    virtual bool shutdown() = 0;
};

class SystemPowerControl : public PowerControl {
public:
    explicit SystemPowerControl(const settings_t &settings);
    SystemPowerControl(const settings_t &settings, std::string sysrq_trigger);

    bool shutdown() override;

private:
    int mGraceSeconds;
    shutdown_action_t mAction;
    std::string mSysrqTrigger;
};
