#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"
#include "device_enumerator.hpp"

class LidReader {
public:
    virtual ~LidReader() = default;
    virtual lid_state_t readState() = 0;
};

// Parses the content of an ACPI lid state file ("state:      closed").
std::optional<lid_state_t> parse_acpi_lid_state(const std::string &content);

class LidSensor : public LidReader {
public:
    explicit LidSensor(DeviceEnumerator &enumerator);
    LidSensor(DeviceEnumerator &enumerator, std::vector<std::string> acpi_state_files);

    // Falls back to OPEN when no source reports a usable state.
    lid_state_t readState() override;

private:
    std::optional<lid_state_t> readAcpiState();
    std::optional<lid_state_t> readInputState();

    DeviceEnumerator &mEnumerator;
    std::vector<std::string> mAcpiStateFiles;
    bool mNoSourceLogged;
};
