#include "lid_sensor.hpp"

#include <utility>

#include <unistd.h>
#include <errno.h>
#include <string.h>
#include <fcntl.h>
#include <linux/input.h>
#include <libevdev/libevdev.h>

#include "utils.hpp"
#include "log.hpp"

namespace {

const std::vector<std::string> kAcpiLidStateFiles = {
    "/proc/acpi/button/lid/LID0/state",
    "/proc/acpi/button/lid/LID/state",
};

// Returns SW_LID of an evdev node, or nothing if it has no lid switch.
std::optional<lid_state_t> get_switch_state(const std::string &devnode) {
    const int fd = open(devnode.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) {
        LOG_DEBUG("lid: could not open %s: '%s' (%d)", devnode.c_str(), strerror(errno), errno);
        return std::nullopt;
    }

    struct libevdev *dev = nullptr;
    const int rc = libevdev_new_from_fd(fd, &dev);
    if (rc < 0) {
        LOG_DEBUG("lid: Failed to init libevdev for %s (%s)", devnode.c_str(), strerror(-rc));
        close(fd);
        return std::nullopt;
    }

    std::optional<lid_state_t> state;
    if (libevdev_has_event_code(dev, EV_SW, SW_LID)) {
        state = libevdev_get_event_value(dev, EV_SW, SW_LID) ? lid_state_t::CLOSED
                                                             : lid_state_t::OPEN;
    }
    libevdev_free(dev);
    close(fd);
    return state;
}

}

std::optional<lid_state_t> parse_acpi_lid_state(const std::string &content) {
    const auto c = to_lower(content);
    if (c.find("closed") != std::string::npos) {
        return lid_state_t::CLOSED;
    }
    if (c.find("open") != std::string::npos) {
        return lid_state_t::OPEN;
    }
    return std::nullopt;
}

LidSensor::LidSensor(DeviceEnumerator &enumerator)
: LidSensor(enumerator, kAcpiLidStateFiles)
{
}

LidSensor::LidSensor(DeviceEnumerator &enumerator, std::vector<std::string> acpi_state_files)
: mEnumerator(enumerator)
, mAcpiStateFiles(std::move(acpi_state_files))
, mNoSourceLogged(false)
{
}

std::optional<lid_state_t>
LidSensor::readAcpiState() {
    for (const auto &path : mAcpiStateFiles) {
        if (!file_exists(path)) {
            continue;
        }
        const auto state = parse_acpi_lid_state(get_line_from_file(path));
        if (state) {
            return state;
        }
        LOG_DEBUG("lid: unusable state in %s", path.c_str());
    }
    return std::nullopt;
}

std::optional<lid_state_t>
LidSensor::readInputState() {
    for (const auto &input : mEnumerator.inputDevices()) {
        if (to_lower(input.name).find("lid") == std::string::npos) {
            continue;
        }
        const auto state = get_switch_state(input.devnode);
        if (state) {
            return state;
        }
    }
    return std::nullopt;
}

lid_state_t
LidSensor::readState() {
    auto state = readAcpiState();
    if (!state) {
        state = readInputState();
    }
    if (!state) {
        if (!mNoSourceLogged) {
            LOG_INFO("No lid switch found, assuming lid is open.");
            mNoSourceLogged = true;
        }
        return lid_state_t::OPEN;
    }
    return *state;
}
