#include <stdlib.h>
#include <unistd.h>

#include <iostream>
#include <string>
#include <vector>

#include "log.hpp"
#include "device_enumerator.hpp"
#include "installer.hpp"
#include "installer_cli.hpp"

#ifndef GRUBPOWER_VERSION
#define GRUBPOWER_VERSION "1.2.0"
#endif

namespace {

bool needs_root(installer_command_t command) {
    switch (command) {
    case installer_command_t::HELP:
    case installer_command_t::VERSION:
    case installer_command_t::CHECK_UPDATE:
        return false;
    default:
        return true;
    }
}

}

int main(int argc, char **argv) {
    const std::vector<std::string> args(argv, argv + argc);
    const std::string program = args.empty() ? "grubpower" : args[0];

    logger_setup(log_type_t::PRINTF, getenv("GRUBPOWER_DEBUG") ? log_level_t::DEBUG : log_level_t::INFO);

    command_line_t cmd;
    std::string error;
    if (!parse_command_line(args, cmd, error)) {
        std::cerr << program << ": " << error << "\n\n";
        print_usage(std::cerr, program);
        return 2;
    }

    if (cmd.debug) {
        logger_set_level(log_level_t::DEBUG);
    }

    if (cmd.command == installer_command_t::HELP) {
        print_usage(std::cout, program);
        return 0;
    }
    if (cmd.command == installer_command_t::VERSION) {
        std::cout << "GrubPower version " << GRUBPOWER_VERSION << "\n";
        return 0;
    }
    if (needs_root(cmd.command) && geteuid() != 0) {
        std::cerr << "This program must be run as root. Please use sudo.\n";
        return 1;
    }

    UdevDeviceEnumerator enumerator;
    if (!enumerator.start()) {
        LOG_WARNING("Device enumeration unavailable, hardware checks will find nothing.");
    }

    auto options = default_installer_options();
    options.config_path = cmd.config_path;
    options.assume_yes = cmd.assume_yes;
    Installer installer(options, enumerator, std::cin, std::cout);

    bool ok = true;
    switch (cmd.command) {
    case installer_command_t::FULL:
        ok = installer.fullInstall(false);
        break;
    case installer_command_t::INTERACTIVE:
        ok = installer.fullInstall(true);
        break;
    case installer_command_t::BUILD:
        ok = installer.buildOnly();
        break;
    case installer_command_t::INSTALL:
        ok = installer.installOnly();
        break;
    case installer_command_t::UNINSTALL:
        ok = installer.uninstall(cmd.remove_all);
        break;
    case installer_command_t::CONFIGURE:
        ok = installer.configure();
        break;
    case installer_command_t::COMPATIBILITY:
        ok = installer.checkCompatibility();
        break;
    case installer_command_t::TEST_USB:
        ok = installer.testUsbPower();
        break;
    case installer_command_t::CHECK_UPDATE:
        installer.checkForUpdates();
        break;
    case installer_command_t::REBUILD_GRUB:
        ok = installer.rebuildGrub();
        break;
    case installer_command_t::HELP:
    case installer_command_t::VERSION:
        break;
    }

    return ok ? 0 : 1;
}
