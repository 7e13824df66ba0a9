#include "installer_cli.hpp"

#include <unordered_map>

namespace {

const std::unordered_map<std::string, installer_command_t> kCommands = {
    { "--full", installer_command_t::FULL },
    { "--full-debug", installer_command_t::FULL },
    { "--build", installer_command_t::BUILD },
    { "--install", installer_command_t::INSTALL },
    { "--uninstall", installer_command_t::UNINSTALL },
    { "--configure", installer_command_t::CONFIGURE },
    { "--interactive", installer_command_t::INTERACTIVE },
    { "--compatibility", installer_command_t::COMPATIBILITY },
    { "--test-usb", installer_command_t::TEST_USB },
    { "--check-update", installer_command_t::CHECK_UPDATE },
    { "--version", installer_command_t::VERSION },
    { "--rebuild-grub", installer_command_t::REBUILD_GRUB },
    { "--help", installer_command_t::HELP },
    { "-h", installer_command_t::HELP },
};

}

bool parse_command_line(const std::vector<std::string> &args, command_line_t &cmd,
                        std::string &error) {
    cmd.command = installer_command_t::FULL;
    cmd.config_path = "/etc/grubpower.conf";
    cmd.assume_yes = false;
    cmd.remove_all = false;
    cmd.debug = false;

    bool have_command = false;
    for (size_t i = 1; i < args.size(); ++i) {
        const auto &arg = args[i];
        if (arg == "--config") {
            if (i + 1 >= args.size()) {
                error = "--config needs a path";
                return false;
            }
            cmd.config_path = args[++i];
            continue;
        }
        if (arg == "--yes" || arg == "-y") {
            cmd.assume_yes = true;
            continue;
        }
        if (arg == "--all") {
            cmd.remove_all = true;
            continue;
        }

        const auto it = kCommands.find(arg);
        if (it == kCommands.end()) {
            error = "unknown option " + arg;
            return false;
        }
        if (arg == "--full-debug") {
            cmd.debug = true;
        }
        if (have_command && cmd.command != it->second) {
            error = "only one command may be given";
            return false;
        }
        cmd.command = it->second;
        have_command = true;
    }

    if (cmd.remove_all && cmd.command != installer_command_t::UNINSTALL) {
        error = "--all only applies to --uninstall";
        return false;
    }
    return true;
}

void print_usage(std::ostream &out, const std::string &program) {
    out << "GrubPower Advanced - Turn your laptop into a USB powerbank\n"
        << "\n"
        << "Usage: " << program << " [--config PATH] [--yes] [command]\n"
        << "\n"
        << "Commands:\n"
        << "  --help            Show this help message\n"
        << "  --configure       Create/edit configuration file\n"
        << "  --build           Build initramfs only\n"
        << "  --install         Install GRUB entries only\n"
        << "  --uninstall       Remove GrubPower from system (--all: every entry)\n"
        << "  --full            Perform full installation (default)\n"
        << "  --full-debug      Full installation with debug logging\n"
        << "  --interactive     Run interactive configuration, then install\n"
        << "  --compatibility   Check hardware compatibility only\n"
        << "  --test-usb        Test USB power management capabilities\n"
        << "  --check-update    Show the installed version\n"
        << "  --version         Display version information\n"
        << "  --rebuild-grub    Re-detect paths, rebuild the initramfs and rewrite the entries\n"
        << "\n"
        << "Options:\n"
        << "  --config PATH     Configuration file (default: /etc/grubpower.conf)\n"
        << "  --yes, -y         Answer yes to every question\n"
        << "\n"
        << "Environment:\n"
        << "  GRUBPOWER_DEBUG   Set to any value for debug logging\n"
        << "\n"
        << "Example:\n"
        << "  sudo " << program << " --full          # Complete installation\n"
        << "  sudo " << program << " --interactive   # Run interactive setup wizard\n"
        << "  sudo " << program << " --uninstall     # Remove GrubPower\n";
}
