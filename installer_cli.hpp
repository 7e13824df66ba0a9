#pragma once

#include <ostream>
#include <string>
#include <vector>

typedef enum class installer_command {
    FULL,
    BUILD,
    INSTALL,
    UNINSTALL,
    CONFIGURE,
    INTERACTIVE,
    COMPATIBILITY,
    TEST_USB,
    CHECK_UPDATE,
    VERSION,
    REBUILD_GRUB,
    HELP,
} installer_command_t;

typedef struct {
    installer_command_t command;
    std::string config_path;
    bool assume_yes;
    bool remove_all;
    // Log at debug level.
    bool debug;
} command_line_t;

// args[0] is the program name. On failure error holds the reason.
bool parse_command_line(const std::vector<std::string> &args, command_line_t &cmd,
                        std::string &error);

void print_usage(std::ostream &out, const std::string &program);
