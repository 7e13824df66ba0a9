#pragma once

#include <string>
#include <vector>

#include "types.hpp"

extern const char *const kMenuEntryTitle;
extern const char *const kRecoveryEntryTitle;

// Text appended to the GRUB custom script for the USB power mode entry.
std::string make_menu_entry(const settings_t &settings);

// Entry that chains back to the regular GRUB menu after 30 seconds.
std::string make_recovery_entry();

// Titles of the GrubPower menu entries found in a GRUB custom script.
std::vector<std::string> list_menu_entries(const std::string &text);

// Removes the GrubPower entries at the given positions (as returned by
// list_menu_entries) together with their "# GrubPower" comment line, then
// trims blank lines left at the end of the script.
std::string remove_menu_entries(const std::string &text, const std::vector<size_t> &indexes);
std::string remove_all_menu_entries(const std::string &text);

// Regenerates grub.cfg with whichever generator is installed.
bool update_grub_config();
