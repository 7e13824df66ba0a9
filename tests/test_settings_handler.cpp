#include "gtest/gtest.h"
#include <sstream>

#include "../settings_handler.hpp"
#include "test_helpers.hpp"


TEST(SettingsHandler, Defaults) {
    SettingsHandler handler;
    const auto s = handler.getSettings();

    EXPECT_EQ(s.kernel_path, "/boot/vmlinuz-linux");
    EXPECT_EQ(s.grub_root, "hd0,1");
    EXPECT_EQ(s.initramfs_name, "grubpower-initramfs.img");
    EXPECT_EQ(s.min_battery, 10);
    EXPECT_TRUE(s.disable_autosuspend);
    EXPECT_FALSE(s.enable_logging);
    EXPECT_EQ(s.port_selection.mode, port_selection_mode_t::ALL);
    EXPECT_TRUE(s.lid_control);
    EXPECT_EQ(s.poll_interval, 5);
    EXPECT_EQ(s.shutdown_action, shutdown_action_t::POWEROFF);
}

TEST(SettingsHandler, ParsesShellStyleAssignments) {
    std::stringstream in(
        "# comment\n"
        "\n"
        "MIN_BATTERY=15\n"
        "export LOG_FILE=\"/tmp/gp.log\"\n"
        "SELECT_PORTS='1,3'\n"
        "LID_CONTROL=0        # Enable lid detection\n"
        "EXTRA_MODULES=\"i915 # not a comment\"\n"
        "SHUTDOWN_ACTION=reboot\n");

    SettingsHandler handler;
    EXPECT_TRUE(handler.parse(in));
    const auto s = handler.getSettings();

    EXPECT_EQ(s.min_battery, 15);
    EXPECT_EQ(s.log_file, "/tmp/gp.log");
    EXPECT_EQ(s.port_selection.mode, port_selection_mode_t::LIST);
    EXPECT_EQ(s.port_selection.ports, std::vector<int>({ 1, 3 }));
    EXPECT_FALSE(s.lid_control);
    EXPECT_EQ(s.extra_modules, "i915 # not a comment");
    EXPECT_EQ(s.shutdown_action, shutdown_action_t::REBOOT);
}

TEST(SettingsHandler, InvalidValuesKeepPrevious) {
    std::stringstream in(
        "MIN_BATTERY=150\n"
        "POLL_INTERVAL=abc\n"
        "INITRAMFS_NAME=../evil.img\n"
        "BUILD_DIR=/\n"
        "NOT_A_KEY=1\n"
        "garbage line\n");

    SettingsHandler handler;
    EXPECT_FALSE(handler.parse(in));
    const auto s = handler.getSettings();

    EXPECT_EQ(s.min_battery, 10);
    EXPECT_EQ(s.poll_interval, 5);
    EXPECT_EQ(s.initramfs_name, "grubpower-initramfs.img");
    EXPECT_EQ(s.build_dir, "/tmp/grubpower_build");
}

TEST(SettingsHandler, ZeroThresholdIsAllowed) {
    SettingsHandler handler;
    EXPECT_TRUE(handler.setValue("MIN_BATTERY", "0"));
    EXPECT_EQ(handler.getSettings().min_battery, 0);
}

TEST(SettingsHandler, SerializeLoadsBack) {
    SettingsHandler handler;
    ASSERT_TRUE(handler.setValue(settings_field::MIN_BATTERY, "20"));
    ASSERT_TRUE(handler.setValue(settings_field::SELECT_PORTS, "charging"));
    ASSERT_TRUE(handler.setValue(settings_field::EXTRA_KERNEL_PARAMS, "nomodeset"));

    TempDir dir;
    const auto path = dir.path() + "/grubpower.conf";
    ASSERT_TRUE(handler.writeFile(path));

    SettingsHandler loaded;
    EXPECT_TRUE(loaded.loadFile(path));
    const auto s = loaded.getSettings();
    EXPECT_EQ(s.min_battery, 20);
    EXPECT_EQ(s.port_selection.mode, port_selection_mode_t::CHARGING);
    EXPECT_EQ(s.extra_kernel_params, "nomodeset");
}

TEST(SettingsHandler, MissingFileUsesDefaults) {
    SettingsHandler handler;
    EXPECT_FALSE(handler.loadFile("/nonexistent/grubpower.conf"));
    EXPECT_EQ(handler.getSettings().min_battery, 10);
}

TEST(PortSelection, Modes) {
    EXPECT_EQ(parse_port_selection("all").mode, port_selection_mode_t::ALL);
    EXPECT_EQ(parse_port_selection("").mode, port_selection_mode_t::ALL);
    EXPECT_EQ(parse_port_selection("Charging").mode, port_selection_mode_t::CHARGING);
}

TEST(PortSelection, ListsAndRanges) {
    const auto s = parse_port_selection("4-5, 1,2,2");
    EXPECT_EQ(s.mode, port_selection_mode_t::LIST);
    EXPECT_EQ(s.ports, std::vector<int>({ 1, 2, 4, 5 }));
}

TEST(PortSelection, UnusableListFallsBackToAll) {
    EXPECT_EQ(parse_port_selection("x,y").mode, port_selection_mode_t::ALL);
    EXPECT_EQ(parse_port_selection("5-2").mode, port_selection_mode_t::ALL);
}

TEST(SettingsHandler, UnusablePortListIsStoredAsAll) {
    SettingsHandler handler;
    ASSERT_TRUE(handler.setValue(settings_field::SELECT_PORTS, "foo"));
    EXPECT_EQ(handler.getSettings().port_selection.mode, port_selection_mode_t::ALL);
    EXPECT_EQ(handler.getSettings().select_ports, "all");

    ASSERT_TRUE(handler.setValue(settings_field::SELECT_PORTS, "1,3"));
    EXPECT_EQ(handler.getSettings().select_ports, "1,3");
}
