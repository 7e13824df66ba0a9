#include "gtest/gtest.h"

#include "../grub_entry.hpp"
#include "test_helpers.hpp"

namespace {

const std::string kCustomHeader =
    "#!/bin/sh\n"
    "exec tail -n +3 $0\n"
    "# This file provides an easy way to add custom menu entries.\n";

const std::string kUserEntry =
    "\n"
    "menuentry 'Windows' {\n"
    "    chainloader +1\n"
    "}\n";

}

TEST(GrubEntry, MenuEntryContent) {
    auto settings = default_settings();
    settings.kernel_path = "/boot/vmlinuz-6.1.0-13-amd64";
    settings.grub_root = "hd0,2";
    settings.extra_kernel_params = "nomodeset";

    const auto entry = make_menu_entry(settings);
    EXPECT_NE(entry.find("# GrubPower Advanced USB Power Mode entry\n"), std::string::npos);
    EXPECT_NE(entry.find("menuentry 'GrubPower Advanced: USB Power Mode' {\n"), std::string::npos);
    EXPECT_NE(entry.find("    set root=(hd0,2)\n"), std::string::npos);
    EXPECT_NE(entry.find("    linux /boot/vmlinuz-6.1.0-13-amd64 quiet init=/init acpi=force "
                         "acpi_osi=Linux acpi_backlight=vendor nomodeset\n"), std::string::npos);
    EXPECT_NE(entry.find("    initrd /boot/grubpower-initramfs.img\n"), std::string::npos);
}

TEST(GrubEntry, NoTrailingSpaceWithoutExtraParams) {
    const auto entry = make_menu_entry(default_settings());
    EXPECT_NE(entry.find("acpi_backlight=vendor\n"), std::string::npos);
}

TEST(GrubEntry, RecoveryEntryReturnsToMainMenu) {
    const auto entry = make_recovery_entry();
    EXPECT_NE(entry.find("menuentry 'GrubPower: Recovery Mode (Auto-boot in 30s)'"), std::string::npos);
    EXPECT_NE(entry.find("sleep 30\n"), std::string::npos);
    EXPECT_NE(entry.find("configfile /boot/grub/grub.cfg\n"), std::string::npos);
}

TEST(GrubEntry, ListEntries) {
    const auto text = kCustomHeader + kUserEntry + make_menu_entry(default_settings()) +
                      make_recovery_entry();

    const auto titles = list_menu_entries(text);
    ASSERT_EQ(titles.size(), 2u);
    EXPECT_EQ(titles[0], kMenuEntryTitle);
    EXPECT_EQ(titles[1], kRecoveryEntryTitle);
    EXPECT_TRUE(list_menu_entries(kCustomHeader + kUserEntry).empty());
}

TEST(GrubEntry, RemoveAllRestoresOriginal) {
    const auto original = kCustomHeader + kUserEntry;
    const auto text = original + make_menu_entry(default_settings()) + make_recovery_entry();

    EXPECT_EQ(remove_all_menu_entries(text), original);
}

TEST(GrubEntry, RemoveSelectedEntryWithComment) {
    const auto text = kCustomHeader + make_menu_entry(default_settings()) + make_recovery_entry();

    const auto result = remove_menu_entries(text, { 1 });
    const auto titles = list_menu_entries(result);
    ASSERT_EQ(titles.size(), 1u);
    EXPECT_EQ(titles[0], kMenuEntryTitle);
    EXPECT_EQ(result.find("# GrubPower Recovery"), std::string::npos);
    EXPECT_NE(result.find("# GrubPower Advanced USB Power Mode entry"), std::string::npos);
}

TEST(GrubEntry, OutOfRangeIndexIsIgnored) {
    const auto text = kCustomHeader + make_menu_entry(default_settings());

    EXPECT_EQ(list_menu_entries(remove_menu_entries(text, { 5 })).size(), 1u);
}

TEST(GrubEntry, UserCommentsMentioningOtherThingsStay) {
    const auto text = kCustomHeader + "# keep me\n" + make_menu_entry(default_settings());

    EXPECT_NE(remove_all_menu_entries(text).find("# keep me\n"), std::string::npos);
}

TEST(GrubEntry, RemoveBeforeUserEntryRestoresOriginal) {
    const auto ours = make_menu_entry(default_settings()) + make_recovery_entry();
    const auto original = kCustomHeader + kUserEntry;

    auto text = kCustomHeader + ours + kUserEntry;
    EXPECT_EQ(remove_all_menu_entries(text), original);

    // Reinstalling repeatedly does not grow the file.
    for (int i = 0; i < 3; ++i) {
        text = remove_all_menu_entries(text) + ours;
    }
    EXPECT_EQ(text, original + ours);
}
