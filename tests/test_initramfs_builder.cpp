#include "gtest/gtest.h"
#include <algorithm>

#include "../initramfs_builder.hpp"
#include "../utils.hpp"
#include "test_helpers.hpp"

namespace {

const char kModulesDep[] =
    "kernel/drivers/usb/core/usbcore.ko.zst: kernel/drivers/usb/common/usb-common.ko.zst\n"
    "kernel/drivers/usb/common/usb-common.ko.zst:\n"
    "kernel/drivers/usb/host/xhci-pci.ko.zst: kernel/drivers/usb/host/xhci-hcd.ko.zst "
    "kernel/drivers/usb/core/usbcore.ko.zst kernel/drivers/usb/common/usb-common.ko.zst\n"
    "kernel/drivers/usb/host/xhci-hcd.ko.zst: kernel/drivers/usb/core/usbcore.ko.zst "
    "kernel/drivers/usb/common/usb-common.ko.zst\n";

}

TEST(InitramfsBuilder, ParseLddOutput) {
    const std::string output =
        "\tlinux-vdso.so.1 (0x00007ffd0b3f2000)\n"
        "\tlibudev.so.1 => /lib/x86_64-linux-gnu/libudev.so.1 (0x00007f1c1c5a0000)\n"
        "\tlibc.so.6 => /lib/x86_64-linux-gnu/libc.so.6 (0x00007f1c1c200000)\n"
        "\tlibmissing.so => not found\n"
        "\t/lib64/ld-linux-x86-64.so.2 (0x00007f1c1c600000)\n"
        "\tlibc.so.6 => /lib/x86_64-linux-gnu/libc.so.6 (0x00007f1c1c200000)\n";

    EXPECT_EQ(parse_ldd_output(output), std::vector<std::string>({
        "/lib/x86_64-linux-gnu/libc.so.6",
        "/lib/x86_64-linux-gnu/libudev.so.1",
        "/lib64/ld-linux-x86-64.so.2",
    }));
    EXPECT_TRUE(parse_ldd_output("\tnot a dynamic executable\n").empty());
}

TEST(InitramfsBuilder, ModuleNameFromPath) {
    EXPECT_EQ(module_name_from_path("kernel/drivers/usb/host/xhci-pci.ko.zst"), "xhci_pci");
    EXPECT_EQ(module_name_from_path("kernel/drivers/hid/hid.ko"), "hid");
    EXPECT_EQ(module_name_from_path("usb-storage.ko.xz"), "usb_storage");
}

TEST(InitramfsBuilder, ModuleDependenciesLoadFirst) {
    EXPECT_EQ(module_with_dependencies(kModulesDep, "xhci_pci"), std::vector<std::string>({
        "kernel/drivers/usb/common/usb-common.ko.zst",
        "kernel/drivers/usb/core/usbcore.ko.zst",
        "kernel/drivers/usb/host/xhci-hcd.ko.zst",
        "kernel/drivers/usb/host/xhci-pci.ko.zst",
    }));
    EXPECT_EQ(module_with_dependencies(kModulesDep, "usb-common"),
              std::vector<std::string>({ "kernel/drivers/usb/common/usb-common.ko.zst" }));
    EXPECT_TRUE(module_with_dependencies(kModulesDep, "battery").empty());
}

TEST(InitramfsBuilder, LayoutAndConfig) {
    TempDir dir;
    auto settings = default_settings();
    settings.build_dir = dir.path() + "/build";
    settings.output_dir = dir.path() + "/out";
    InitramfsBuilder builder(settings, { .init_binary = dir.path() + "/missing-init",
                                         .modules_root = dir.path() + "/modules" });

    ASSERT_TRUE(builder.prepareLayout());
    for (const char *sub : { "bin", "dev", "proc", "sys", "etc", "var/log", "lib/modules" }) {
        EXPECT_TRUE(is_directory(settings.build_dir + "/" + sub)) << sub;
    }

    EXPECT_TRUE(builder.installConfig("MIN_BATTERY=5\n"));
    EXPECT_EQ(dir.read("build/etc/grubpower.conf"), "MIN_BATTERY=5\n");

    EXPECT_FALSE(builder.installInit());
    EXPECT_EQ(builder.imagePath(), settings.output_dir + "/grubpower-initramfs.img");
}

TEST(InitramfsBuilder, ModuleListIncludesExtras) {
    auto settings = default_settings();
    settings.extra_modules = "i915  r8169";
    InitramfsBuilder builder(settings, { .init_binary = "", .modules_root = "" });

    const auto modules = builder.moduleList();
    EXPECT_NE(std::find(modules.begin(), modules.end(), "xhci_pci"), modules.end());
    EXPECT_NE(std::find(modules.begin(), modules.end(), "usb_storage"), modules.end());
    EXPECT_EQ(modules[modules.size() - 2], "i915");
    EXPECT_EQ(modules.back(), "r8169");
}

TEST(InitramfsBuilder, CopiesModulesWithDependencies) {
    TempDir dir;
    const std::string release = "6.1.0-test";
    const auto root = "modules/" + release + "/";
    dir.write(root + "modules.dep", kModulesDep);
    dir.write(root + "modules.alias", "alias usb:* usbcore\n");
    dir.write(root + "kernel/drivers/usb/core/usbcore.ko.zst", "ko");
    dir.write(root + "kernel/drivers/usb/common/usb-common.ko.zst", "ko");
    dir.write(root + "kernel/drivers/usb/host/xhci-hcd.ko.zst", "ko");
    dir.write(root + "kernel/drivers/usb/host/xhci-pci.ko.zst", "ko");

    auto settings = default_settings();
    settings.build_dir = dir.path() + "/build";
    InitramfsBuilder builder(settings, { .init_binary = "",
                                         .modules_root = dir.path() + "/modules" });
    ASSERT_TRUE(builder.prepareLayout());

    EXPECT_EQ(builder.installKernelModules(release), 4);
    const auto target = "build/lib/modules/" + release + "/";
    EXPECT_EQ(dir.read(target + "modules.dep"), kModulesDep);
    EXPECT_TRUE(file_exists(dir.path() + "/" + target + "modules.alias"));
    EXPECT_TRUE(file_exists(dir.path() + "/" + target + "kernel/drivers/usb/host/xhci-pci.ko.zst"));
}

TEST(InitramfsBuilder, MissingModuleDirectoryCopiesNothing) {
    TempDir dir;
    auto settings = default_settings();
    settings.build_dir = dir.path() + "/build";
    InitramfsBuilder builder(settings, { .init_binary = "", .modules_root = dir.path() });

    EXPECT_EQ(builder.installKernelModules("9.9.9"), 0);
    EXPECT_EQ(builder.installKernelModules(""), 0);
}
