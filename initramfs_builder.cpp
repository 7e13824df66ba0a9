#include "initramfs_builder.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <utility>

#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "early_init.hpp"
#include "utils.hpp"
#include "log.hpp"

const std::vector<std::string> kBusyboxApplets = {
    "sh", "sleep", "echo", "cat", "clear", "date", "grep", "mkdir", "touch",
    "ls", "mount", "modprobe", "insmod", "lsmod", "rmmod", "find",
};

const std::vector<std::string> kOptionalTools = {
    "vbetool",
    "setterm",
    "acpid",
    "lsusb",
};

namespace {

const char *const kLayout[] = {
    "bin", "dev", "proc", "sys", "etc", "var/log", "lib/modules",
};

// Module support files modprobe needs inside the image.
const char *const kModuleIndexes[] = {
    "modules.dep",
    "modules.alias",
    "modules.builtin",
};

std::string dirname_of(const std::string &path) {
    const auto slash = path.rfind('/');
    if (slash == std::string::npos) {
        return ".";
    }
    return slash == 0 ? "/" : path.substr(0, slash);
}

std::string basename_of(const std::string &path) {
    const auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool copy_with_mode(const std::string &from, const std::string &to) {
    struct stat st {};
    if (stat(from.c_str(), &st) != 0) {
        LOG_ERROR("Could not stat %s: '%s' (%d)", from.c_str(), strerror(errno), errno);
        return false;
    }
    if (!make_dirs(dirname_of(to)) || !copy_file(from, to)) {
        return false;
    }
    if (chmod(to.c_str(), st.st_mode & 07777) != 0) {
        LOG_ERROR("chmod %s failed: '%s' (%d)", to.c_str(), strerror(errno), errno);
        return false;
    }
    return true;
}

}

std::vector<std::string> parse_ldd_output(const std::string &output) {
    static const std::regex lib_re(R"((/[^\s()]+))");

    std::vector<std::string> libs;
    std::stringstream ss(output);
    std::string line;
    while (std::getline(ss, line)) {
        // "libc.so.6 => /lib/x86_64-linux-gnu/libc.so.6 (0x...)" or
        // "/lib64/ld-linux-x86-64.so.2 (0x...)"
        const auto arrow = line.find("=>");
        const auto tail = (arrow == std::string::npos) ? line : line.substr(arrow + 2);
        std::smatch m;
        if (std::regex_search(tail, m, lib_re)) {
            libs.push_back(m[1].str());
        }
    }
    std::sort(libs.begin(), libs.end());
    libs.erase(std::unique(libs.begin(), libs.end()), libs.end());
    return libs;
}

std::string module_name_from_path(const std::string &path) {
    auto name = basename_of(path);
    const auto ext = name.find(".ko");
    if (ext != std::string::npos) {
        name.erase(ext);
    }
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

std::vector<std::string> module_with_dependencies(const std::string &modules_dep,
                                                  const std::string &module) {
    std::string wanted = module;
    std::replace(wanted.begin(), wanted.end(), '-', '_');

    std::stringstream ss(modules_dep);
    std::string line;
    while (std::getline(ss, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const auto path = trim(line.substr(0, colon));
        if (module_name_from_path(path) != wanted) {
            continue;
        }

        // Dependencies are listed so that the last one must load first.
        std::stringstream deps(line.substr(colon + 1));
        std::vector<std::string> result;
        std::string dep;
        while (deps >> dep) {
            result.push_back(dep);
        }
        std::reverse(result.begin(), result.end());
        result.push_back(path);
        return result;
    }
    return {};
}

InitramfsBuilder::InitramfsBuilder(const settings_t &settings, image_sources_t sources)
    : mSettings(settings)
    , mSources(std::move(sources))
{
}

bool
InitramfsBuilder::build(const std::string &config_text, const std::string &kernel_release) {
    LOG_INFO("Building initramfs image in %s...", mSettings.build_dir.c_str());
    if (!prepareLayout() || !installInit() || !installConfig(config_text) || !installBusybox()) {
        return false;
    }

    const int tools = installOptionalTools();
    LOG_INFO("Added %d optional tool(s)", tools);

    const int modules = installKernelModules(kernel_release);
    if (modules == 0) {
        LOG_WARNING("No kernel modules copied; the image relies on built-in drivers.");
    }

    return package();
}

bool
InitramfsBuilder::prepareLayout() {
    for (const auto *dir : kLayout) {
        if (!make_dirs(mSettings.build_dir + "/" + dir)) {
            LOG_ERROR("Could not lay out %s", mSettings.build_dir.c_str());
            return false;
        }
    }
    return true;
}

bool
InitramfsBuilder::installInit() {
    if (!file_exists(mSources.init_binary)) {
        LOG_ERROR("Init binary %s not found", mSources.init_binary.c_str());
        return false;
    }
    return installBinary(mSources.init_binary, mSettings.build_dir + "/init");
}

bool
InitramfsBuilder::installConfig(const std::string &config_text) {
    return write_text_file(mSettings.build_dir + "/etc/grubpower.conf", config_text);
}

bool
InitramfsBuilder::installBusybox() {
    const auto busybox = find_executable("busybox");
    if (busybox.empty()) {
        LOG_ERROR("busybox not found. Please install busybox (preferably a static build).");
        return false;
    }
    if (!installBinary(busybox, mSettings.build_dir + "/bin/busybox")) {
        return false;
    }

    for (const auto &applet : kBusyboxApplets) {
        const auto link = mSettings.build_dir + "/bin/" + applet;
        (void)unlink(link.c_str());
        if (symlink("busybox", link.c_str()) != 0) {
            LOG_ERROR("Could not link %s: '%s' (%d)", link.c_str(), strerror(errno), errno);
            return false;
        }
    }
    return true;
}

int
InitramfsBuilder::installOptionalTools() {
    int installed = 0;
    for (const auto &tool : kOptionalTools) {
        const auto path = find_executable(tool);
        if (path.empty()) {
            LOG_DEBUG("%s not available on this system", tool.c_str());
            continue;
        }
        if (!installBinary(path, mSettings.build_dir + "/bin/" + tool)) {
            LOG_WARNING("Could not add %s to initramfs", tool.c_str());
            continue;
        }
        LOG_INFO("Added %s to initramfs", tool.c_str());
        ++installed;
    }
    return installed;
}

int
InitramfsBuilder::installKernelModules(const std::string &kernel_release) {
    const auto module_dir = mSources.modules_root + "/" + kernel_release;
    if (kernel_release.empty() || !is_directory(module_dir)) {
        LOG_WARNING("Could not find kernel modules directory for kernel %s", kernel_release.c_str());
        return 0;
    }

    const auto target_dir = mSettings.build_dir + "/lib/modules/" + kernel_release;
    for (const auto *index : kModuleIndexes) {
        const auto source = module_dir + "/" + index;
        if (file_exists(source) && !copy_with_mode(source, target_dir + "/" + index)) {
            LOG_WARNING("Could not copy %s", index);
        }
    }

    std::string modules_dep;
    if (!read_text_file(module_dir + "/modules.dep", modules_dep)) {
        return 0;
    }

    std::vector<std::string> copied;
    for (const auto &module : moduleList()) {
        const auto files = module_with_dependencies(modules_dep, module);
        if (files.empty()) {
            LOG_DEBUG("%s is built in or unavailable", module.c_str());
            continue;
        }
        for (const auto &file : files) {
            if (std::find(copied.begin(), copied.end(), file) != copied.end()) {
                continue;
            }
            if (!copy_with_mode(module_dir + "/" + file, target_dir + "/" + file)) {
                LOG_WARNING("Could not copy module %s", file.c_str());
                continue;
            }
            copied.push_back(file);
        }
        LOG_DEBUG("Copied module: %s", module.c_str());
    }
    LOG_INFO("Copied %zu kernel module file(s)", copied.size());
    return static_cast<int>(copied.size());
}

bool
InitramfsBuilder::package() {
    if (!make_dirs(mSettings.output_dir)) {
        return false;
    }

    const auto image = imagePath();
    const auto tmp = image + ".tmp";
    LOG_INFO("Packaging initramfs image...");
    const auto cmd = "cd " + shell_quote(mSettings.build_dir) +
        " && find . | cpio -H newc -o --quiet | gzip -9 > " + shell_quote(tmp);
    if (!run_command(cmd)) {
        LOG_ERROR("Packaging %s failed", image.c_str());
        (void)unlink(tmp.c_str());
        return false;
    }
    if (rename(tmp.c_str(), image.c_str()) != 0) {
        LOG_ERROR("Could not move image to %s: '%s' (%d)", image.c_str(), strerror(errno), errno);
        (void)unlink(tmp.c_str());
        return false;
    }
    LOG_INFO("Initramfs created at %s", image.c_str());
    return true;
}

std::string
InitramfsBuilder::imagePath() const {
    return mSettings.output_dir + "/" + mSettings.initramfs_name;
}

std::vector<std::string>
InitramfsBuilder::moduleList() const {
    std::vector<std::string> modules = kEssentialModules;
    modules.insert(modules.end(), kHostControllerModules.begin(), kHostControllerModules.end());
    modules.push_back("usb_storage");
    modules.push_back("acpi_button");

    std::stringstream extra(mSettings.extra_modules);
    std::string m;
    while (extra >> m) {
        modules.push_back(m);
    }
    return modules;
}

bool
InitramfsBuilder::installBinary(const std::string &source, const std::string &target) {
    if (!copy_with_mode(source, target)) {
        return false;
    }
    return installLibraries(source);
}

bool
InitramfsBuilder::installLibraries(const std::string &binary) {
    std::string output;
    if (!capture_command("ldd " + shell_quote(binary) + " 2>/dev/null", output)) {
        // Static binaries make ldd exit non-zero.
        LOG_DEBUG("No shared libraries listed for %s", binary.c_str());
        return true;
    }

    bool ok = true;
    for (const auto &lib : parse_ldd_output(output)) {
        if (!file_exists(lib)) {
            continue;
        }
        if (!copy_with_mode(lib, mSettings.build_dir + lib)) {
            LOG_ERROR("Could not copy library %s", lib.c_str());
            ok = false;
        }
    }
    return ok;
}
