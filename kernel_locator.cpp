#include "kernel_locator.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

#include <string.h>
#include <sys/stat.h>
#include <sys/utsname.h>

#include "utils.hpp"
#include "log.hpp"

namespace {

bool version_less(const std::string &a, const std::string &b) {
    return strverscmp(a.c_str(), b.c_str()) < 0;
}

bool is_regular_file(const std::string &path) {
    struct stat st {};
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

// True when mount_point is path or one of its parent directories.
bool covers(const std::string &mount_point, const std::string &path) {
    if (mount_point == "/") {
        return true;
    }
    if (path.compare(0, mount_point.size(), mount_point) != 0) {
        return false;
    }
    return path.size() == mount_point.size() || path[mount_point.size()] == '/';
}

}

std::vector<std::string> list_kernel_images(const std::string &boot_dir) {
    std::vector<std::string> images;
    try { // Catch error in case dir does not exist
        for (const auto &entry : std::filesystem::directory_iterator{boot_dir}) {
            const auto name = entry.path().filename().string();
            if (name.rfind("vmlinuz", 0) != 0 || !entry.is_regular_file()) {
                continue;
            }
            images.push_back(entry.path().string());
        }
    }
    catch (const std::exception &e) {
        LOG_ERROR("Lookup error for kernel images in %s, %s", boot_dir.c_str(), e.what());
    }
    std::sort(images.begin(), images.end(), version_less);
    return images;
}

std::string find_kernel_image(const std::string &boot_dir, const std::string &release) {
    if (!release.empty()) {
        const auto running = boot_dir + "/vmlinuz-" + release;
        if (is_regular_file(running)) {
            return running;
        }
    }

    const auto generic = boot_dir + "/vmlinuz";
    if (is_regular_file(generic)) {
        return generic;
    }

    std::string latest;
    for (const auto &image : list_kernel_images(boot_dir)) {
        if (image.rfind(boot_dir + "/vmlinuz-", 0) == 0) {
            latest = image;
        }
    }
    return latest;
}

std::string kernel_release_from_image(const std::string &image_path) {
    const auto slash = image_path.rfind('/');
    const auto name = (slash == std::string::npos) ? image_path : image_path.substr(slash + 1);
    const std::string prefix = "vmlinuz-";
    if (name.rfind(prefix, 0) != 0 || name.size() == prefix.size()) {
        return "";
    }
    return name.substr(prefix.size());
}

std::string running_kernel_release() {
    struct utsname u;
    if (uname(&u) != 0) {
        LOG_ERROR("uname failed: '%s' (%d)", strerror(errno), errno);
        return "";
    }
    return u.release;
}

std::string grub_root_from_device(const std::string &device) {
    static const std::regex letter_disk("^/dev/(?:sd|vd|hd|xvd)([a-z])([0-9]+)$");
    static const std::regex numbered_disk("^/dev/(?:nvme|mmcblk)([0-9]+)(?:n[0-9]+)?p([0-9]+)$");

    std::smatch m;
    if (std::regex_match(device, m, letter_disk)) {
        const int disk = m[1].str()[0] - 'a';
        return "hd" + std::to_string(disk) + "," + m[2].str();
    }
    if (std::regex_match(device, m, numbered_disk)) {
        return "hd" + m[1].str() + "," + m[2].str();
    }
    return "";
}

std::string mount_source_for(const std::string &path, const std::string &mounts_file) {
    std::ifstream in(mounts_file);
    if (!in.good()) {
        LOG_WARNING("Could not read %s", mounts_file.c_str());
        return "";
    }

    std::string best_source;
    size_t best_len = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::stringstream ss(line);
        std::string source, mount_point;
        if (!(ss >> source >> mount_point)) {
            continue;
        }
        if (covers(mount_point, path) && mount_point.size() >= best_len) {
            best_source = source;
            best_len = mount_point.size();
        }
    }
    return best_source;
}

std::string find_grub_custom_file(const std::string &grub_d) {
    for (const char *name : { "40_custom", "50_custom" }) {
        const auto path = grub_d + "/" + name;
        if (file_exists(path)) {
            return path;
        }
    }
    return "";
}

bool create_grub_custom_file(const std::string &path) {
    std::ofstream out(path);
    if (!out.good()) {
        LOG_ERROR("Could not create %s: '%s' (%d)", path.c_str(), strerror(errno), errno);
        return false;
    }
    out << "#!/bin/sh\n"
        << "exec tail -n +3 $0\n"
        << "# This file provides an easy way to add custom menu entries.\n";
    out.close();
    if (chmod(path.c_str(), 0755) != 0) {
        LOG_ERROR("Could not make %s executable: '%s' (%d)", path.c_str(), strerror(errno), errno);
        return false;
    }
    return true;
}
