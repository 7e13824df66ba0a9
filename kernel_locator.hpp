#pragma once

#include <string>
#include <vector>

// Regular files named vmlinuz* in boot_dir, oldest version first.
std::vector<std::string> list_kernel_images(const std::string &boot_dir);

// vmlinuz-<release>, then vmlinuz, then the newest vmlinuz-*. Empty if none.
std::string find_kernel_image(const std::string &boot_dir, const std::string &release);

// "/boot/vmlinuz-6.1.0-13-amd64" -> "6.1.0-13-amd64", empty if not versioned.
std::string kernel_release_from_image(const std::string &image_path);

std::string running_kernel_release();

// GRUB device for a partition node, e.g. /dev/sda2 -> "hd0,2". Empty if the
// node name is not understood.
std::string grub_root_from_device(const std::string &device);

// Block device holding the filesystem mounted at or above path.
std::string mount_source_for(const std::string &path,
                             const std::string &mounts_file = "/proc/self/mounts");

// 40_custom, then 50_custom in grub_d. Empty if neither exists.
std::string find_grub_custom_file(const std::string &grub_d);

// Creates a minimal executable custom menu script at path.
bool create_grub_custom_file(const std::string &path);
