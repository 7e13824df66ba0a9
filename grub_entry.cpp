#include "grub_entry.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

#include "utils.hpp"
#include "log.hpp"

const char *const kMenuEntryTitle = "GrubPower Advanced: USB Power Mode";
const char *const kRecoveryEntryTitle = "GrubPower: Recovery Mode (Auto-boot in 30s)";

namespace {

constexpr const char *kEntryMarker = "GrubPower";

typedef struct {
    std::string title;
    size_t first_line;
    size_t last_line;
} menu_block_t;

typedef struct {
    const char *tool;
    const char *args;
} grub_generator_t;

const grub_generator_t kGenerators[] = {
    { "update-grub", "" },
    { "grub-mkconfig", " -o /boot/grub/grub.cfg" },
    { "grub2-mkconfig", " -o /boot/grub2/grub.cfg" },
};

std::vector<std::string> split_lines(const std::string &text) {
    std::vector<std::string> lines;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool is_marker_comment(const std::string &line) {
    const auto t = trim(line);
    return !t.empty() && t[0] == '#' && t.find(kEntryMarker) != std::string::npos;
}

std::vector<menu_block_t> find_blocks(const std::vector<std::string> &lines) {
    static const std::regex entry_re(R"(^\s*menuentry\s+(['"])(.*?)\1)");

    std::vector<menu_block_t> blocks;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::smatch m;
        if (!std::regex_search(lines[i], m, entry_re)) {
            continue;
        }
        const auto title = m[2].str();
        if (title.find(kEntryMarker) == std::string::npos) {
            continue;
        }

        size_t last = i;
        while (last < lines.size() && trim(lines[last]) != "}") {
            ++last;
        }
        if (last == lines.size()) {
            LOG_WARNING("Menu entry '%s' is not terminated", title.c_str());
            last = lines.size() - 1;
        }

        size_t first = i;
        if (first > 0 && is_marker_comment(lines[first - 1])) {
            --first;
        }
        // The separating blank lines belong to the entry.
        while (first > 0 && trim(lines[first - 1]).empty()) {
            --first;
        }
        blocks.push_back({ .title = title, .first_line = first, .last_line = last });
        i = last;
    }
    return blocks;
}

}

std::string make_menu_entry(const settings_t &settings) {
    std::stringstream ss;
    ss << "\n"
       << "# GrubPower Advanced USB Power Mode entry\n"
       << "menuentry '" << kMenuEntryTitle << "' {\n"
       << "    set root=(" << settings.grub_root << ")\n"
       << "    linux " << settings.kernel_path
       << " quiet init=/init acpi=force acpi_osi=Linux acpi_backlight=vendor";
    if (!settings.extra_kernel_params.empty()) {
        ss << " " << settings.extra_kernel_params;
    }
    ss << "\n"
       << "    initrd " << settings.output_dir << "/" << settings.initramfs_name << "\n"
       << "}\n";
    return ss.str();
}

std::string make_recovery_entry() {
    std::stringstream ss;
    ss << "\n"
       << "# GrubPower Recovery Boot Entry (automatically boots main OS after 30 seconds)\n"
       << "menuentry '" << kRecoveryEntryTitle << "' {\n"
       << "    set timeout=30\n"
       << "    set default=0\n"
       << "    terminal_output console\n"
       << "    echo \"GrubPower Recovery Mode: Will boot main OS in 30 seconds...\"\n"
       << "    echo \"Press any key to enter GRUB menu immediately.\"\n"
       << "    sleep 30\n"
       << "    configfile /boot/grub/grub.cfg\n"
       << "}\n";
    return ss.str();
}

std::vector<std::string> list_menu_entries(const std::string &text) {
    std::vector<std::string> titles;
    for (const auto &block : find_blocks(split_lines(text))) {
        titles.push_back(block.title);
    }
    return titles;
}

std::string remove_menu_entries(const std::string &text, const std::vector<size_t> &indexes) {
    const auto lines = split_lines(text);
    const auto blocks = find_blocks(lines);

    std::vector<bool> drop(lines.size(), false);
    for (const auto index : indexes) {
        if (index >= blocks.size()) {
            LOG_WARNING("No menu entry number %zu, skipping", index + 1);
            continue;
        }
        const auto &block = blocks[index];
        LOG_INFO("Removing entry: %s", block.title.c_str());
        std::fill(drop.begin() + block.first_line, drop.begin() + block.last_line + 1, true);
    }

    std::vector<std::string> kept;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!drop[i]) {
            kept.push_back(lines[i]);
        }
    }
    while (!kept.empty() && trim(kept.back()).empty()) {
        kept.pop_back();
    }

    std::string result;
    for (const auto &line : kept) {
        result += line + "\n";
    }
    return result;
}

std::string remove_all_menu_entries(const std::string &text) {
    std::vector<size_t> all(list_menu_entries(text).size());
    for (size_t i = 0; i < all.size(); ++i) {
        all[i] = i;
    }
    return remove_menu_entries(text, all);
}

bool update_grub_config() {
    for (const auto &gen : kGenerators) {
        const auto path = find_executable(gen.tool);
        if (path.empty()) {
            continue;
        }
        LOG_INFO("Updating GRUB configuration with %s", gen.tool);
        if (!run_command(path + gen.args)) {
            LOG_ERROR("%s failed", gen.tool);
            return false;
        }
        return true;
    }
    LOG_WARNING("Could not find GRUB update command. "
            "Please run grub-mkconfig -o /boot/grub/grub.cfg manually.");
    return false;
}
