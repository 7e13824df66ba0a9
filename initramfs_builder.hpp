#pragma once

#include <string>
#include <vector>

#include "types.hpp"

// Busybox applets linked into /bin.
extern const std::vector<std::string> kBusyboxApplets;
// Tools copied into the image when the build host has them.
extern const std::vector<std::string> kOptionalTools;

typedef struct {
    std::string init_binary;
    std::string modules_root;
} image_sources_t;

// Absolute library paths in ldd output, sorted and unique.
std::vector<std::string> parse_ldd_output(const std::string &output);

// Normalised module name of a .ko path: "kernel/x/xhci-pci.ko.zst" -> "xhci_pci".
std::string module_name_from_path(const std::string &path);

// Relative paths of a module and everything it depends on according to
// modules.dep text, dependencies first. Empty when the module is not listed.
std::vector<std::string> module_with_dependencies(const std::string &modules_dep,
                                                  const std::string &module);

class InitramfsBuilder {
public:
    InitramfsBuilder(const settings_t &settings, image_sources_t sources);

    // Runs every step below and packages the image.
    bool build(const std::string &config_text, const std::string &kernel_release);

    bool prepareLayout();
    bool installInit();
    bool installConfig(const std::string &config_text);
    bool installBusybox();
    int installOptionalTools();
    int installKernelModules(const std::string &kernel_release);
    bool package();

    std::string imagePath() const;
    std::vector<std::string> moduleList() const;

private:
    bool installBinary(const std::string &source, const std::string &target);
    bool installLibraries(const std::string &binary);

    settings_t mSettings;
    image_sources_t mSources;
};
