#pragma once
#include "types.hpp"
#include <string>
#include <iostream>
#include <fstream>

namespace {
template<typename t>
t get_value_from_file(const std::string &filename, t failed_value) {
    std::ifstream f(filename);
    if (!f.good()) {
        return failed_value;
    }
    t value = failed_value;
    f >> value;
    if (f.fail()) {
        return failed_value;
    }

    return value;
}

template<typename t>
bool write_value_to_file(const std::string &filename, const t &value) {
    std::ofstream f(filename);
    if (!f.good()) {
        return false;
    }
    f << value;
    f.flush();

    return f.good();
}
}

timestamp_t get_timestamp();

// First line of a file with surrounding whitespace removed, or failed_value.
std::string get_line_from_file(const std::string &filename,
                               const std::string &failed_value = "");

bool file_exists(const std::string &path);
bool is_directory(const std::string &path);

std::string trim(const std::string &s);
std::string to_lower(std::string s);
std::vector<std::string> split(const std::string &s, char delimiter);

// Absolute path of an executable found in PATH, or empty string.
std::string find_executable(const std::string &name);

// Runs a shell command, logging a warning when it does not exit with 0.
bool run_command(const std::string &cmd);

bool read_text_file(const std::string &path, std::string &content);
bool write_text_file(const std::string &path, const std::string &content);
bool copy_file(const std::string &from, const std::string &to);

// Creates path and its missing parents with mode 0755.
bool make_dirs(const std::string &path);

// Runs cmd and collects its standard output. False if it cannot be started
// or does not exit with 0.
bool capture_command(const std::string &cmd, std::string &output);

// Quotes s for use as a single /bin/sh word.
std::string shell_quote(const std::string &s);
