#include "utils.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cerrno>

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "log.hpp"

timestamp_t get_timestamp() {
    using std::chrono::duration_cast;
    using std::chrono::seconds;
    using std::chrono::steady_clock;
    const auto now = std::chrono::steady_clock::now();
    const auto duration = duration_cast<seconds>(now.time_since_epoch());

    timestamp_t time = duration.count();

    return time;
}

std::string get_line_from_file(const std::string &filename,
                               const std::string &failed_value) {
    std::ifstream f(filename);
    if (!f.good()) {
        return failed_value;
    }
    std::string line;
    if (!std::getline(f, line)) {
        return failed_value;
    }
    return trim(line);
}

bool file_exists(const std::string &path) {
    struct stat st {};
    return stat(path.c_str(), &st) == 0;
}

bool is_directory(const std::string &path) {
    struct stat st {};
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string trim(const std::string &s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::vector<std::string> split(const std::string &s, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string part;
    while (std::getline(ss, part, delimiter)) {
        part = trim(part);
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

std::string find_executable(const std::string &name) {
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }
    const char *path_env = getenv("PATH");
    const std::string search_path = path_env ? path_env : "/sbin:/bin:/usr/sbin:/usr/bin";
    for (const auto &dir : split(search_path, ':')) {
        const std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0 && !is_directory(candidate)) {
            return candidate;
        }
    }
    return "";
}

bool run_command(const std::string &cmd) {
    LOG_DEBUG("Running: '%s'", cmd.c_str());
    const int status = system(cmd.c_str());
    if (status == -1) {
        LOG_WARNING("Could not run '%s': '%s' (%d)", cmd.c_str(), strerror(errno), errno);
        return false;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        LOG_DEBUG("'%s' exited with status %d", cmd.c_str(),
                WIFEXITED(status) ? WEXITSTATUS(status) : -1);
        return false;
    }
    return true;
}

bool read_text_file(const std::string &path, std::string &content) {
    std::ifstream f(path, std::ios::binary);
    if (!f.good()) {
        LOG_ERROR("Could not open %s: '%s' (%d)", path.c_str(), strerror(errno), errno);
        return false;
    }
    std::stringstream ss;
    ss << f.rdbuf();
    content = ss.str();
    return true;
}

bool write_text_file(const std::string &path, const std::string &content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.good()) {
        LOG_ERROR("Could not write %s: '%s' (%d)", path.c_str(), strerror(errno), errno);
        return false;
    }
    f << content;
    f.flush();
    return f.good();
}

bool copy_file(const std::string &from, const std::string &to) {
    std::ifstream in(from, std::ios::binary);
    if (!in.good()) {
        LOG_ERROR("Could not open %s: '%s' (%d)", from.c_str(), strerror(errno), errno);
        return false;
    }
    std::ofstream out(to, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
        LOG_ERROR("Could not write %s: '%s' (%d)", to.c_str(), strerror(errno), errno);
        return false;
    }
    out << in.rdbuf();
    out.flush();
    return out.good();
}

bool make_dirs(const std::string &path) {
    std::string partial;
    if (!path.empty() && path[0] != '/') {
        partial = ".";
    }
    std::stringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (part.empty()) {
            continue;
        }
        partial += "/" + part;
        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            LOG_WARNING("Could not create %s: '%s' (%d)", partial.c_str(), strerror(errno), errno);
            return false;
        }
    }
    return true;
}

bool capture_command(const std::string &cmd, std::string &output) {
    LOG_DEBUG("Running: '%s'", cmd.c_str());
    FILE *pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        LOG_WARNING("Could not run '%s': '%s' (%d)", cmd.c_str(), strerror(errno), errno);
        return false;
    }
    output.clear();
    char buf[4096];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), pipe)) > 0) {
        output.append(buf, n);
    }
    const int status = pclose(pipe);
    if (status == -1) {
        LOG_WARNING("pclose failed for '%s': '%s' (%d)", cmd.c_str(), strerror(errno), errno);
        return false;
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

std::string shell_quote(const std::string &s) {
    std::string quoted = "'";
    for (const char c : s) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}
