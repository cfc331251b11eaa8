/*
 * config.cpp - Configuration file utilities implementation
 *
 * Resolves the XDG config directory for emu and the directory holding the
 * bundled defaults. Line-based files are read with comments and blank lines
 * stripped; fields are split on a delimiter with backslash escapes.
 */

#include "config.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

std::optional<std::string> Config::cached_config_dir_;
std::optional<std::string> Config::cached_data_dir_;

namespace {

const char* home_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return home;
    }
    struct passwd* pw = getpwuid(getuid());
    return pw ? pw->pw_dir : nullptr;
}

} // namespace

std::string Config::trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool Config::is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool Config::make_dirs(const std::string& path) {
    if (path.empty() || is_directory(path)) {
        return true;
    }

    size_t slash = path.rfind('/');
    if (slash != std::string::npos && slash > 0 && !make_dirs(path.substr(0, slash))) {
        return false;
    }
    return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
}

std::string Config::get_config_dir() {
    if (cached_config_dir_) {
        return *cached_config_dir_;
    }

    std::string dir;
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config && xdg_config[0] != '\0') {
        dir = std::string(xdg_config) + "/emu";
    } else if (const char* home = home_dir()) {
        dir = std::string(home) + "/.config/emu";
    } else {
        dir = ".";
    }

    cached_config_dir_ = dir;
    return dir;
}

bool Config::ensure_config_dir() {
    return make_dirs(get_config_dir());
}

std::string Config::get_config_path(const std::string& filename) {
    return get_config_dir() + "/" + filename;
}

std::vector<std::string> Config::read_config_lines(const std::string& filepath) {
    std::vector<std::string> lines;
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return lines;
    }

    std::string raw;
    while (std::getline(file, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> Config::parse_fields(const std::string& line, char delimiter) {
    std::vector<std::string> fields(1);
    bool escaped = false;

    for (char c : line) {
        if (escaped) {
            fields.back() += c;
            escaped = false;
        } else if (c == '\\') {
            escaped = true;
        } else if (c == delimiter) {
            fields.emplace_back();
        } else {
            fields.back() += c;
        }
    }
    return fields;
}

std::string Config::get_data_dir() {
    if (cached_data_dir_) {
        return *cached_data_dir_;
    }

    std::vector<std::string> candidates;
    const char* env_dir = std::getenv("EMU_DATA_DIR");
    if (env_dir && env_dir[0] != '\0') {
        candidates.push_back(env_dir);
    }

    // Next to the executable first, for running from a build tree
    char exe_path[4096];
    ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len > 0) {
        exe_path[len] = '\0';
        std::string exe_dir(exe_path);
        exe_dir = exe_dir.substr(0, exe_dir.rfind('/'));
        candidates.push_back(exe_dir + "/data");
        candidates.push_back(exe_dir + "/../data");
    }

    candidates.push_back("/usr/local/share/emu");
    candidates.push_back("/usr/share/emu");
    candidates.push_back("./data");

    for (const auto& path : candidates) {
        if (is_directory(path)) {
            cached_data_dir_ = path;
            return path;
        }
    }

    cached_data_dir_ = "./data";
    return *cached_data_dir_;
}

bool Config::install_default_config(const std::string& filename) {
    std::string dest_path = get_config_path(filename);

    struct stat st;
    if (stat(dest_path.c_str(), &st) == 0) {
        return true;
    }
    if (!ensure_config_dir()) {
        return false;
    }

    std::ifstream src(get_data_dir() + "/" + filename, std::ios::binary);
    if (!src.is_open()) {
        return false;
    }
    std::ofstream dst(dest_path, std::ios::binary);
    if (!dst.is_open()) {
        return false;
    }

    dst << src.rdbuf();
    return dst.good();
}
