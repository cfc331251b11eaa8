/*
 * config.hpp - Configuration file utilities
 *
 * Locates emu's configuration directory following the XDG Base Directory
 * layout and reads its line-based files (one key:value entry per line,
 * '#' starts a comment). Settings builds on these helpers.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

class Config {
public:
    // Configuration directory: $XDG_CONFIG_HOME/emu, else ~/.config/emu
    static std::string get_config_dir();

    // Creates the configuration directory (and missing parents)
    static bool ensure_config_dir();

    static std::string get_config_path(const std::string& filename);

    // Lines of a config file, trimmed, without comments and blank lines.
    // Empty if the file does not exist.
    static std::vector<std::string> read_config_lines(const std::string& filepath);

    // Splits a line on delimiter. A backslash escapes the next character.
    static std::vector<std::string> parse_fields(const std::string& line, char delimiter = ':');

    // Directory holding bundled default files ($EMU_DATA_DIR overrides)
    static std::string get_data_dir();

    // Copies the bundled default into the config dir unless already present
    static bool install_default_config(const std::string& filename);

    static std::string trim(const std::string& s);

private:
    static std::optional<std::string> cached_config_dir_;
    static std::optional<std::string> cached_data_dir_;

    static bool is_directory(const std::string& path);
    static bool make_dirs(const std::string& path);
};
