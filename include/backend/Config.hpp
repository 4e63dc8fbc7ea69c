#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace lorchestre::backend {

struct Config {
    // Network settings
    std::string host = "localhost";
    uint16_t port = 7700;

    // Library settings
    std::filesystem::path music_directory;

    // Directory settings
    std::filesystem::path cache_directory;

    // Log settings
    std::filesystem::path log_file = "/tmp/lorchestre.log";
    std::string log_level = "info";
};

class ConfigLoader {
public:
    // ~/.config/lorchestre/config.toml, defaults when it does not exist
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static Config load_from_string(const std::string& text);
    static void save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
    static Config create_default_config();

private:
    // Leading "~/" becomes $HOME/
    static std::filesystem::path expand_home(const std::string& value);

    // expand_home, then anchored at the working directory; track paths
    // derived from the music directory must be absolute
    static std::filesystem::path resolve_directory(const std::string& value);
};

}  // namespace lorchestre::backend
