#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace lorchestre::backend {

namespace {
    std::string trim(const std::string& str) {
        auto start = str.find_first_not_of(" \t\r");
        if (start == std::string::npos) return "";
        auto end = str.find_last_not_of(" \t\r");
        return str.substr(start, end - start + 1);
    }

    // Drops a trailing "# comment" that is not inside quotes
    std::string strip_comment(const std::string& value) {
        bool quoted = false;
        for (size_t i = 0; i < value.size(); ++i) {
            if (value[i] == '"') quoted = !quoted;
            else if (value[i] == '#' && !quoted) return trim(value.substr(0, i));
        }
        return value;
    }
}

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        return load_from_file(config_file);
    }
    util::Logger::info("Config: No config at " + config_file.string() + ", using defaults");
    return create_default_config();
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot read " + path.string() + ", using defaults");
        return create_default_config();
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

Config ConfigLoader::load_from_string(const std::string& text) {
    Config cfg = create_default_config();

    std::istringstream input(text);
    std::string line, current_section;
    while (std::getline(input, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Ignoring line without '=': " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = strip_comment(trim(line.substr(eq_pos + 1)));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "network") {
            if (key == "host") {
                cfg.host = value;
            } else if (key == "port") {
                unsigned port = 0;
                auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
                if (ec != std::errc{} || ptr != value.data() + value.size() || port == 0 ||
                    port > std::numeric_limits<uint16_t>::max()) {
                    util::Logger::warn("Config: Invalid port '" + value + "', keeping " + std::to_string(cfg.port));
                } else {
                    cfg.port = static_cast<uint16_t>(port);
                }
            }
        } else if (current_section == "library") {
            if (key == "music_directory") cfg.music_directory = resolve_directory(value);
        } else if (current_section == "paths") {
            if (key == "cache_directory") cfg.cache_directory = resolve_directory(value);
            // Older files kept the music directory here
            else if (key == "music_directory") cfg.music_directory = resolve_directory(value);
        } else if (current_section == "log") {
            if (key == "file") cfg.log_file = expand_home(value);
            else if (key == "level") cfg.log_level = value;
        } else {
            util::Logger::debug("Config: Unknown key " + current_section + "." + key);
        }
    }

    return cfg;
}

void ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        util::Logger::error("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
        return;
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Cannot write " + path.string());
        return;
    }

    file << "# lorchestre daemon config\n";
    file << "# Generated on first run; edit with care\n\n";

    file << "[network]\n";
    file << "# Address the HTTP server binds to\n";
    file << "host = \"" << cfg.host << "\"\n";
    file << "port = " << cfg.port << "\n\n";

    file << "[library]\n";
    file << "# Root of the audio collection, scanned recursively\n";
    file << "music_directory = \"" << cfg.music_directory.string() << "\"\n\n";

    file << "[paths]\n";
    file << "# Covers and the library fingerprint live here\n";
    file << "cache_directory = \"" << cfg.cache_directory.string() << "\"\n\n";

    file << "[log]\n";
    file << "file = \"" << cfg.log_file.string() << "\"\n";
    file << "# Level: \"debug\", \"info\", \"warn\", \"error\"\n";
    file << "level = \"" << cfg.log_level << "\"\n";
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.music_directory = util::Platform::get_music_directory();
    cfg.cache_directory = util::Platform::get_cache_directory();
    return cfg;
}

std::filesystem::path ConfigLoader::expand_home(const std::string& value) {
    if (value.size() >= 2 && value[0] == '~' && value[1] == '/') {
        if (const char* home = std::getenv("HOME")) {
            return std::filesystem::path(home) / value.substr(2);
        }
    }
    return std::filesystem::path(value);
}

std::filesystem::path ConfigLoader::resolve_directory(const std::string& value) {
    std::filesystem::path path = expand_home(value);
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        util::Logger::warn("Config: Cannot make " + path.string() + " absolute: " + ec.message());
        return path;
    }
    return absolute.lexically_normal();
}

}  // namespace lorchestre::backend
