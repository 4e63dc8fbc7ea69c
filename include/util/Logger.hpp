#pragma once

#include <filesystem>
#include <string>

namespace lorchestre::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens (truncates) the log file; messages below min_level are dropped.
    // When mirror_stderr is set, Warn and Error also go to stderr.
    static void init(const std::filesystem::path& path = "/tmp/lorchestre.log",
                     Level min_level = Level::Debug,
                     bool mirror_stderr = false);
    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // "debug" | "info" | "warn" | "error", anything else maps to Info
    static Level parse_level(const std::string& name);
};

}  // namespace lorchestre::util
