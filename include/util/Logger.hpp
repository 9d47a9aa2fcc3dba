#pragma once

#include <string>

namespace lyricflow::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Lines always go to stderr; file_path adds an appended copy on disk.
    static void init(Level min_level, const std::string& file_path = "");
    static void set_level(Level min_level);
    static Level parse_level(const std::string& name, Level fallback);

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace lyricflow::util
