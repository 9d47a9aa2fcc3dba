#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace lyricflow::core {

enum class WriteResult {
    Written,
    Unchanged,  // Target already held identical bytes
    Failed,
};

/**
 * SidecarWriter: all-or-nothing writes of .lrc and cover.jpg files.
 *
 * Content goes to a hidden temporary file in the target directory and is
 * renamed over the target only after it was fully written, so a crash leaves
 * either the old file or the new one. The temporary name starts with '.' and
 * is therefore never picked up by a library walk.
 */
class SidecarWriter {
public:
    static WriteResult write_text(const std::filesystem::path& target, const std::string& text);
    static WriteResult write_bytes(const std::filesystem::path& target, const uint8_t* data, size_t size);

private:
    static std::filesystem::path temp_path_for(const std::filesystem::path& target);
};

}  // namespace lyricflow::core
