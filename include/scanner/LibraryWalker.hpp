#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace lyricflow::scanner {

/**
 * LibraryWalker: recursive library walk using the getdents64 syscall.
 *
 * Uses 256KB buffers to batch syscalls and the d_type field to avoid a stat()
 * per entry. Only entries whose filename PathClassifier recognizes are
 * returned; hidden directories are not descended into. A directory that
 * cannot be opened is recorded and skipped, never fatal.
 */
class LibraryWalker {
public:
    struct WalkResult {
        std::vector<std::string> media_files;        // Absolute paths, sorted
        std::vector<std::string> unreadable_dirs;
        size_t directories_visited = 0;
    };

    [[nodiscard]] static WalkResult walk(const std::filesystem::path& root_dir);

private:
    static constexpr size_t BUFFER_SIZE = 256 * 1024;

    static void walk_recursive(const std::string& dir_path, WalkResult& result);
    static void consider_file(const std::string& dir_path, const char* name, WalkResult& result);
};

}  // namespace lyricflow::scanner
