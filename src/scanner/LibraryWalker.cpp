#include "scanner/LibraryWalker.hpp"
#include "scanner/PathClassifier.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <unistd.h>

namespace lyricflow::scanner {

// Linux dirent64 structure for getdents64 syscall
struct linux_dirent64 {
    uint64_t d_ino;
    int64_t  d_off;
    uint16_t d_reclen;
    uint8_t  d_type;
    char     d_name[];
};

constexpr uint8_t TYPE_UNKNOWN = 0;
constexpr uint8_t TYPE_DIR = 4;
constexpr uint8_t TYPE_REG = 8;
constexpr uint8_t TYPE_LNK = 10;

LibraryWalker::WalkResult LibraryWalker::walk(const std::filesystem::path& root_dir) {
    WalkResult result;

    // Strip trailing slashes to prevent // in paths
    std::string root_str = std::filesystem::absolute(root_dir).lexically_normal().string();
    while (root_str.length() > 1 && root_str.back() == '/') {
        root_str.pop_back();
    }
    util::Logger::info("LibraryWalker: Scanning " + root_str);

    walk_recursive(root_str, result);
    std::sort(result.media_files.begin(), result.media_files.end());

    util::Logger::info("LibraryWalker: Found " + std::to_string(result.media_files.size()) +
                       " media files in " + std::to_string(result.directories_visited) + " directories");
    return result;
}

void LibraryWalker::consider_file(const std::string& dir_path, const char* name, WalkResult& result) {
    if (PathClassifier::is_excluded_filename(name)) return;
    if (!PathClassifier::kind_for_filename(name)) return;
    result.media_files.push_back(dir_path + "/" + name);
}

void LibraryWalker::walk_recursive(const std::string& dir_path, WalkResult& result) {
    int fd = open(dir_path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        util::Logger::warn("LibraryWalker: Cannot open directory " + dir_path + ": " + std::strerror(errno));
        result.unreadable_dirs.push_back(dir_path);
        return;
    }
    ++result.directories_visited;

    std::vector<char> buffer(BUFFER_SIZE);
    std::vector<std::string> subdirs;

    while (true) {
        long nread = syscall(SYS_getdents64, fd, buffer.data(), buffer.size());

        if (nread == -1) {
            util::Logger::error("LibraryWalker: getdents64 failed for " + dir_path);
            result.unreadable_dirs.push_back(dir_path);
            break;
        }
        if (nread == 0) {
            break;
        }

        for (long pos = 0; pos < nread;) {
            auto* d = reinterpret_cast<linux_dirent64*>(buffer.data() + pos);
            pos += d->d_reclen;

            // Skips ".", ".." and hidden entries alike
            if (d->d_name[0] == '.') continue;

            uint8_t type = d->d_type;
            if (type == TYPE_UNKNOWN || type == TYPE_LNK) {
                // Filesystem without d_type, or a symlink: resolve with stat
                struct stat entry_stat;
                if (fstatat(fd, d->d_name, &entry_stat, 0) != 0) {
                    util::Logger::debug("LibraryWalker: Cannot stat " + dir_path + "/" + d->d_name);
                    continue;
                }
                if (S_ISREG(entry_stat.st_mode)) type = TYPE_REG;
                else if (S_ISDIR(entry_stat.st_mode) && d->d_type != TYPE_LNK) type = TYPE_DIR;
                else continue;  // Symlinked directories are not followed
            }

            if (type == TYPE_REG) {
                consider_file(dir_path, d->d_name, result);
            } else if (type == TYPE_DIR) {
                subdirs.push_back(dir_path + "/" + d->d_name);
            }
        }
    }

    close(fd);

    // Recurse after closing to keep at most one descriptor open per level
    for (const auto& subdir : subdirs) {
        walk_recursive(subdir, result);
    }
}

}  // namespace lyricflow::scanner
