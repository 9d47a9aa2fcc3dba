#include "core/SidecarWriter.hpp"
#include "util/ContentHasher.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace lyricflow::core {

namespace fs = std::filesystem;

fs::path SidecarWriter::temp_path_for(const fs::path& target) {
    static std::atomic<uint64_t> counter{0};
    std::string name = "." + target.filename().string() + ".tmp-" +
                       std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1));
    return target.parent_path() / name;
}

WriteResult SidecarWriter::write_text(const fs::path& target, const std::string& text) {
    return write_bytes(target, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

WriteResult SidecarWriter::write_bytes(const fs::path& target, const uint8_t* data, size_t size) {
    std::error_code ec;
    if (fs::is_regular_file(target, ec)) {
        auto existing = util::ContentHasher::file_sha256_hex(target);
        if (existing && fs::file_size(target, ec) == size && !ec &&
            *existing == util::ContentHasher::sha256_hex(data, size)) {
            util::Logger::debug("SidecarWriter: Unchanged " + target.string());
            return WriteResult::Unchanged;
        }
    }

    fs::path temp = temp_path_for(target);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            util::Logger::error("SidecarWriter: Failed to create " + temp.string());
            return WriteResult::Failed;
        }
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        out.flush();
        if (!out) {
            util::Logger::error("SidecarWriter: Write failed for " + temp.string());
            out.close();
            fs::remove(temp, ec);
            return WriteResult::Failed;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        util::Logger::error("SidecarWriter: Failed to move into place " + target.string() + ": " + ec.message());
        std::error_code ignored;
        fs::remove(temp, ignored);
        return WriteResult::Failed;
    }
    return WriteResult::Written;
}

}  // namespace lyricflow::core
