#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lyricflow::util {

class ContentHasher {
public:
    // SHA-256 as a 64-char lowercase hex string. Empty input hashes to "".
    static std::string sha256_hex(const uint8_t* data, size_t len);
    static std::string sha256_hex(const std::vector<uint8_t>& data);
    static std::string sha256_hex(const std::string& data);

    // Hash of a file's bytes, nullopt when the file cannot be read
    static std::optional<std::string> file_sha256_hex(const std::filesystem::path& path);

    // MIME type sniffed from magic bytes; unknown data is treated as JPEG
    static std::string detect_image_mime(const std::vector<uint8_t>& data);

private:
    static std::string to_hex(const unsigned char* bytes, size_t len);
};

}  // namespace lyricflow::util
