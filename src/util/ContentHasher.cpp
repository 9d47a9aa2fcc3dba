#include "util/ContentHasher.hpp"
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <openssl/sha.h>
#include <sstream>

namespace lyricflow::util {

std::string ContentHasher::to_hex(const unsigned char* bytes, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::string ContentHasher::sha256_hex(const uint8_t* data, size_t len) {
    if (len == 0) {
        return "";
    }
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data, len, hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string ContentHasher::sha256_hex(const std::vector<uint8_t>& data) {
    return sha256_hex(data.data(), data.size());
}

std::string ContentHasher::sha256_hex(const std::string& data) {
    return sha256_hex(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::optional<std::string> ContentHasher::file_sha256_hex(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return sha256_hex(data);
}

std::string ContentHasher::detect_image_mime(const std::vector<uint8_t>& data) {
    static const uint8_t png_magic[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};

    if (data.size() >= 8 && std::memcmp(data.data(), png_magic, 8) == 0) {
        return "image/png";
    }
    if (data.size() >= 2 && data[0] == 0xFF && data[1] == 0xD8) {
        return "image/jpeg";
    }
    if (data.size() >= 4 && std::memcmp(data.data(), "GIF8", 4) == 0) {
        return "image/gif";
    }
    if (data.size() >= 12 && std::memcmp(data.data(), "RIFF", 4) == 0 &&
        std::memcmp(data.data() + 8, "WEBP", 4) == 0) {
        return "image/webp";
    }
    return "image/jpeg";
}

}  // namespace lyricflow::util
