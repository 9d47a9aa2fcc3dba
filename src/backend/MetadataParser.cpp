#include "backend/MetadataParser.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <mpg123.h>
#include <sndfile.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
}

/*
 * Basic tag reading goes through the same libraries the audio stack decodes with:
 * mpg123 for MP3 ID3 tags, libsndfile for FLAC, OGG/Vorbis and WAV comments,
 * and libavformat for MP4/M4A, WMA and APE containers. Lyrics and pictures are
 * handled by TagEditor, which needs write access these libraries do not offer.
 */

namespace lyricflow::backend {

namespace {
    std::string trim(const std::string& str) {
        if (str.empty()) return "";
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, (last - first + 1));
    }

    // ID3v1 fields are fixed width and may lack a terminator
    std::string fixed_field(const char* data, size_t len) {
        return trim(std::string(data, strnlen(data, len)));
    }
}

// Helper class to ensure mpg123 is initialized
struct Mpg123Initializer {
    Mpg123Initializer() { mpg123_init(); }
    ~Mpg123Initializer() { mpg123_exit(); }
};
static Mpg123Initializer g_mpg123_init;

std::optional<BasicTags> MetadataParser::read_basic_tags(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    BasicTags tags;
    bool parsed = false;
    switch (detect_format(path)) {
        case AudioFormat::MP3:
            parsed = parse_mp3(path, tags);
            break;
        case AudioFormat::FLAC:
        case AudioFormat::OGG:
        case AudioFormat::WAV:
            parsed = parse_sndfile(path, tags);
            break;
        case AudioFormat::M4A:
        case AudioFormat::WMA:
        case AudioFormat::APE:
            parsed = parse_avformat(path, tags);
            break;
        case AudioFormat::Unknown:
            break;
    }

    if (!parsed) {
        util::Logger::debug("MetadataParser: Could not parse " + path);
        return std::nullopt;
    }
    return tags;
}

bool MetadataParser::parse_mp3(const std::string& path, BasicTags& tags) {
    mpg123_handle* mh = mpg123_new(nullptr, nullptr);
    if (!mh) return false;

    mpg123_param(mh, MPG123_ADD_FLAGS, MPG123_QUIET, 0);

    if (mpg123_open(mh, path.c_str()) != MPG123_OK) {
        mpg123_delete(mh);
        return false;
    }

    // Reading the format parses the leading ID3v2 tag along with the first frame
    long rate;
    int channels, encoding;
    if (mpg123_getformat(mh, &rate, &channels, &encoding) != MPG123_OK) {
        mpg123_close(mh);
        mpg123_delete(mh);
        return false;
    }

    // ID3v1 sits at the end of the stream and is only seen after a scan
    if ((mpg123_meta_check(mh) & MPG123_ID3) == 0) {
        mpg123_scan(mh);
    }

    mpg123_id3v1* v1 = nullptr;
    mpg123_id3v2* v2 = nullptr;
    if (mpg123_id3(mh, &v1, &v2) == MPG123_OK) {
        if (v2) {
            if (v2->title && v2->title->p) tags.title = trim(v2->title->p);
            if (v2->artist && v2->artist->p) tags.artist = trim(v2->artist->p);
            if (v2->album && v2->album->p) tags.album = trim(v2->album->p);
        }
        if (v1) {
            if (tags.title.empty()) tags.title = fixed_field(v1->title, sizeof(v1->title));
            if (tags.artist.empty()) tags.artist = fixed_field(v1->artist, sizeof(v1->artist));
            if (tags.album.empty()) tags.album = fixed_field(v1->album, sizeof(v1->album));
        }
    }

    mpg123_close(mh);
    mpg123_delete(mh);
    return true;
}

bool MetadataParser::parse_sndfile(const std::string& path, BasicTags& tags) {
    SF_INFO sfinfo;
    std::memset(&sfinfo, 0, sizeof(sfinfo));

    SNDFILE* sndfile = sf_open(path.c_str(), SFM_READ, &sfinfo);
    if (!sndfile) return false;

    auto get_tag = [&](int tag_id) -> std::string {
        const char* val = sf_get_string(sndfile, tag_id);
        return val ? trim(val) : "";
    };

    tags.title = get_tag(SF_STR_TITLE);
    tags.artist = get_tag(SF_STR_ARTIST);
    tags.album = get_tag(SF_STR_ALBUM);

    sf_close(sndfile);
    return true;
}

bool MetadataParser::parse_avformat(const std::string& path, BasicTags& tags) {
    AVFormatContext* format_ctx = nullptr;
    int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        char errbuf[256];
        av_strerror(ret, errbuf, sizeof(errbuf));
        util::Logger::debug("MetadataParser: avformat cannot open " + path + " (" + errbuf + ")");
        return false;
    }

    auto get_tag = [&](const char* key) -> std::string {
        const AVDictionaryEntry* entry = av_dict_get(format_ctx->metadata, key, nullptr, 0);
        return (entry && entry->value) ? trim(entry->value) : "";
    };

    tags.title = get_tag("title");
    tags.artist = get_tag("artist");
    tags.album = get_tag("album");

    avformat_close_input(&format_ctx);
    return true;
}

AudioFormat MetadataParser::detect_format(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    if (ext == ".mp3") return AudioFormat::MP3;
    if (ext == ".flac") return AudioFormat::FLAC;
    if (ext == ".ogg") return AudioFormat::OGG;
    if (ext == ".wav") return AudioFormat::WAV;
    if (ext == ".m4a" || ext == ".mp4") return AudioFormat::M4A;
    if (ext == ".wma") return AudioFormat::WMA;
    if (ext == ".ape") return AudioFormat::APE;

    return AudioFormat::Unknown;
}

}  // namespace lyricflow::backend
