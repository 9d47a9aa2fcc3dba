#include "backend/TagEditor.hpp"
#include "util/ContentHasher.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <filesystem>

#include <taglib/attachedpictureframe.h>
#include <taglib/flacfile.h>
#include <taglib/flacpicture.h>
#include <taglib/id3v2tag.h>
#include <taglib/mp4coverart.h>
#include <taglib/mp4file.h>
#include <taglib/mp4item.h>
#include <taglib/mp4tag.h>
#include <taglib/mpegfile.h>
#include <taglib/tag.h>
#include <taglib/unsynchronizedlyricsframe.h>
#include <taglib/vorbisfile.h>
#include <taglib/xiphcomment.h>

namespace lyricflow::backend {

namespace {
    const char* const MP4_LYRICS_ATOM = "\251lyr";

    TagLib::String utf8(const std::string& value) {
        return TagLib::String(value, TagLib::String::UTF8);
    }

    TagLib::ByteVector to_byte_vector(const model::Bytes& data) {
        return TagLib::ByteVector(reinterpret_cast<const char*>(data.data()),
                                  static_cast<unsigned int>(data.size()));
    }

    TagLib::FLAC::Picture* make_flac_picture(const model::Bytes& data) {
        auto* pic = new TagLib::FLAC::Picture();
        pic->setType(TagLib::FLAC::Picture::FrontCover);
        pic->setMimeType(utf8(util::ContentHasher::detect_image_mime(data)));
        pic->setDescription("Cover");
        pic->setData(to_byte_vector(data));
        return pic;
    }

    void apply_basic(TagLib::Tag* tag, const TagUpdate& update) {
        if (!tag) return;
        if (update.artist) tag->setArtist(utf8(*update.artist));
        if (update.title) tag->setTitle(utf8(*update.title));
        if (update.album) tag->setAlbum(utf8(*update.album));
    }
}

TagEditor::Container TagEditor::container_for(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    if (ext == ".mp3") return Container::MP3;
    if (ext == ".flac") return Container::FLAC;
    if (ext == ".m4a" || ext == ".mp4") return Container::M4A;
    if (ext == ".ogg") return Container::OGG;
    return Container::None;
}

bool TagEditor::is_embeddable(const std::string& path) {
    return container_for(path) != Container::None;
}

bool TagEditor::has_embedded_lyrics(const std::string& path) {
    switch (container_for(path)) {
        case Container::MP3: {
            TagLib::MPEG::File file(path.c_str());
            if (!file.isValid()) return false;
            auto* id3v2 = file.ID3v2Tag();
            return id3v2 && !id3v2->frameList("USLT").isEmpty();
        }
        case Container::FLAC: {
            TagLib::FLAC::File file(path.c_str());
            if (!file.isValid()) return false;
            auto* xiph = file.xiphComment();
            return xiph && xiph->contains("LYRICS");
        }
        case Container::M4A: {
            TagLib::MP4::File file(path.c_str());
            if (!file.isValid() || !file.tag()) return false;
            return file.tag()->contains(MP4_LYRICS_ATOM);
        }
        case Container::OGG: {
            TagLib::Ogg::Vorbis::File file(path.c_str());
            if (!file.isValid() || !file.tag()) return false;
            return file.tag()->contains("LYRICS");
        }
        case Container::None:
            break;
    }
    return false;
}

bool TagEditor::has_embedded_cover(const std::string& path) {
    switch (container_for(path)) {
        case Container::MP3: {
            TagLib::MPEG::File file(path.c_str());
            if (!file.isValid()) return false;
            auto* id3v2 = file.ID3v2Tag();
            return id3v2 && !id3v2->frameList("APIC").isEmpty();
        }
        case Container::FLAC: {
            TagLib::FLAC::File file(path.c_str());
            return file.isValid() && !file.pictureList().isEmpty();
        }
        case Container::M4A: {
            TagLib::MP4::File file(path.c_str());
            if (!file.isValid() || !file.tag() || !file.tag()->contains("covr")) return false;
            return !file.tag()->item("covr").toCoverArtList().isEmpty();
        }
        case Container::OGG: {
            TagLib::Ogg::Vorbis::File file(path.c_str());
            if (!file.isValid() || !file.tag()) return false;
            return !file.tag()->pictureList().isEmpty();
        }
        case Container::None:
            break;
    }
    return false;
}

bool TagEditor::write(const std::string& path, const TagUpdate& update) {
    if (update.empty()) return true;

    switch (container_for(path)) {
        case Container::MP3: {
            TagLib::MPEG::File file(path.c_str());
            if (!file.isValid()) break;
            auto* id3v2 = file.ID3v2Tag(true);
            if (!id3v2) break;

            if (update.lyrics) {
                id3v2->removeFrames("USLT");
                auto* frame = new TagLib::ID3v2::UnsynchronizedLyricsFrame(TagLib::String::UTF8);
                frame->setLanguage("xxx");
                frame->setText(utf8(*update.lyrics));
                id3v2->addFrame(frame);
            }
            if (update.cover) {
                id3v2->removeFrames("APIC");
                auto* frame = new TagLib::ID3v2::AttachedPictureFrame();
                frame->setTextEncoding(TagLib::String::UTF8);
                frame->setMimeType(utf8(util::ContentHasher::detect_image_mime(*update.cover)));
                frame->setType(TagLib::ID3v2::AttachedPictureFrame::FrontCover);
                frame->setDescription("Cover");
                frame->setPicture(to_byte_vector(*update.cover));
                id3v2->addFrame(frame);
            }
            apply_basic(id3v2, update);
            return file.save();
        }
        case Container::FLAC: {
            TagLib::FLAC::File file(path.c_str());
            if (!file.isValid()) break;

            if (update.lyrics) {
                file.xiphComment(true)->addField("LYRICS", utf8(*update.lyrics), true);
            }
            if (update.cover) {
                file.removePictures();
                file.addPicture(make_flac_picture(*update.cover));
            }
            apply_basic(file.xiphComment(true), update);
            return file.save();
        }
        case Container::M4A: {
            TagLib::MP4::File file(path.c_str());
            if (!file.isValid() || !file.tag()) break;
            auto* tag = file.tag();

            if (update.lyrics) {
                tag->setItem(MP4_LYRICS_ATOM, TagLib::MP4::Item(TagLib::StringList(utf8(*update.lyrics))));
            }
            if (update.cover) {
                auto format = util::ContentHasher::detect_image_mime(*update.cover) == "image/png"
                    ? TagLib::MP4::CoverArt::PNG
                    : TagLib::MP4::CoverArt::JPEG;
                TagLib::MP4::CoverArtList covers;
                covers.append(TagLib::MP4::CoverArt(format, to_byte_vector(*update.cover)));
                tag->setItem("covr", TagLib::MP4::Item(covers));
            }
            apply_basic(tag, update);
            return file.save();
        }
        case Container::OGG: {
            TagLib::Ogg::Vorbis::File file(path.c_str());
            if (!file.isValid() || !file.tag()) break;
            auto* xiph = file.tag();

            if (update.lyrics) {
                xiph->addField("LYRICS", utf8(*update.lyrics), true);
            }
            if (update.cover) {
                // Stored as METADATA_BLOCK_PICTURE
                xiph->removeAllPictures();
                xiph->addPicture(make_flac_picture(*update.cover));
            }
            apply_basic(xiph, update);
            return file.save();
        }
        case Container::None:
            util::Logger::debug("TagEditor: No embedder for " + path);
            return false;
    }

    util::Logger::error("TagEditor: Cannot open for tag writing: " + path);
    return false;
}

}  // namespace lyricflow::backend
