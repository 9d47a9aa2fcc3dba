#include "scanner/PathClassifier.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>

namespace lyricflow::scanner {

namespace fs = std::filesystem;

std::string PathClassifier::lowercase_extension(std::string_view filename) {
    auto dot = filename.rfind('.');
    if (dot == std::string_view::npos || dot == 0) return "";
    std::string ext(filename.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::optional<model::TrackKind> PathClassifier::kind_for_filename(std::string_view filename) {
    std::string ext = lowercase_extension(filename);
    if (ext.empty()) return std::nullopt;
    if (ext == STRM_EXTENSION) return model::TrackKind::StrmFile;
    for (const auto& ae : AUDIO_EXTENSIONS) {
        if (ae == ext) return model::TrackKind::AudioFile;
    }
    return std::nullopt;
}

bool PathClassifier::is_excluded_filename(std::string_view filename) {
    if (filename.empty() || filename.front() == '.') return true;  // Hidden and AppleDouble files
    std::string lower(filename);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "cover.jpg" || lowercase_extension(lower) == ".lrc";
}

std::vector<std::string> PathClassifier::folder_chain(const fs::path& entry, const fs::path& library_root) {
    std::vector<std::string> chain;
    fs::path relative = entry.parent_path().lexically_relative(library_root);
    if (relative.empty()) {
        return chain;
    }
    for (const auto& part : relative) {
        std::string name = part.string();
        if (name == "..") {
            // Outside the root: no folder structure to infer from
            return {};
        }
        if (name.empty() || name == ".") continue;
        chain.push_back(std::move(name));
    }
    return chain;
}

std::optional<model::TrackCandidate> PathClassifier::classify(const fs::path& entry, const fs::path& library_root) {
    std::string filename = entry.filename().string();
    if (is_excluded_filename(filename)) {
        return std::nullopt;
    }

    auto kind = kind_for_filename(filename);
    if (!kind) {
        return std::nullopt;
    }

    std::error_code ec;
    auto status = fs::status(entry, ec);
    if (ec) {
        util::Logger::warn("PathClassifier: Cannot stat " + entry.string() + ": " + ec.message());
        return std::nullopt;
    }
    if (!fs::is_regular_file(status)) {
        return std::nullopt;
    }

    model::TrackCandidate candidate;
    candidate.absolute_path = fs::absolute(entry, ec).lexically_normal().string();
    if (ec) {
        candidate.absolute_path = entry.lexically_normal().string();
    }
    candidate.kind = *kind;

    fs::path root = fs::absolute(library_root, ec).lexically_normal();
    if (ec) root = library_root.lexically_normal();
    if (!root.has_filename() && root != root.root_path()) {
        root = root.parent_path();  // "/music/" -> "/music"
    }
    candidate.folder_chain = folder_chain(fs::path(candidate.absolute_path), root);
    candidate.raw_filename_stem = entry.stem().string();
    candidate.extension = lowercase_extension(filename);
    return candidate;
}

}  // namespace lyricflow::scanner
