#include "core/AlbumCoverCache.hpp"
#include "util/Logger.hpp"
#include <chrono>

namespace lyricflow::core {

AlbumCoverCache::Lookup AlbumCoverCache::get_or_fetch(const std::string& album_dir, const Fetch& fetch) {
    while (true) {
        std::promise<Cover> promise;
        std::shared_future<Cover> future;
        bool owner = false;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(album_dir);
            if (it != entries_.end()) {
                future = it->second;
            } else {
                future = promise.get_future().share();
                entries_.emplace(album_dir, future);
                owner = true;
            }
        }

        if (!owner) {
            Cover shared = future.get();
            if (shared) {
                util::Logger::debug("CoverCache: Reusing cover for " + album_dir);
                return Lookup{std::move(shared), false};
            }
            // The owner came back empty and dropped the entry; try our own match
            continue;
        }

        Cover cover;
        try {
            cover = fetch();
        } catch (...) {
            drop(album_dir);
            promise.set_value(std::nullopt);
            throw;
        }

        if (!cover) {
            drop(album_dir);
        }
        promise.set_value(cover);
        return Lookup{std::move(cover), true};
    }
}

std::optional<model::Bytes> AlbumCoverCache::peek(const std::string& album_dir) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(album_dir);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (it->second.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return std::nullopt;
    }
    return it->second.get();
}

size_t AlbumCoverCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void AlbumCoverCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

void AlbumCoverCache::drop(const std::string& album_dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(album_dir);
}

}  // namespace lyricflow::core
