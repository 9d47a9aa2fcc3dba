#pragma once

#include "model/Track.hpp"
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace lyricflow::core {

/**
 * AlbumCoverCache: the first cover resolved for an album directory is reused
 * by every sibling in the same pass.
 *
 * The first caller for a directory becomes its owner and runs the fetch
 * outside the lock; concurrent siblings block on a shared_future and receive
 * the same bytes. An absent result or a failed fetch settles nothing: the
 * entry is dropped and the next caller runs its own fetch. Owned by one
 * engine run.
 */
class AlbumCoverCache {
public:
    using Cover = std::optional<model::Bytes>;
    using Fetch = std::function<Cover()>;

    struct Lookup {
        Cover cover;
        bool fetched_here = false;  // This caller performed the network fetch
    };

    // Returns the directory's cover. Runs fetch when no cover is settled and
    // no fetch is in flight, or when the in-flight fetch came back absent.
    // If fetch throws, the entry is dropped and the exception is rethrown.
    Lookup get_or_fetch(const std::string& album_dir, const Fetch& fetch);

    // Settled cover for the directory, nullopt while unknown or in flight
    std::optional<model::Bytes> peek(const std::string& album_dir) const;

    size_t size() const;
    void clear();

private:
    void drop(const std::string& album_dir);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<Cover>> entries_;
};

}  // namespace lyricflow::core
