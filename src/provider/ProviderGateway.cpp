#include "provider/ProviderGateway.hpp"

namespace lyricflow::provider {

bool looks_like_image(const std::string& content_type, size_t body_size) {
    return content_type.find("image") != std::string::npos || body_size > 1000;
}

}  // namespace lyricflow::provider
