#include "provider/ProviderFactory.hpp"
#include "provider/LrcApiProvider.hpp"
#include "provider/TuneHubProvider.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace lyricflow::provider {

std::unique_ptr<ProviderGateway> make_provider(const backend::Config& cfg, net::HttpTransport& http) {
    switch (cfg.provider) {
        case backend::ProviderKind::TuneHub:
            util::Logger::info("Provider: TuneHub at " + cfg.api_base_url);
            return std::make_unique<TuneHubProvider>(http, cfg.api_base_url, cfg.platforms);
        case backend::ProviderKind::LrcApi:
            util::Logger::info("Provider: LrcApi at " + cfg.lrcapi_url);
            return std::make_unique<LrcApiProvider>(http, cfg.lrcapi_url, cfg.lrcapi_auth);
    }
    throw backend::ConfigError("Unsupported provider");
}

net::HttpOptions http_options_from(const backend::Config& cfg) {
    net::HttpOptions options;
    options.timeout = std::chrono::seconds(cfg.request_timeout_seconds);
    options.connect_timeout = std::min(options.timeout, std::chrono::seconds(10));
    options.max_retries = cfg.max_retries;
    return options;
}

}  // namespace lyricflow::provider
