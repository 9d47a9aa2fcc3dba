#pragma once

#include "backend/Config.hpp"
#include "net/HttpClient.hpp"
#include "provider/ProviderGateway.hpp"
#include <memory>

namespace lyricflow::provider {

// Builds the provider selected by cfg.provider. The transport must outlive it.
std::unique_ptr<ProviderGateway> make_provider(const backend::Config& cfg, net::HttpTransport& http);

// Transport options derived from the [network] settings
net::HttpOptions http_options_from(const backend::Config& cfg);

}  // namespace lyricflow::provider
