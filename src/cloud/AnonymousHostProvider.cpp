#include "cloud/AnonymousHostProvider.hpp"
#include "http/HttpClient.hpp"
#include "types/UploadError.hpp"
#include "util/encoding.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/format.h>

using namespace fdrop::cloud;
using namespace fdrop::types;
using namespace fdrop::logging;

AnonymousHostProvider::AnonymousHostProvider(std::shared_ptr<http::HttpClient> client, config::AnonymousHostConfig cfg)
    : client_(std::move(client)), cfg_(std::move(cfg)) {
    if (!client_) throw std::invalid_argument("AnonymousHostProvider requires an HTTP client");
}

std::string AnonymousHostProvider::name() const {
    auto host = cfg_.endpoint;
    if (const auto scheme = host.find("://"); scheme != std::string::npos) host.erase(0, scheme + 3);
    while (!host.empty() && host.back() == '/') host.pop_back();
    return host;
}

std::string AnonymousHostProvider::upload(const std::vector<uint8_t>& bytes, const std::string& filename) const {
    http::Request req;
    req.method = "POST";
    req.url = cfg_.endpoint;
    req.headers.push_back("User-Agent: " + cfg_.user_agent);
    req.form.push_back({cfg_.form_field, std::string(bytes.begin(), bytes.end()), filename, "application/octet-stream"});
    req.timeoutSeconds = cfg_.timeout_seconds;

    const auto resp = client_->perform(req);

    if (!resp.error.empty())
        throw UploadError(UploadError::Kind::Network,
                          fmt::format("Upload to {} failed: {}", name(), resp.error));

    if (!resp.ok())
        throw UploadError(UploadError::Kind::Network,
                          fmt::format("Upload to {} failed: HTTP {} - {}", name(), resp.status, resp.body));

    auto url = resp.body;
    util::trimInPlace(url);
    if (url.empty())
        LogRegistry::cloud()->warn("[AnonymousHostProvider] {} accepted {} but returned no link", name(), filename);

    LogRegistry::cloud()->debug("[AnonymousHostProvider] {} -> {}", filename, url);
    return url;
}
