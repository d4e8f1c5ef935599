#pragma once

#include "cloud/Provider.hpp"
#include "config/Config.hpp"

#include <memory>

namespace fdrop::http { class HttpClient; }

namespace fdrop::cloud {

// Anonymous file host (0x0.st style): one multipart POST, the trimmed response body is the URL.
class AnonymousHostProvider final : public Provider {
public:
    AnonymousHostProvider(std::shared_ptr<http::HttpClient> client, config::AnonymousHostConfig cfg);

    [[nodiscard]] types::ProviderKind kind() const override { return types::ProviderKind::AnonymousHost; }
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] std::string upload(const std::vector<uint8_t>& bytes, const std::string& filename) const override;

private:
    std::shared_ptr<http::HttpClient> client_;
    config::AnonymousHostConfig cfg_;
};

}
