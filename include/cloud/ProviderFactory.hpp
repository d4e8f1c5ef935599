#pragma once

#include "config/Config.hpp"
#include "types/ProviderKind.hpp"

#include <memory>

namespace fdrop::http { class HttpClient; }
namespace fdrop::auth { class CredentialStore; }

namespace fdrop::cloud {

class Provider;

class ProviderFactory {
public:
    virtual ~ProviderFactory() = default;

    [[nodiscard]] virtual std::shared_ptr<Provider> create(types::ProviderKind kind) const = 0;
};

// Builds the closed set of real providers over a shared HTTP client.
class DefaultProviderFactory final : public ProviderFactory {
public:
    DefaultProviderFactory(std::shared_ptr<http::HttpClient> client,
                           std::shared_ptr<auth::CredentialStore> credentials,
                           config::AnonymousHostConfig anonymousHost,
                           config::CloudStoreConfig cloudStore);

    [[nodiscard]] std::shared_ptr<Provider> create(types::ProviderKind kind) const override;

private:
    std::shared_ptr<http::HttpClient> client_;
    std::shared_ptr<auth::CredentialStore> credentials_;
    config::AnonymousHostConfig anonymousHost_;
    config::CloudStoreConfig cloudStore_;
};

}
