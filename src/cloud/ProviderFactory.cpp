#include "cloud/ProviderFactory.hpp"
#include "cloud/AnonymousHostProvider.hpp"
#include "cloud/DriveProvider.hpp"

#include <stdexcept>

using namespace fdrop::cloud;
using namespace fdrop::types;

DefaultProviderFactory::DefaultProviderFactory(std::shared_ptr<http::HttpClient> client,
                                               std::shared_ptr<auth::CredentialStore> credentials,
                                               config::AnonymousHostConfig anonymousHost,
                                               config::CloudStoreConfig cloudStore)
    : client_(std::move(client)),
      credentials_(std::move(credentials)),
      anonymousHost_(std::move(anonymousHost)),
      cloudStore_(std::move(cloudStore)) {}

std::shared_ptr<Provider> DefaultProviderFactory::create(const ProviderKind kind) const {
    switch (kind) {
        case ProviderKind::AnonymousHost:
            return std::make_shared<AnonymousHostProvider>(client_, anonymousHost_);
        case ProviderKind::CredentialedCloudStore:
            return std::make_shared<DriveProvider>(client_, credentials_, cloudStore_);
    }
    throw std::invalid_argument("Unknown ProviderKind enum value");
}
