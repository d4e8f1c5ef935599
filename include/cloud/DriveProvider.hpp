#pragma once

#include "cloud/Provider.hpp"
#include "config/Config.hpp"

#include <memory>

namespace fdrop::http { class HttpClient; }
namespace fdrop::auth { class CredentialStore; }

namespace fdrop::cloud {

// Credentialed cloud store (Google Drive v3).
//
// An upload is two separate calls: create the object, then grant "anyone"
// read access. The pair is not transactional; when the grant fails the object
// stays created but private and the upload reports a Network error.
class DriveProvider final : public Provider {
public:
    DriveProvider(std::shared_ptr<http::HttpClient> client,
                  std::shared_ptr<auth::CredentialStore> credentials,
                  config::CloudStoreConfig cfg);

    [[nodiscard]] types::ProviderKind kind() const override { return types::ProviderKind::CredentialedCloudStore; }
    [[nodiscard]] std::string name() const override { return "Google Drive"; }

    [[nodiscard]] std::string upload(const std::vector<uint8_t>& bytes, const std::string& filename) const override;

private:
    std::shared_ptr<http::HttpClient> client_;
    std::shared_ptr<auth::CredentialStore> credentials_;
    config::CloudStoreConfig cfg_;

    [[nodiscard]] std::string createObject(const std::vector<std::string>& authHeaders,
                                           const std::vector<uint8_t>& bytes,
                                           const std::string& filename) const;

    void grantPublicRead(const std::vector<std::string>& authHeaders, const std::string& fileId) const;
};

}
