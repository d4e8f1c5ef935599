#include "cloud/DriveProvider.hpp"
#include "auth/CredentialStore.hpp"
#include "http/HttpClient.hpp"
#include "types/UploadError.hpp"
#include "util/encoding.hpp"
#include "logging/LogRegistry.hpp"

#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace fdrop::cloud;
using namespace fdrop::types;
using namespace fdrop::logging;

namespace {

// OAuth2 client identity derived from the stored credentials, attached to every call.
class AuthContext {
public:
    AuthContext(const Credentials& credentials, std::string redirectUri)
        : credentials_(credentials), redirectUri_(std::move(redirectUri)) {}

    [[nodiscard]] std::vector<std::string> headers() const {
        const auto basic = fdrop::util::b64_encode(credentials_.clientId + ":" + credentials_.clientSecret);
        return {"Authorization: Basic " + basic, "X-OAuth-Redirect-Uri: " + redirectUri_};
    }

private:
    Credentials credentials_;
    std::string redirectUri_;
};

[[noreturn]] void throwNetwork(const std::string& detail) {
    throw UploadError(UploadError::Kind::Network, "Google Drive upload failed: " + detail);
}

std::string describeFailure(const fdrop::http::Response& resp) {
    if (!resp.error.empty()) return resp.error;
    return fmt::format("HTTP {} - {}", resp.status, resp.body);
}

std::string makeBoundary() {
    static thread_local boost::uuids::random_generator gen;
    return "fastdrop-" + boost::uuids::to_string(gen());
}

}

DriveProvider::DriveProvider(std::shared_ptr<http::HttpClient> client,
                             std::shared_ptr<auth::CredentialStore> credentials,
                             config::CloudStoreConfig cfg)
    : client_(std::move(client)), credentials_(std::move(credentials)), cfg_(std::move(cfg)) {
    if (!client_) throw std::invalid_argument("DriveProvider requires an HTTP client");
    if (!credentials_) throw std::invalid_argument("DriveProvider requires a credential store");
}

std::string DriveProvider::upload(const std::vector<uint8_t>& bytes, const std::string& filename) const {
    const auto credentials = credentials_->resolve();
    if (!credentials)
        throw UploadError(UploadError::Kind::Configuration,
                          "Google Drive credentials not configured. Please configure them in the settings.");

    const AuthContext auth(*credentials, cfg_.redirect_uri);
    const auto authHeaders = auth.headers();

    const auto fileId = createObject(authHeaders, bytes, filename);
    grantPublicRead(authHeaders, fileId);

    return cfg_.view_url_prefix + fileId + "/view";
}

std::string DriveProvider::createObject(const std::vector<std::string>& authHeaders,
                                        const std::vector<uint8_t>& bytes,
                                        const std::string& filename) const {
    nlohmann::json metadata = {{"name", filename}};
    if (!cfg_.parent_folder.empty()) metadata["parents"] = nlohmann::json::array({cfg_.parent_folder});

    const auto boundary = makeBoundary();

    std::string body;
    body.reserve(bytes.size() + 512);
    body += "--" + boundary + "\r\n";
    body += "Content-Type: application/json; charset=UTF-8\r\n\r\n";
    body += metadata.dump() + "\r\n";
    body += "--" + boundary + "\r\n";
    body += "Content-Type: application/octet-stream\r\n\r\n";
    body.append(bytes.begin(), bytes.end());
    body += "\r\n--" + boundary + "--\r\n";

    http::Request req;
    req.method = "POST";
    req.url = cfg_.upload_endpoint;
    req.headers = authHeaders;
    req.headers.push_back("Content-Type: multipart/related; boundary=" + boundary);
    req.body = std::move(body);
    req.timeoutSeconds = cfg_.timeout_seconds;

    const auto resp = client_->perform(req);
    if (!resp.ok()) {
        LogRegistry::cloud()->error("[DriveProvider] Creating {} failed: {}", filename, describeFailure(resp));
        throwNetwork(describeFailure(resp));
    }

    const auto j = nlohmann::json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        throwNetwork("unexpected response while creating file: " + resp.body);

    const auto id = j.find("id");
    if (id == j.end() || !id->is_string() || id->get<std::string>().empty())
        throwNetwork("Failed to upload file to Google Drive (response carried no file id)");

    return id->get<std::string>();
}

void DriveProvider::grantPublicRead(const std::vector<std::string>& authHeaders, const std::string& fileId) const {
    http::Request req;
    req.method = "POST";
    req.url = fmt::format("{}/{}/permissions", cfg_.files_endpoint, fileId);
    req.headers = authHeaders;
    req.headers.push_back("Content-Type: application/json");
    req.body = nlohmann::json{{"role", "reader"}, {"type", "anyone"}}.dump();
    req.timeoutSeconds = cfg_.timeout_seconds;

    const auto resp = client_->perform(req);
    if (!resp.ok()) {
        LogRegistry::cloud()->error("[DriveProvider] File {} created but granting public access failed: {}",
                                    fileId, describeFailure(resp));
        throwNetwork(fmt::format("file {} was created but could not be shared: {}", fileId, describeFailure(resp)));
    }
}
