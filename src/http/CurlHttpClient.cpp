#include "http/CurlHttpClient.hpp"
#include "util/curlWrappers.hpp"
#include "logging/LogRegistry.hpp"

#include <memory>
#include <mutex>

using namespace fdrop::http;
using namespace fdrop::logging;

namespace fdrop::util {

/** Ensure curl global init runs exactly once in process */
void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* buf = static_cast<std::string*>(userdata);
    buf->append(ptr, size * nmemb);
    return size * nmemb;
}

}

CurlHttpClient::CurlHttpClient() { util::ensureCurlGlobalInit(); }

Response CurlHttpClient::perform(const Request& request) {
    SList hdrs;
    for (const auto& h : request.headers) hdrs.add(h);

    std::unique_ptr<CurlMime> mime;

    const auto res = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        if (hdrs.get()) curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        if (request.timeoutSeconds > 0) curl_easy_setopt(h, CURLOPT_TIMEOUT, request.timeoutSeconds);

        if (!request.form.empty()) {
            mime = std::make_unique<CurlMime>(h);
            for (const auto& f : request.form) mime->addPart(f.name, f.data, f.filename, f.contentType);
            curl_easy_setopt(h, CURLOPT_MIMEPOST, mime->get());
        } else if (request.method != "GET") {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }

        if (request.method != "GET" && request.method != "POST")
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    });

    Response resp;
    resp.status = res.http;
    resp.body = res.body;

    if (res.curl != CURLE_OK) {
        resp.error = curl_easy_strerror(res.curl);
        LogRegistry::http()->warn("[CurlHttpClient] {} {} failed: {}", request.method, request.url, resp.error);
    } else if (!res.ok()) {
        LogRegistry::http()->warn("[CurlHttpClient] {} {} returned HTTP {}", request.method, request.url, res.http);
    } else {
        LogRegistry::http()->debug("[CurlHttpClient] {} {} -> HTTP {} ({} bytes)",
                                   request.method, request.url, res.http, res.body.size());
    }

    return resp;
}
