#pragma once

#include "http/HttpClient.hpp"

namespace fdrop::http {

class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override = default;

    Response perform(const Request& request) override;
};

}
