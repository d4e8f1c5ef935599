#pragma once

#include <string>
#include <vector>

namespace fdrop::http {

struct FormField {
    std::string name;
    std::string data;
    std::string filename;
    std::string contentType;
};

struct Request {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;   // "Name: value"
    std::string body;
    std::vector<FormField> form;        // non-empty: sent as multipart/form-data, body ignored
    long timeoutSeconds = 0;            // 0: no limit
};

struct Response {
    long status = 0;
    std::string body;
    std::string error;                  // set when the transfer itself failed

    [[nodiscard]] bool ok() const { return error.empty() && status / 100 == 2; }
};

// Transport seam for providers. Implementations must be safe to call from
// several upload workers at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Response perform(const Request& request) = 0;
};

}
