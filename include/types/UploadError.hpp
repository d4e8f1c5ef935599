#pragma once

#include <stdexcept>
#include <string>

namespace fdrop::types {

class UploadError : public std::runtime_error {
public:
    enum class Kind {
        Configuration,  // missing or invalid credentials, raised before any network call
        Network,        // non-success HTTP/API response, including partial multi-step failure
        Unknown         // unexpected failure wrapped with context
    };

    UploadError(Kind kind, const std::string& detail);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    // "<Kind> error: <detail>"
    [[nodiscard]] std::string describe() const;

private:
    Kind kind_;
};

std::string to_string(UploadError::Kind kind);

std::string describe(UploadError::Kind kind, const std::string& detail);

}
