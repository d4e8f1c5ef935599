#pragma once

#include "types/ProviderKind.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fdrop::cloud {

// A backend that stores bytes and hands back a shareable URL.
//
// upload() throws types::UploadError on every non-success outcome. Calls are
// independent of each other and touch nothing but the network.
class Provider {
public:
    virtual ~Provider() = default;

    [[nodiscard]] virtual types::ProviderKind kind() const = 0;
    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual std::string upload(const std::vector<uint8_t>& bytes, const std::string& filename) const = 0;
};

}
